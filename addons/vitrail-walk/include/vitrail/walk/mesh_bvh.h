#pragma once

/**
 * @file mesh_bvh.h
 * @brief Bounding volume hierarchy over a triangle mesh
 *
 * Built once over world-space geometry, then queried with shapecast(): the
 * caller decides which node boxes are worth descending into and what to do
 * with each candidate triangle.
 *
 * @par Example
 * @code
 * MeshBVH bvh(worldMesh);
 * bvh.shapecast(
 *     [&](const Box3& box) { return box.distanceToPoint(p) < radius; },
 *     [&](const Triangle& tri, uint32_t) {
 *         return glm::distance(tri.closestPointToPoint(p), p) < radius;
 *     });
 * @endcode
 */

#include <vitrail/walk/geometry.h>
#include <vitrail/render3d/bounds.h>
#include <vitrail/render3d/mesh.h>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace vitrail::walk {

/// Geometry a hierarchy cannot be built over
class BVHBuildError : public std::runtime_error {
public:
    explicit BVHBuildError(const std::string& what) : std::runtime_error(what) {}
};

class MeshBVH {
public:
    /// Triangles per leaf at most
    static constexpr uint32_t kMaxLeafTriangles = 8;

    /// Return true to descend into a node with these bounds
    using BoundsPredicate = std::function<bool(const render3d::Box3&)>;
    /// Return true to end the query; index is the triangle's position in the source mesh
    using TriangleCallback = std::function<bool(const Triangle&, uint32_t index)>;

    /**
     * @brief Build over an indexed mesh
     * @throws BVHBuildError if the mesh has no triangles, a partial triangle,
     *         an out-of-range index or a non-finite vertex position
     */
    explicit MeshBVH(const render3d::Mesh& mesh);

    /**
     * @brief Visit triangles in nodes accepted by intersectsBounds
     * @return true if intersectsTriangle returned true (traversal stopped there)
     */
    bool shapecast(const BoundsPredicate& intersectsBounds,
                   const TriangleCallback& intersectsTriangle) const;

    const render3d::Box3& bounds() const { return m_nodes.front().bounds; }
    size_t triangleCount() const { return m_triangles.size(); }
    size_t nodeCount() const { return m_nodes.size(); }

    /// Depth of the deepest leaf (a single leaf root has depth 1)
    int depth() const;

private:
    struct Node {
        render3d::Box3 bounds;
        uint32_t first = 0;   ///< Leaf: first entry in m_order; inner: left child index
        uint32_t count = 0;   ///< Leaf: triangle count; inner: 0
        uint32_t right = 0;   ///< Inner: right child index

        bool isLeaf() const { return count > 0; }
    };

    uint32_t build(uint32_t begin, uint32_t end);
    bool visit(uint32_t node, const BoundsPredicate& intersectsBounds,
               const TriangleCallback& intersectsTriangle) const;
    int depthOf(uint32_t node) const;

    std::vector<Triangle> m_triangles;
    std::vector<glm::vec3> m_centroids;
    std::vector<uint32_t> m_order;
    std::vector<Node> m_nodes;
};

} // namespace vitrail::walk
