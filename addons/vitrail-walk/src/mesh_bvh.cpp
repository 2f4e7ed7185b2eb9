#include <vitrail/walk/mesh_bvh.h>
#include <algorithm>
#include <cmath>

namespace vitrail::walk {

using render3d::Box3;

namespace {

bool isFinite(const glm::vec3& v) {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

} // anonymous namespace

MeshBVH::MeshBVH(const render3d::Mesh& mesh) {
    const auto& indices = mesh.indices;
    const auto& vertices = mesh.vertices;

    if (indices.empty()) {
        throw BVHBuildError("mesh has no triangles");
    }
    if (indices.size() % 3 != 0) {
        throw BVHBuildError("index count " + std::to_string(indices.size()) +
                            " is not a multiple of 3");
    }

    const size_t triCount = indices.size() / 3;
    m_triangles.reserve(triCount);
    m_centroids.reserve(triCount);
    m_order.reserve(triCount);

    for (size_t i = 0; i < triCount; ++i) {
        uint32_t ia = indices[i * 3];
        uint32_t ib = indices[i * 3 + 1];
        uint32_t ic = indices[i * 3 + 2];
        if (ia >= vertices.size() || ib >= vertices.size() || ic >= vertices.size()) {
            throw BVHBuildError("triangle " + std::to_string(i) + " references vertex out of range");
        }

        Triangle tri(vertices[ia].position, vertices[ib].position, vertices[ic].position);
        if (!isFinite(tri.a) || !isFinite(tri.b) || !isFinite(tri.c)) {
            throw BVHBuildError("triangle " + std::to_string(i) + " has a non-finite position");
        }

        m_triangles.push_back(tri);
        m_centroids.push_back(tri.centroid());
        m_order.push_back(static_cast<uint32_t>(i));
    }

    m_nodes.reserve(triCount * 2 / kMaxLeafTriangles + 1);
    build(0, static_cast<uint32_t>(triCount));
}

uint32_t MeshBVH::build(uint32_t begin, uint32_t end) {
    uint32_t index = static_cast<uint32_t>(m_nodes.size());
    m_nodes.emplace_back();

    Box3 bounds;
    Box3 centroidBounds;
    for (uint32_t i = begin; i < end; ++i) {
        const Triangle& tri = m_triangles[m_order[i]];
        bounds.expandByPoint(tri.a);
        bounds.expandByPoint(tri.b);
        bounds.expandByPoint(tri.c);
        centroidBounds.expandByPoint(m_centroids[m_order[i]]);
    }
    m_nodes[index].bounds = bounds;

    const uint32_t count = end - begin;
    glm::vec3 extent = centroidBounds.size();
    int axis = 0;
    if (extent.y > extent[axis]) axis = 1;
    if (extent.z > extent[axis]) axis = 2;

    // Small sets and stacks of coincident centroids stay leaves
    if (count <= kMaxLeafTriangles || extent[axis] <= 0.0f) {
        m_nodes[index].first = begin;
        m_nodes[index].count = count;
        return index;
    }

    // Median split along the longest centroid axis
    uint32_t mid = begin + count / 2;
    std::nth_element(m_order.begin() + begin, m_order.begin() + mid, m_order.begin() + end,
                     [this, axis](uint32_t l, uint32_t r) {
                         return m_centroids[l][axis] < m_centroids[r][axis];
                     });

    // m_nodes may reallocate during recursion, so only write through the index
    uint32_t left = build(begin, mid);
    uint32_t right = build(mid, end);
    m_nodes[index].first = left;
    m_nodes[index].right = right;
    m_nodes[index].count = 0;
    return index;
}

bool MeshBVH::shapecast(const BoundsPredicate& intersectsBounds,
                        const TriangleCallback& intersectsTriangle) const {
    return visit(0, intersectsBounds, intersectsTriangle);
}

bool MeshBVH::visit(uint32_t nodeIndex, const BoundsPredicate& intersectsBounds,
                    const TriangleCallback& intersectsTriangle) const {
    const Node& node = m_nodes[nodeIndex];
    if (!intersectsBounds(node.bounds)) {
        return false;
    }

    if (node.isLeaf()) {
        for (uint32_t i = node.first; i < node.first + node.count; ++i) {
            uint32_t tri = m_order[i];
            if (intersectsTriangle(m_triangles[tri], tri)) {
                return true;
            }
        }
        return false;
    }

    return visit(node.first, intersectsBounds, intersectsTriangle) ||
           visit(node.right, intersectsBounds, intersectsTriangle);
}

int MeshBVH::depth() const {
    return depthOf(0);
}

int MeshBVH::depthOf(uint32_t nodeIndex) const {
    const Node& node = m_nodes[nodeIndex];
    if (node.isLeaf()) {
        return 1;
    }
    return 1 + std::max(depthOf(node.first), depthOf(node.right));
}

} // namespace vitrail::walk
