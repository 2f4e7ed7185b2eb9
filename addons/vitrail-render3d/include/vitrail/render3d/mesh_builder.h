#pragma once

#include <vitrail/render3d/mesh.h>
#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>
#include <vector>
#include <memory>

namespace manifold {
    class Manifold;
}

namespace vitrail::render3d {

/// Builder for constructing meshes procedurally
///
/// MeshBuilder can operate in two modes:
/// 1. Direct vertex mode: Add vertices/faces manually (not manifold-safe)
/// 2. Manifold mode: Closed primitives (box, cylinder, cone) also carry a
///    manifold representation and support CSG operations
class MeshBuilder {
public:
    MeshBuilder();
    ~MeshBuilder();
    MeshBuilder(const MeshBuilder& other);
    MeshBuilder& operator=(const MeshBuilder& other);
    MeshBuilder(MeshBuilder&& other) noexcept;
    MeshBuilder& operator=(MeshBuilder&& other) noexcept;

    // -------------------------------------------------------------------------
    /// @name Vertex Manipulation
    /// @{

    /// Add a vertex with position, normal, and UV
    MeshBuilder& addVertex(glm::vec3 pos, glm::vec3 normal, glm::vec2 uv);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Face Construction
    /// @{

    /// Add a triangle from vertex indices
    MeshBuilder& addTriangle(uint32_t a, uint32_t b, uint32_t c);

    /// Add a quad from vertex indices (splits into 2 triangles)
    MeshBuilder& addQuad(uint32_t a, uint32_t b, uint32_t c, uint32_t d);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Modifiers
    /// @{

    /// Translate all vertices (drops any manifold data; rebuilt on demand)
    MeshBuilder& translate(glm::vec3 offset);

    /// @}
    // -------------------------------------------------------------------------
    /// @name CSG
    /// @{

    /// Difference: cut another solid out of this one
    MeshBuilder& subtract(const MeshBuilder& other);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Build
    /// @{

    /// Build the final mesh
    Mesh build() const;

    /// Get current vertex count
    size_t vertexCount() const { return m_vertices.size(); }

    /// Get current index count
    size_t indexCount() const { return m_indices.size(); }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Primitive Generators
    /// @{

    /// Create a box centered at the origin
    static MeshBuilder box(float w, float h, float d);
    static MeshBuilder box(glm::vec3 size);

    /// Create a (possibly tapered) cylinder along Y, centered at the origin
    static MeshBuilder cylinder(float radiusTop, float radiusBottom, float height,
                                int segments = 16);

    /// Create a cone along Y, centered at the origin, apex at +height/2
    static MeshBuilder cone(float radius, float height, int segments = 16);

    /// Create a plane (XZ plane, Y up)
    static MeshBuilder plane(float width, float depth);

    /// Create a rectangle (XY plane, facing +Z)
    static MeshBuilder rect(float width, float height);

    /// Create a disk (XZ plane, Y up)
    static MeshBuilder circle(float radius, int segments = 32);

    /// @}

    /// Check if this builder has valid manifold data for CSG
    bool isManifold() const { return m_manifold != nullptr; }

private:
    std::vector<Vertex3D> m_vertices;
    std::vector<uint32_t> m_indices;

    // Internal manifold representation for CSG operations
    std::unique_ptr<manifold::Manifold> m_manifold;

    // Area-weighted smooth normals from face data
    MeshBuilder& computeNormals();

    // Sync manifold data to vertices/indices
    void syncFromManifold();

    // Create manifold from current vertices/indices (best effort)
    void syncToManifold();
};

} // namespace vitrail::render3d
