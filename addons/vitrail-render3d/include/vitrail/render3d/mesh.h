#pragma once

#include <vitrail/render3d/bounds.h>
#include <glm/glm.hpp>
#include <vector>
#include <cstdint>

namespace vitrail::render3d {

/// Vertex format for 3D meshes
struct Vertex3D {
    glm::vec3 position;
    glm::vec3 normal;
    glm::vec2 uv;
    glm::vec4 color;

    Vertex3D() : position(0), normal(0, 1, 0), uv(0), color(1) {}

    Vertex3D(glm::vec3 pos)
        : position(pos), normal(0, 1, 0), uv(0), color(1) {}

    Vertex3D(glm::vec3 pos, glm::vec3 norm)
        : position(pos), normal(norm), uv(0), color(1) {}

    Vertex3D(glm::vec3 pos, glm::vec3 norm, glm::vec2 texcoord)
        : position(pos), normal(norm), uv(texcoord), color(1) {}

    Vertex3D(glm::vec3 pos, glm::vec3 norm, glm::vec2 texcoord, glm::vec4 col)
        : position(pos), normal(norm), uv(texcoord), color(col) {}
};

/// Indexed triangle geometry
///
/// The renderer uploads these arrays to its own buffers; dispose() is the
/// signal that the geometry is dead and any uploaded copy can be dropped.
class Mesh {
public:
    std::vector<Vertex3D> vertices;
    std::vector<uint32_t> indices;

    Mesh() = default;
    ~Mesh() = default;

    Mesh(const Mesh&) = delete;
    Mesh& operator=(const Mesh&) = delete;

    Mesh(Mesh&& other) noexcept;
    Mesh& operator=(Mesh&& other) noexcept;

    /// Deep copy of the vertex and index data
    Mesh clone() const;

    /// Bake a transform into positions and normals
    void applyMatrix(const glm::mat4& m);

    /// Release vertex data and mark as disposed (safe to call repeatedly)
    void dispose();

    /// True once dispose() has run
    bool disposed() const { return m_disposed; }

    /// Bounds of the vertex positions in local space
    Box3 bounds() const;

    /// Get index count for draw calls
    uint32_t indexCount() const { return static_cast<uint32_t>(indices.size()); }

    /// Get vertex count
    uint32_t vertexCount() const { return static_cast<uint32_t>(vertices.size()); }

    /// Number of whole triangles described by the index list
    uint32_t triangleCount() const { return indexCount() / 3; }

private:
    bool m_disposed = false;
};

} // namespace vitrail::render3d
