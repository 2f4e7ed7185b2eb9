#include <vitrail/render3d/mesh.h>
#include <utility>

namespace vitrail::render3d {

Mesh::Mesh(Mesh&& other) noexcept
    : vertices(std::move(other.vertices))
    , indices(std::move(other.indices))
    , m_disposed(other.m_disposed)
{
    other.m_disposed = true;
}

Mesh& Mesh::operator=(Mesh&& other) noexcept {
    if (this != &other) {
        vertices = std::move(other.vertices);
        indices = std::move(other.indices);
        m_disposed = other.m_disposed;
        other.m_disposed = true;
    }
    return *this;
}

Mesh Mesh::clone() const {
    Mesh copy;
    copy.vertices = vertices;
    copy.indices = indices;
    return copy;
}

void Mesh::applyMatrix(const glm::mat4& m) {
    glm::mat3 normalMatrix = glm::transpose(glm::inverse(glm::mat3(m)));

    for (auto& v : vertices) {
        v.position = glm::vec3(m * glm::vec4(v.position, 1.0f));
        glm::vec3 n = normalMatrix * v.normal;
        float len = glm::length(n);
        if (len > 1e-8f) {
            v.normal = n / len;
        }
    }
}

void Mesh::dispose() {
    if (m_disposed) return;

    // swap-with-empty actually frees the storage
    std::vector<Vertex3D>().swap(vertices);
    std::vector<uint32_t>().swap(indices);
    m_disposed = true;
}

Box3 Mesh::bounds() const {
    Box3 box;
    for (const auto& v : vertices) {
        box.expandByPoint(v.position);
    }
    return box;
}

} // namespace vitrail::render3d
