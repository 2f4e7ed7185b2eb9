#include <vitrail/render3d/mesh_builder.h>
#include <manifold/manifold.h>
#include <algorithm>
#include <cmath>

namespace vitrail::render3d {

// -----------------------------------------------------------------------------
// Constructors / Assignment
// -----------------------------------------------------------------------------

MeshBuilder::MeshBuilder() = default;

MeshBuilder::~MeshBuilder() = default;

MeshBuilder::MeshBuilder(const MeshBuilder& other)
    : m_vertices(other.m_vertices)
    , m_indices(other.m_indices)
{
    if (other.m_manifold) {
        m_manifold = std::make_unique<manifold::Manifold>(*other.m_manifold);
    }
}

MeshBuilder& MeshBuilder::operator=(const MeshBuilder& other) {
    if (this != &other) {
        m_vertices = other.m_vertices;
        m_indices = other.m_indices;
        if (other.m_manifold) {
            m_manifold = std::make_unique<manifold::Manifold>(*other.m_manifold);
        } else {
            m_manifold.reset();
        }
    }
    return *this;
}

MeshBuilder::MeshBuilder(MeshBuilder&& other) noexcept
    : m_vertices(std::move(other.m_vertices))
    , m_indices(std::move(other.m_indices))
    , m_manifold(std::move(other.m_manifold))
{}

MeshBuilder& MeshBuilder::operator=(MeshBuilder&& other) noexcept {
    if (this != &other) {
        m_vertices = std::move(other.m_vertices);
        m_indices = std::move(other.m_indices);
        m_manifold = std::move(other.m_manifold);
    }
    return *this;
}

// -----------------------------------------------------------------------------
// Manifold conversion
// -----------------------------------------------------------------------------

namespace {

manifold::Manifold toManifold(const std::vector<Vertex3D>& vertices,
                              const std::vector<uint32_t>& indices) {
    if (vertices.empty() || indices.empty()) {
        return manifold::Manifold();
    }

    manifold::MeshGL mesh;
    mesh.numProp = 3;  // Just positions for CSG

    mesh.vertProperties.reserve(vertices.size() * 3);
    for (const auto& v : vertices) {
        mesh.vertProperties.push_back(v.position.x);
        mesh.vertProperties.push_back(v.position.y);
        mesh.vertProperties.push_back(v.position.z);
    }

    mesh.triVerts.reserve(indices.size());
    for (uint32_t idx : indices) {
        mesh.triVerts.push_back(idx);
    }

    // Per-face vertices of our primitives must be welded to form a closed solid
    mesh.Merge();

    return manifold::Manifold(mesh);
}

} // anonymous namespace

void MeshBuilder::syncFromManifold() {
    m_vertices.clear();
    m_indices.clear();

    if (!m_manifold || m_manifold->IsEmpty()) {
        return;
    }

    manifold::MeshGL mesh = m_manifold->GetMeshGL();

    size_t numVerts = mesh.vertProperties.size() / mesh.numProp;
    m_vertices.reserve(numVerts);

    for (size_t i = 0; i < numVerts; ++i) {
        Vertex3D v;
        v.position.x = mesh.vertProperties[i * mesh.numProp + 0];
        v.position.y = mesh.vertProperties[i * mesh.numProp + 1];
        v.position.z = mesh.vertProperties[i * mesh.numProp + 2];
        m_vertices.push_back(v);
    }

    m_indices.reserve(mesh.triVerts.size());
    for (uint32_t idx : mesh.triVerts) {
        m_indices.push_back(idx);
    }

    computeNormals();
}

void MeshBuilder::syncToManifold() {
    if (m_vertices.empty() || m_indices.empty()) {
        m_manifold.reset();
        return;
    }
    m_manifold = std::make_unique<manifold::Manifold>(toManifold(m_vertices, m_indices));
}

// -----------------------------------------------------------------------------
// Vertex Manipulation
// -----------------------------------------------------------------------------

MeshBuilder& MeshBuilder::addVertex(glm::vec3 pos, glm::vec3 normal, glm::vec2 uv) {
    m_vertices.emplace_back(pos, normal, uv);
    return *this;
}

// -----------------------------------------------------------------------------
// Face Construction
// -----------------------------------------------------------------------------

MeshBuilder& MeshBuilder::addTriangle(uint32_t a, uint32_t b, uint32_t c) {
    m_indices.push_back(a);
    m_indices.push_back(b);
    m_indices.push_back(c);
    return *this;
}

MeshBuilder& MeshBuilder::addQuad(uint32_t a, uint32_t b, uint32_t c, uint32_t d) {
    addTriangle(a, b, c);
    addTriangle(a, c, d);
    return *this;
}

// -----------------------------------------------------------------------------
// Modifiers
// -----------------------------------------------------------------------------

MeshBuilder& MeshBuilder::computeNormals() {
    for (auto& v : m_vertices) {
        v.normal = glm::vec3(0);
    }

    // Area-weighted face normals accumulated per vertex
    for (size_t i = 0; i + 2 < m_indices.size(); i += 3) {
        uint32_t i0 = m_indices[i];
        uint32_t i1 = m_indices[i + 1];
        uint32_t i2 = m_indices[i + 2];

        glm::vec3 v0 = m_vertices[i0].position;
        glm::vec3 v1 = m_vertices[i1].position;
        glm::vec3 v2 = m_vertices[i2].position;

        glm::vec3 normal = glm::cross(v1 - v0, v2 - v0);

        m_vertices[i0].normal += normal;
        m_vertices[i1].normal += normal;
        m_vertices[i2].normal += normal;
    }

    for (auto& v : m_vertices) {
        float len = glm::length(v.normal);
        if (len > 0.0001f) {
            v.normal /= len;
        }
    }

    return *this;
}

MeshBuilder& MeshBuilder::translate(glm::vec3 offset) {
    for (auto& v : m_vertices) {
        v.position += offset;
    }
    m_manifold.reset();
    return *this;
}

// -----------------------------------------------------------------------------
// CSG Operations via Manifold
// -----------------------------------------------------------------------------

MeshBuilder& MeshBuilder::subtract(const MeshBuilder& other) {
    manifold::Manifold a = m_manifold ? *m_manifold : toManifold(m_vertices, m_indices);
    manifold::Manifold b = other.m_manifold ? *other.m_manifold
                                            : toManifold(other.m_vertices, other.m_indices);

    m_manifold = std::make_unique<manifold::Manifold>(a - b);
    syncFromManifold();
    return *this;
}

// -----------------------------------------------------------------------------
// Build
// -----------------------------------------------------------------------------

Mesh MeshBuilder::build() const {
    Mesh mesh;
    mesh.vertices = m_vertices;
    mesh.indices = m_indices;
    return mesh;
}

// -----------------------------------------------------------------------------
// Primitive Generators
// -----------------------------------------------------------------------------

MeshBuilder MeshBuilder::box(float w, float h, float d) {
    return box(glm::vec3(w, h, d));
}

MeshBuilder MeshBuilder::box(glm::vec3 size) {
    // Each face has its own 4 vertices for correct normals and UVs
    MeshBuilder builder;

    float hx = size.x * 0.5f;
    float hy = size.y * 0.5f;
    float hz = size.z * 0.5f;

    auto face = [&builder](glm::vec3 normal, glm::vec3 a, glm::vec3 b, glm::vec3 c, glm::vec3 d) {
        uint32_t base = static_cast<uint32_t>(builder.vertexCount());
        builder.addVertex(a, normal, glm::vec2(0, 1));
        builder.addVertex(b, normal, glm::vec2(1, 1));
        builder.addVertex(c, normal, glm::vec2(1, 0));
        builder.addVertex(d, normal, glm::vec2(0, 0));
        builder.addQuad(base, base + 1, base + 2, base + 3);
    };

    // +Z, -Z, +X, -X, +Y, -Y (CCW seen from outside)
    face({0, 0, 1}, {-hx, -hy, hz}, {hx, -hy, hz}, {hx, hy, hz}, {-hx, hy, hz});
    face({0, 0, -1}, {hx, -hy, -hz}, {-hx, -hy, -hz}, {-hx, hy, -hz}, {hx, hy, -hz});
    face({1, 0, 0}, {hx, -hy, hz}, {hx, -hy, -hz}, {hx, hy, -hz}, {hx, hy, hz});
    face({-1, 0, 0}, {-hx, -hy, -hz}, {-hx, -hy, hz}, {-hx, hy, hz}, {-hx, hy, -hz});
    face({0, 1, 0}, {-hx, hy, hz}, {hx, hy, hz}, {hx, hy, -hz}, {-hx, hy, -hz});
    face({0, -1, 0}, {-hx, -hy, -hz}, {hx, -hy, -hz}, {hx, -hy, hz}, {-hx, -hy, hz});

    builder.syncToManifold();

    return builder;
}

MeshBuilder MeshBuilder::cylinder(float radiusTop, float radiusBottom, float height, int segments) {
    MeshBuilder builder;
    float halfH = height * 0.5f;
    segments = std::max(segments, 3);

    // Side ring vertices, separate from the caps for sharp edges
    for (int i = 0; i <= segments; ++i) {
        float angle = 2.0f * glm::pi<float>() * i / segments;
        float c = std::cos(angle);
        float s = std::sin(angle);
        float u = static_cast<float>(i) / segments;

        builder.addVertex(glm::vec3(radiusBottom * c, -halfH, radiusBottom * s), glm::vec3(0), glm::vec2(u, 0));
        builder.addVertex(glm::vec3(radiusTop * c, halfH, radiusTop * s), glm::vec3(0), glm::vec2(u, 1));
    }

    for (int i = 0; i < segments; ++i) {
        uint32_t bl = i * 2;
        uint32_t tl = i * 2 + 1;
        uint32_t br = (i + 1) * 2;
        uint32_t tr = (i + 1) * 2 + 1;

        builder.addTriangle(bl, tl, tr);
        builder.addTriangle(bl, tr, br);
    }
    builder.computeNormals();

    auto cap = [&builder, segments](float y, float radius, float ny) {
        uint32_t center = static_cast<uint32_t>(builder.vertexCount());
        builder.addVertex(glm::vec3(0, y, 0), glm::vec3(0, ny, 0), glm::vec2(0.5f, 0.5f));

        uint32_t ringStart = static_cast<uint32_t>(builder.vertexCount());
        for (int i = 0; i < segments; ++i) {
            float angle = 2.0f * glm::pi<float>() * i / segments;
            float c = std::cos(angle);
            float s = std::sin(angle);
            builder.addVertex(glm::vec3(radius * c, y, radius * s), glm::vec3(0, ny, 0),
                              glm::vec2(0.5f + 0.5f * c, 0.5f + 0.5f * s * ny));
        }

        for (int i = 0; i < segments; ++i) {
            uint32_t curr = ringStart + i;
            uint32_t next = ringStart + ((i + 1) % segments);
            if (ny > 0.0f) {
                builder.addTriangle(center, next, curr);
            } else {
                builder.addTriangle(center, curr, next);
            }
        }
    };

    cap(halfH, radiusTop, 1.0f);
    cap(-halfH, radiusBottom, -1.0f);

    builder.syncToManifold();

    return builder;
}

MeshBuilder MeshBuilder::cone(float radius, float height, int segments) {
    // Manifold cylinders run along +Z from the origin; turn to +Y
    manifold::Manifold m = manifold::Manifold::Cylinder(static_cast<double>(height),
                                                        static_cast<double>(radius),
                                                        0.0,  // radiusHigh = 0 for cone
                                                        std::max(segments, 3), true)
                               .Rotate(-90.0, 0.0, 0.0);

    MeshBuilder builder;
    builder.m_manifold = std::make_unique<manifold::Manifold>(m);
    builder.syncFromManifold();
    return builder;
}

MeshBuilder MeshBuilder::plane(float width, float depth) {
    MeshBuilder builder;
    float hw = width * 0.5f;
    float hd = depth * 0.5f;
    glm::vec3 n(0, 1, 0);

    builder.addVertex(glm::vec3(-hw, 0, -hd), n, glm::vec2(0, 0));
    builder.addVertex(glm::vec3(-hw, 0, hd), n, glm::vec2(0, 1));
    builder.addVertex(glm::vec3(hw, 0, hd), n, glm::vec2(1, 1));
    builder.addVertex(glm::vec3(hw, 0, -hd), n, glm::vec2(1, 0));
    builder.addQuad(0, 1, 2, 3);

    return builder;
}

MeshBuilder MeshBuilder::rect(float width, float height) {
    MeshBuilder builder;
    float hw = width * 0.5f;
    float hh = height * 0.5f;
    glm::vec3 n(0, 0, 1);

    builder.addVertex(glm::vec3(-hw, -hh, 0), n, glm::vec2(0, 1));
    builder.addVertex(glm::vec3(hw, -hh, 0), n, glm::vec2(1, 1));
    builder.addVertex(glm::vec3(hw, hh, 0), n, glm::vec2(1, 0));
    builder.addVertex(glm::vec3(-hw, hh, 0), n, glm::vec2(0, 0));
    builder.addQuad(0, 1, 2, 3);

    return builder;
}

MeshBuilder MeshBuilder::circle(float radius, int segments) {
    MeshBuilder builder;
    segments = std::max(segments, 3);
    glm::vec3 n(0, 1, 0);

    builder.addVertex(glm::vec3(0), n, glm::vec2(0.5f, 0.5f));
    for (int i = 0; i < segments; ++i) {
        float angle = 2.0f * glm::pi<float>() * i / segments;
        float c = std::cos(angle);
        float s = std::sin(angle);
        builder.addVertex(glm::vec3(radius * c, 0, radius * s), n,
                          glm::vec2(0.5f + 0.5f * c, 0.5f + 0.5f * s));
    }

    for (int i = 0; i < segments; ++i) {
        uint32_t curr = 1 + i;
        uint32_t next = 1 + ((i + 1) % segments);
        builder.addTriangle(0, next, curr);  // CCW when viewed from above
    }

    return builder;
}

} // namespace vitrail::render3d
