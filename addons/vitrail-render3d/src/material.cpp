#include <vitrail/render3d/material.h>
#include <algorithm>
#include <utility>

namespace vitrail::render3d {

Material::Material(std::string name)
    : m_name(std::move(name))
{}

Material& Material::baseColor(float r, float g, float b, float a) {
    m_baseColor = glm::vec4(r, g, b, a);
    return *this;
}

Material& Material::baseColor(const glm::vec4& color) {
    m_baseColor = color;
    return *this;
}

Material& Material::roughness(float r) {
    m_roughness = std::clamp(r, 0.0f, 1.0f);
    return *this;
}

Material& Material::metallic(float m) {
    m_metallic = std::clamp(m, 0.0f, 1.0f);
    return *this;
}

Material& Material::transparent(bool t) {
    m_transparent = t;
    return *this;
}

Material& Material::transmission(float t) {
    m_transmission = std::clamp(t, 0.0f, 1.0f);
    return *this;
}

Material& Material::aspectRatio(float a) {
    m_aspectRatio = a;
    return *this;
}

} // namespace vitrail::render3d
