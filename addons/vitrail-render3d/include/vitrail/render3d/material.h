#pragma once

/**
 * @file material.h
 * @brief Appearance handle attached to scene meshes
 *
 * The actual shading (glass refraction, caustics, PBR stone) belongs to the
 * renderer. On this side a Material is an opaque handle plus the few flags
 * the scene logic reads: transparency/transmission decide whether a mesh is
 * solid for collision, and aspectRatio sizes the window that shows it.
 *
 * @par Example
 * @code
 * Material glass("Eagle");
 * glass.transparent(true)
 *      .transmission(1.0f)
 *      .aspectRatio(1.5f);
 * @endcode
 */

#include <glm/glm.hpp>
#include <optional>
#include <string>

namespace vitrail::render3d {

class Material {
public:
    Material() = default;
    explicit Material(std::string name);

    // -------------------------------------------------------------------------
    /// @name Surface
    /// @{

    /// Set base color (linear RGB)
    Material& baseColor(float r, float g, float b, float a = 1.0f);
    Material& baseColor(const glm::vec4& color);

    /// Set roughness factor (0 = mirror, 1 = diffuse)
    Material& roughness(float r);

    /// Set metallic factor (0 = dielectric, 1 = metal)
    Material& metallic(float m);

    const glm::vec4& baseColorFactor() const { return m_baseColor; }
    float roughnessFactor() const { return m_roughness; }
    float metallicFactor() const { return m_metallic; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Light Transport
    /// @{

    /// Alpha-blended surface
    Material& transparent(bool t);

    /// Physical transmission amount (0 = opaque, 1 = fully transmissive)
    Material& transmission(float t);

    bool isTransparent() const { return m_transparent; }
    float transmissionFactor() const { return m_transmission; }

    /// True when light is meant to pass through (glass)
    bool passesLight() const { return m_transparent || m_transmission > 0.0f; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Texture Hint
    /// @{

    /// Aspect ratio (width / height) of the image this material displays
    Material& aspectRatio(float a);

    const std::optional<float>& aspectRatioHint() const { return m_aspectRatio; }

    /// @}

    const std::string& name() const { return m_name; }

private:
    std::string m_name;
    glm::vec4 m_baseColor = glm::vec4(1.0f);
    float m_roughness = 0.5f;
    float m_metallic = 0.0f;
    bool m_transparent = false;
    float m_transmission = 0.0f;
    std::optional<float> m_aspectRatio;
};

} // namespace vitrail::render3d
