#pragma once

/**
 * @file castle_generator.h
 * @brief Procedural ring castle whose walls frame the glass windows
 *
 * The castle is a ring of wall segments, one per window slot, each with an
 * opening sized to the image it frames. Pillars sit between neighbouring
 * segments, a stone base and a floor close the ring, and a horizontal
 * skylight above the floor throws light straight down.
 *
 * A generator owns exactly one live castle group. Generating again detaches
 * the previous group from the scene and disposes its geometry before the
 * new group is attached, so repeated generation never accumulates meshes.
 *
 * @par Example
 * @code
 * Scene scene;
 * CastleGenerator castle;
 * castle.params().seed = 42;
 *
 * std::vector<Material*> glass = {&eagle, &rose, &tower, &knight};
 * CastleResult result = castle.generate(scene, glass);
 *
 * // Later, after the panel changed a parameter
 * castle.regenerate(glass);
 * @endcode
 *
 * The scene passed to generate() must outlive the generator. The generator
 * never owns the scene, but its stone, floor and frame materials live in the
 * generator, so destroying it removes the castle group from the scene.
 */

#include <vitrail/castle/castle_params.h>
#include <vitrail/castle/window_layout.h>
#include <vitrail/render3d/material.h>
#include <vitrail/render3d/scene.h>
#include <optional>
#include <vector>

namespace vitrail::castle {

/// Handles into the castle group produced by one generate() call
struct CastleResult {
    render3d::Group* group = nullptr;                 ///< Owned by the scene
    std::vector<render3d::MeshNode*> windowMeshes;    ///< Glass per slot with a material, then the skylight
    int windowCount = 0;                              ///< Number of wall segments / window slots
};

class CastleGenerator {
public:
    CastleGenerator();
    /// Removes the live castle group from its scene (see clear())
    ~CastleGenerator();

    CastleGenerator(const CastleGenerator&) = delete;
    CastleGenerator& operator=(const CastleGenerator&) = delete;

    // -------------------------------------------------------------------------
    /// @name Generation
    /// @{

    /**
     * @brief Build a castle into a scene, replacing this generator's previous one
     * @param scene Parent node the castle group is attached to
     * @param materials Glass material per window slot (may be shorter than the slot count, or hold nulls)
     * @param params Values to generate with; copied into params() so regenerate() reproduces them
     */
    CastleResult generate(render3d::Node& scene,
                          const std::vector<render3d::Material*>& materials,
                          const CastleParams& params);

    /// Build with the generator's own live parameters
    CastleResult generate(render3d::Node& scene,
                          const std::vector<render3d::Material*>& materials);

    /**
     * @brief Rebuild into the last scene with the current params()
     * @return nullopt if generate() was never called
     */
    std::optional<CastleResult> regenerate(const std::vector<render3d::Material*>& materials);

    /**
     * @brief Swap glass materials without rebuilding geometry
     *
     * Entry i applies to windowMeshes()[i]; null or missing entries leave
     * that mesh's material unchanged.
     */
    void updateWindowMaterials(const std::vector<render3d::Material*>& materials);

    /// Detach the castle group from its scene and dispose its geometry
    void clear();

    /// @}
    // -------------------------------------------------------------------------
    /// @name Access
    /// @{

    /// Live parameter set (bind panel sliders here)
    CastleParams& params() { return m_params; }
    const CastleParams& params() const { return m_params; }

    render3d::Group* group() const { return m_group; }
    const std::vector<render3d::MeshNode*>& windowMeshes() const { return m_windowMeshes; }

    /// Wall segment groups, one per slot, in slot order
    const std::vector<render3d::Group*>& walls() const { return m_walls; }

    /// Corner pillar groups; pillar i sits between segments i and i + 1
    const std::vector<render3d::Group*>& pillars() const { return m_pillars; }

    /// Layout used by the last generation
    const std::vector<WindowSpec>& windows() const { return m_windows; }

    const render3d::Material& stoneMaterial() const { return m_stone; }
    const render3d::Material& floorMaterial() const { return m_floor; }
    const render3d::Material& frameMaterial() const { return m_frame; }

    /// @}

private:
    render3d::Group& buildWallSegment(render3d::Group& parent, const WindowSpec& spec,
                                      const RingDimensions& ring, float tint);
    render3d::Group& buildPillar(render3d::Group& parent, float height);
    void buildSkylight(render3d::Group& parent, render3d::Material* glass, float wallHeight);

    CastleParams m_params;

    render3d::Material m_stone{"stone"};
    render3d::Material m_floor{"floor"};
    render3d::Material m_frame{"frame"};

    render3d::Node* m_scene = nullptr;
    render3d::Group* m_group = nullptr;
    std::vector<render3d::MeshNode*> m_windowMeshes;
    std::vector<render3d::Group*> m_walls;
    std::vector<render3d::Group*> m_pillars;
    std::vector<WindowSpec> m_windows;
};

} // namespace vitrail::castle
