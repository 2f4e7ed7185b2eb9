#pragma once

/**
 * @file castle_params.h
 * @brief Tweakable inputs of the castle generator
 *
 * Every field is a Param so the parameter panel can list ranges and bind
 * sliders straight onto a live CastleParams. The generator reads a snapshot
 * of these values on each generate() call.
 *
 * towerCount, towerRadius, towerHeight, crenelationHeight and
 * crenelationCount are carried for the panel and presets; the windowed ring
 * layout does not read them.
 */

#include <vitrail/config.h>
#include <vitrail/param.h>
#include <vector>

namespace vitrail::castle {

struct CastleParams {
    Param<int>   seed{"seed", 12345, 0, 99999};
    Param<int>   towerCount{"towerCount", 4, 3, 8};
    Param<float> towerRadius{"towerRadius", 0.15f, 0.05f, 0.4f};
    Param<float> towerHeight{"towerHeight", 1.2f, 0.5f, 2.5f};
    Param<float> wallHeight{"wallHeight", 0.6f, 0.2f, 1.5f};
    Param<float> wallThickness{"wallThickness", 0.08f, 0.02f, 0.2f};
    Param<float> baseRadius{"baseRadius", 1.0f, 0.4f, 2.0f};
    Param<float> windowWidth{"windowWidth", 0.35f, 0.1f, 0.6f};
    Param<float> windowHeight{"windowHeight", 0.5f, 0.15f, 0.8f};
    Param<float> crenelationHeight{"crenelationHeight", 0.08f, 0.02f, 0.3f};
    Param<int>   crenelationCount{"crenelationCount", 8, 4, 16};

    /// Number of window texture slots configured by the caller
    Param<int>   windowSlots{"windowSlots", 4, 0, 16};

    /// Build each wall as one solid with a boolean-cut opening instead of slabs
    Param<bool>  carvedWalls{"carvedWalls", false, false, true};

    /// Pick a fresh seed in the seed range (the panel's "Randomize" button)
    void randomizeSeed();

    /// Declarations of every parameter, in panel order
    std::vector<ParamDecl> decls() const;
};

/// Serialize all parameters, keyed by parameter name
json toJson(const CastleParams& params);

/// Apply whatever keys are present; values are clamped to their ranges
void fromJson(const json& obj, CastleParams& params);

} // namespace vitrail::castle
