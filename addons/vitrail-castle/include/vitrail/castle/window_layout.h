#pragma once

/**
 * @file window_layout.h
 * @brief Window sizing and ring placement for the castle
 *
 * Windows sit one per wall segment on a circle around the floor. Each
 * window is sized from the aspect ratio of the image it shows: a fixed
 * nominal size is stretched along the long side and capped so a very wide
 * or very tall image cannot produce a huge opening.
 */

#include <vitrail/castle/castle_params.h>
#include <glm/glm.hpp>
#include <vector>

namespace vitrail::castle {

/// Nominal length of a window's short side before aspect stretching
constexpr float kWindowBaseSize = 0.4f;
/// Cap on the width of wide windows
constexpr float kMaxWindowWidth = 0.7f;
/// Cap on the height of tall windows
constexpr float kMaxWindowHeight = 0.8f;

/// Width and height of a window opening
struct WindowSize {
    float width = kWindowBaseSize;
    float height = kWindowBaseSize;
};

/// Placement of one window, recomputed on every generation
struct WindowSpec {
    int index = 0;
    float width = 0.0f;
    float height = 0.0f;
    float angle = 0.0f;           ///< Angle around the ring (radians), 2*pi*i/count
    glm::vec3 worldPosition{0.0f};  ///< Wall segment origin on the ring (floor level)
    float worldRotationY = 0.0f;  ///< Yaw turning the segment's +Z face outward
    float centerHeight = 0.0f;    ///< Height of the opening's center above the floor
};

/// Derived ring dimensions shared by walls, pillars and floor
struct RingDimensions {
    float radius = 0.0f;         ///< Wall ring radius
    float wallHeight = 0.0f;
    float wallThickness = 0.0f;

    static RingDimensions from(const CastleParams& params);
};

/**
 * @brief Size a window for an image aspect ratio (width / height)
 *
 * Wide images (aspect >= 1) get width = min(base * aspect, maxWidth) and the
 * height that restores the aspect; tall images mirror this on the height.
 * A non-positive or non-finite aspect counts as square.
 */
WindowSize windowSize(float aspect);

/**
 * @brief Lay out one window per aspect ratio around the ring
 * @param aspects Aspect ratio per slot, in slot order
 * @param params Castle dimensions
 */
std::vector<WindowSpec> layoutWindows(const std::vector<float>& aspects,
                                      const CastleParams& params);

/// Yaw that turns a segment at ring angle `angle` to face away from the center
float outwardYaw(float angle);

} // namespace vitrail::castle
