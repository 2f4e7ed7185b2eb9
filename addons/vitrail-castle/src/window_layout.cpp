#include <vitrail/castle/window_layout.h>
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>

namespace vitrail::castle {

RingDimensions RingDimensions::from(const CastleParams& params) {
    RingDimensions d;
    d.radius = params.baseRadius * 1.2f;
    d.wallHeight = params.wallHeight * 1.5f;
    d.wallThickness = params.wallThickness * 1.2f;
    return d;
}

WindowSize windowSize(float aspect) {
    if (!std::isfinite(aspect) || aspect <= 0.0f) {
        aspect = 1.0f;
    }

    WindowSize size;
    if (aspect >= 1.0f) {
        size.width = std::min(kWindowBaseSize * aspect, kMaxWindowWidth);
        size.height = size.width / aspect;
    } else {
        size.height = std::min(kWindowBaseSize / aspect, kMaxWindowHeight);
        size.width = size.height * aspect;
    }
    return size;
}

float outwardYaw(float angle) {
    return -angle + glm::half_pi<float>();
}

std::vector<WindowSpec> layoutWindows(const std::vector<float>& aspects,
                                      const CastleParams& params) {
    RingDimensions ring = RingDimensions::from(params);
    const int count = static_cast<int>(aspects.size());

    std::vector<WindowSpec> specs;
    specs.reserve(aspects.size());

    for (int i = 0; i < count; ++i) {
        WindowSize size = windowSize(aspects[i]);

        WindowSpec spec;
        spec.index = i;
        spec.width = size.width;
        spec.height = size.height;
        spec.angle = glm::two_pi<float>() * static_cast<float>(i) / static_cast<float>(count);
        spec.worldPosition = glm::vec3(std::cos(spec.angle) * ring.radius,
                                       0.0f,
                                       std::sin(spec.angle) * ring.radius);
        spec.worldRotationY = outwardYaw(spec.angle);
        spec.centerHeight = ring.wallHeight * 0.5f;
        specs.push_back(spec);
    }

    return specs;
}

} // namespace vitrail::castle
