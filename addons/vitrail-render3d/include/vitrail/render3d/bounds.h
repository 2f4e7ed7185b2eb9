#pragma once

#include <glm/glm.hpp>
#include <limits>

namespace vitrail::render3d {

/// Axis-aligned bounding box
struct Box3 {
    glm::vec3 min = glm::vec3(std::numeric_limits<float>::infinity());
    glm::vec3 max = glm::vec3(-std::numeric_limits<float>::infinity());

    Box3() = default;
    Box3(glm::vec3 lo, glm::vec3 hi) : min(lo), max(hi) {}

    /// True until at least one point has been added
    bool isEmpty() const {
        return max.x < min.x || max.y < min.y || max.z < min.z;
    }

    void expandByPoint(const glm::vec3& p) {
        min = glm::min(min, p);
        max = glm::max(max, p);
    }

    void expandByBox(const Box3& other) {
        if (other.isEmpty()) return;
        expandByPoint(other.min);
        expandByPoint(other.max);
    }

    glm::vec3 size() const {
        return isEmpty() ? glm::vec3(0) : max - min;
    }

    glm::vec3 center() const {
        return (min + max) * 0.5f;
    }

    /// Length of the box diagonal (0 for an empty box)
    float diagonal() const {
        return glm::length(size());
    }

    /// Closest point on or inside the box
    glm::vec3 clampPoint(const glm::vec3& p) const {
        return glm::clamp(p, min, max);
    }

    /// Distance from a point to the box (0 when inside)
    float distanceToPoint(const glm::vec3& p) const {
        return glm::length(clampPoint(p) - p);
    }

    bool containsPoint(const glm::vec3& p) const {
        return p.x >= min.x && p.x <= max.x &&
               p.y >= min.y && p.y <= max.y &&
               p.z >= min.z && p.z <= max.z;
    }

    /// Bounds of this box after an affine transform (all 8 corners)
    Box3 transformed(const glm::mat4& m) const {
        Box3 out;
        if (isEmpty()) return out;
        for (int i = 0; i < 8; ++i) {
            glm::vec3 corner((i & 1) ? max.x : min.x,
                             (i & 2) ? max.y : min.y,
                             (i & 4) ? max.z : min.z);
            out.expandByPoint(glm::vec3(m * glm::vec4(corner, 1.0f)));
        }
        return out;
    }
};

} // namespace vitrail::render3d
