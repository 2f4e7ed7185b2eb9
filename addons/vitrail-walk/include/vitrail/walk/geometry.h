#pragma once

/**
 * @file geometry.h
 * @brief Segment and triangle primitives for capsule collision
 */

#include <glm/glm.hpp>

namespace vitrail::walk {

/// Line segment between two points
struct Segment {
    glm::vec3 start{0.0f};
    glm::vec3 end{0.0f};

    Segment() = default;
    Segment(glm::vec3 s, glm::vec3 e) : start(s), end(e) {}

    glm::vec3 delta() const { return end - start; }
    glm::vec3 at(float t) const { return start + delta() * t; }
    float length() const { return glm::length(delta()); }

    /// Parameter in [0, 1] of the point on the segment closest to p
    float closestParameter(glm::vec3 p) const;

    glm::vec3 closestPointToPoint(glm::vec3 p) const { return at(closestParameter(p)); }

    Segment translated(glm::vec3 offset) const { return {start + offset, end + offset}; }
};

/**
 * @brief Closest points between two segments
 * @param outA Receives the point on a
 * @param outB Receives the point on b
 * @return Distance between the two points
 */
float closestPointsBetweenSegments(const Segment& a, const Segment& b,
                                   glm::vec3& outA, glm::vec3& outB);

/// Triangle with counter-clockwise winding
struct Triangle {
    glm::vec3 a{0.0f};
    glm::vec3 b{0.0f};
    glm::vec3 c{0.0f};

    Triangle() = default;
    Triangle(glm::vec3 a_, glm::vec3 b_, glm::vec3 c_) : a(a_), b(b_), c(c_) {}

    /// Unit normal, zero for a degenerate triangle
    glm::vec3 normal() const;

    glm::vec3 centroid() const { return (a + b + c) / 3.0f; }

    /// Closest point on the triangle (including its interior) to p
    glm::vec3 closestPointToPoint(glm::vec3 p) const;

    /**
     * @brief Intersect a segment with the triangle's surface
     * @param hit Receives the intersection point
     * @return true if the segment crosses or touches the triangle
     */
    bool intersectsSegment(const Segment& segment, glm::vec3& hit) const;

    /**
     * @brief Closest points between the triangle and a segment
     * @param outTriangle Receives the point on the triangle
     * @param outSegment Receives the point on the segment
     * @return Distance between the two points (0 if the segment pierces the triangle)
     */
    float closestPointToSegment(const Segment& segment,
                                glm::vec3& outTriangle, glm::vec3& outSegment) const;
};

} // namespace vitrail::walk
