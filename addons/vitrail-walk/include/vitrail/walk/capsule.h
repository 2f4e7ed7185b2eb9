#pragma once

/**
 * @file capsule.h
 * @brief Push a capsule out of triangle geometry
 */

#include <vitrail/walk/geometry.h>
#include <vitrail/walk/mesh_bvh.h>

namespace vitrail::walk {

/// Capsule as a spine segment plus radius
struct CapsuleSegment {
    Segment segment;
    float radius = 0.0f;

    CapsuleSegment() = default;
    CapsuleSegment(glm::vec3 start, glm::vec3 end, float r) : segment(start, end), radius(r) {}

    glm::vec3 start() const { return segment.start; }
    glm::vec3 end() const { return segment.end; }

    void translate(glm::vec3 offset) {
        segment.start += offset;
        segment.end += offset;
    }
};

struct CapsuleResolution {
    CapsuleSegment capsule;  ///< Corrected capsule
    int contacts = 0;        ///< Triangles that pushed the capsule
};

/**
 * @brief Relax a capsule out of the triangles of one hierarchy
 *
 * Candidate triangles are those in nodes whose box lies within the radius of
 * either spine endpoint. Each one closer than the radius to the spine pushes
 * the capsule along the separation by the penetration depth, and later
 * triangles are tested against the already-moved capsule. The result depends
 * on traversal order and is not a minimal correction when several triangles
 * overlap the capsule at once.
 *
 * A spine that pierces a triangle has no separation direction; it is pushed
 * along the triangle normal, towards the side the spine start lies on.
 */
CapsuleResolution resolveAgainst(CapsuleSegment capsule, const MeshBVH& bvh);

} // namespace vitrail::walk
