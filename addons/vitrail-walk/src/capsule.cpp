#include <vitrail/walk/capsule.h>

namespace vitrail::walk {

namespace {

constexpr float kMinSeparation = 1e-6f;

glm::vec3 pushDirection(const Triangle& tri, const Segment& spine,
                        glm::vec3 onTriangle, glm::vec3 onSpine, float distance) {
    if (distance > kMinSeparation) {
        return (onSpine - onTriangle) / distance;
    }

    glm::vec3 n = tri.normal();
    if (glm::dot(spine.start - tri.a, n) < 0.0f) {
        n = -n;
    }
    return n;
}

} // anonymous namespace

CapsuleResolution resolveAgainst(CapsuleSegment capsule, const MeshBVH& bvh) {
    CapsuleResolution result;
    const float radius = capsule.radius;

    bvh.shapecast(
        [&capsule, radius](const render3d::Box3& box) {
            return box.distanceToPoint(capsule.segment.start) < radius ||
                   box.distanceToPoint(capsule.segment.end) < radius;
        },
        [&capsule, &result, radius](const Triangle& tri, uint32_t) {
            glm::vec3 onTriangle;
            glm::vec3 onSpine;
            float distance = tri.closestPointToSegment(capsule.segment, onTriangle, onSpine);

            if (distance < radius) {
                glm::vec3 dir = pushDirection(tri, capsule.segment, onTriangle, onSpine, distance);
                capsule.translate(dir * (radius - distance));
                ++result.contacts;
            }

            // Keep visiting so every overlapping triangle gets a turn
            return false;
        });

    result.capsule = capsule;
    return result;
}

} // namespace vitrail::walk
