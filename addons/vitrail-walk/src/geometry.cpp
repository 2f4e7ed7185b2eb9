#include <vitrail/walk/geometry.h>
#include <algorithm>
#include <cmath>

namespace vitrail::walk {

namespace {

constexpr float kEpsilon = 1e-8f;

} // anonymous namespace

// -----------------------------------------------------------------------------
// Segment
// -----------------------------------------------------------------------------

float Segment::closestParameter(glm::vec3 p) const {
    glm::vec3 d = delta();
    float lenSq = glm::dot(d, d);
    if (lenSq < kEpsilon) {
        return 0.0f;
    }
    return std::clamp(glm::dot(p - start, d) / lenSq, 0.0f, 1.0f);
}

float closestPointsBetweenSegments(const Segment& a, const Segment& b,
                                   glm::vec3& outA, glm::vec3& outB) {
    glm::vec3 d1 = a.delta();
    glm::vec3 d2 = b.delta();
    glm::vec3 r = a.start - b.start;
    float aa = glm::dot(d1, d1);
    float ee = glm::dot(d2, d2);
    float f = glm::dot(d2, r);

    float s = 0.0f;
    float t = 0.0f;

    if (aa < kEpsilon && ee < kEpsilon) {
        // Both segments are points
    } else if (aa < kEpsilon) {
        t = std::clamp(f / ee, 0.0f, 1.0f);
    } else {
        float c = glm::dot(d1, r);
        if (ee < kEpsilon) {
            s = std::clamp(-c / aa, 0.0f, 1.0f);
        } else {
            float bb = glm::dot(d1, d2);
            float denom = aa * ee - bb * bb;

            // Parallel segments pick s = 0 and let the clamps below fix t
            if (denom > kEpsilon) {
                s = std::clamp((bb * f - c * ee) / denom, 0.0f, 1.0f);
            }

            t = (bb * s + f) / ee;
            if (t < 0.0f) {
                t = 0.0f;
                s = std::clamp(-c / aa, 0.0f, 1.0f);
            } else if (t > 1.0f) {
                t = 1.0f;
                s = std::clamp((bb - c) / aa, 0.0f, 1.0f);
            }
        }
    }

    outA = a.start + d1 * s;
    outB = b.start + d2 * t;
    return glm::distance(outA, outB);
}

// -----------------------------------------------------------------------------
// Triangle
// -----------------------------------------------------------------------------

glm::vec3 Triangle::normal() const {
    glm::vec3 n = glm::cross(b - a, c - a);
    float len = glm::length(n);
    if (len < kEpsilon) {
        return glm::vec3(0.0f);
    }
    return n / len;
}

glm::vec3 Triangle::closestPointToPoint(glm::vec3 p) const {
    // Voronoi region walk over vertices, edges and face
    glm::vec3 ab = b - a;
    glm::vec3 ac = c - a;
    glm::vec3 ap = p - a;
    float d1 = glm::dot(ab, ap);
    float d2 = glm::dot(ac, ap);
    if (d1 <= 0.0f && d2 <= 0.0f) return a;

    glm::vec3 bp = p - b;
    float d3 = glm::dot(ab, bp);
    float d4 = glm::dot(ac, bp);
    if (d3 >= 0.0f && d4 <= d3) return b;

    float vc = d1 * d4 - d3 * d2;
    if (vc <= 0.0f && d1 >= 0.0f && d3 <= 0.0f) {
        float v = d1 / (d1 - d3);
        return a + ab * v;
    }

    glm::vec3 cp = p - c;
    float d5 = glm::dot(ab, cp);
    float d6 = glm::dot(ac, cp);
    if (d6 >= 0.0f && d5 <= d6) return c;

    float vb = d5 * d2 - d1 * d6;
    if (vb <= 0.0f && d2 >= 0.0f && d6 <= 0.0f) {
        float w = d2 / (d2 - d6);
        return a + ac * w;
    }

    float va = d3 * d6 - d5 * d4;
    if (va <= 0.0f && (d4 - d3) >= 0.0f && (d5 - d6) >= 0.0f) {
        float w = (d4 - d3) / ((d4 - d3) + (d5 - d6));
        return b + (c - b) * w;
    }

    float sum = va + vb + vc;
    if (std::abs(sum) < kEpsilon) {
        // Degenerate triangle: use the nearest edge
        Segment edges[3] = {{a, b}, {b, c}, {c, a}};
        glm::vec3 best = a;
        float bestDist = glm::distance(p, a);
        for (const Segment& e : edges) {
            glm::vec3 q = e.closestPointToPoint(p);
            float d = glm::distance(p, q);
            if (d < bestDist) {
                bestDist = d;
                best = q;
            }
        }
        return best;
    }

    float denom = 1.0f / sum;
    float v = vb * denom;
    float w = vc * denom;
    return a + ab * v + ac * w;
}

bool Triangle::intersectsSegment(const Segment& segment, glm::vec3& hit) const {
    glm::vec3 dir = segment.delta();
    glm::vec3 e1 = b - a;
    glm::vec3 e2 = c - a;
    glm::vec3 p = glm::cross(dir, e2);
    float det = glm::dot(e1, p);
    if (std::abs(det) < kEpsilon) {
        return false;
    }

    float inv = 1.0f / det;
    glm::vec3 s = segment.start - a;
    float u = glm::dot(s, p) * inv;
    if (u < 0.0f || u > 1.0f) return false;

    glm::vec3 q = glm::cross(s, e1);
    float v = glm::dot(dir, q) * inv;
    if (v < 0.0f || u + v > 1.0f) return false;

    float t = glm::dot(e2, q) * inv;
    if (t < 0.0f || t > 1.0f) return false;

    hit = segment.at(t);
    return true;
}

float Triangle::closestPointToSegment(const Segment& segment,
                                      glm::vec3& outTriangle, glm::vec3& outSegment) const {
    glm::vec3 hit;
    if (intersectsSegment(segment, hit)) {
        outTriangle = hit;
        outSegment = hit;
        return 0.0f;
    }

    // Otherwise the minimum lies at a segment endpoint against the face, or
    // between the segment and one of the triangle edges
    glm::vec3 tri = closestPointToPoint(segment.start);
    float best = glm::distance(tri, segment.start);
    outTriangle = tri;
    outSegment = segment.start;

    tri = closestPointToPoint(segment.end);
    float d = glm::distance(tri, segment.end);
    if (d < best) {
        best = d;
        outTriangle = tri;
        outSegment = segment.end;
    }

    const Segment edges[3] = {{a, b}, {b, c}, {c, a}};
    for (const Segment& edge : edges) {
        glm::vec3 onEdge;
        glm::vec3 onSegment;
        d = closestPointsBetweenSegments(edge, segment, onEdge, onSegment);
        if (d < best) {
            best = d;
            outTriangle = onEdge;
            outSegment = onSegment;
        }
    }

    return best;
}

} // namespace vitrail::walk
