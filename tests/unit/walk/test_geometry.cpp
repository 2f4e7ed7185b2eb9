/**
 * @file test_geometry.cpp
 * @brief Unit tests for segment and triangle closest-point queries
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <vitrail/walk/geometry.h>

using namespace vitrail::walk;
using Catch::Matchers::WithinAbs;

namespace {

// Unit right triangle on the ground plane
Triangle floorTriangle() {
    return Triangle(glm::vec3(0, 0, 0), glm::vec3(0, 0, 1), glm::vec3(1, 0, 0));
}

} // namespace

TEST_CASE("Segment closest point", "[walk][geometry]") {
    Segment s(glm::vec3(0, 0, 0), glm::vec3(0, 2, 0));

    REQUIRE_THAT(s.closestParameter(glm::vec3(1, 1, 0)), WithinAbs(0.5f, 0.0001f));
    REQUIRE_THAT(s.closestParameter(glm::vec3(0, -3, 0)), WithinAbs(0.0f, 0.0001f));
    REQUIRE_THAT(s.closestParameter(glm::vec3(0, 9, 0)), WithinAbs(1.0f, 0.0001f));
    REQUIRE_THAT(s.length(), WithinAbs(2.0f, 0.0001f));
}

TEST_CASE("closestPointsBetweenSegments", "[walk][geometry]") {
    glm::vec3 pa;
    glm::vec3 pb;

    SECTION("crossing segments at a distance") {
        Segment a(glm::vec3(-1, 0, 0), glm::vec3(1, 0, 0));
        Segment b(glm::vec3(0, 1, -1), glm::vec3(0, 1, 1));
        REQUIRE_THAT(closestPointsBetweenSegments(a, b, pa, pb), WithinAbs(1.0f, 0.0001f));
        REQUIRE_THAT(glm::length(pa), WithinAbs(0.0f, 0.0001f));
        REQUIRE_THAT(pb.y, WithinAbs(1.0f, 0.0001f));
    }

    SECTION("parallel segments") {
        Segment a(glm::vec3(0, 0, 0), glm::vec3(1, 0, 0));
        Segment b(glm::vec3(0, 0.5f, 0), glm::vec3(1, 0.5f, 0));
        REQUIRE_THAT(closestPointsBetweenSegments(a, b, pa, pb), WithinAbs(0.5f, 0.0001f));
    }

    SECTION("endpoint regions clamp") {
        Segment a(glm::vec3(0, 0, 0), glm::vec3(1, 0, 0));
        Segment b(glm::vec3(3, 0, 0), glm::vec3(4, 0, 0));
        REQUIRE_THAT(closestPointsBetweenSegments(a, b, pa, pb), WithinAbs(2.0f, 0.0001f));
        REQUIRE_THAT(pa.x, WithinAbs(1.0f, 0.0001f));
        REQUIRE_THAT(pb.x, WithinAbs(3.0f, 0.0001f));
    }
}

TEST_CASE("Triangle closest point to a point", "[walk][geometry]") {
    Triangle tri = floorTriangle();

    SECTION("above the face projects straight down") {
        glm::vec3 q = tri.closestPointToPoint(glm::vec3(0.2f, 3.0f, 0.2f));
        REQUIRE_THAT(q.x, WithinAbs(0.2f, 0.0001f));
        REQUIRE_THAT(q.y, WithinAbs(0.0f, 0.0001f));
        REQUIRE_THAT(q.z, WithinAbs(0.2f, 0.0001f));
    }

    SECTION("beyond a vertex snaps to the vertex") {
        glm::vec3 q = tri.closestPointToPoint(glm::vec3(-1, 0, -1));
        REQUIRE_THAT(glm::length(q), WithinAbs(0.0f, 0.0001f));
    }

    SECTION("beyond the hypotenuse lands on it") {
        glm::vec3 q = tri.closestPointToPoint(glm::vec3(1, 0, 1));
        REQUIRE_THAT(q.x, WithinAbs(0.5f, 0.0001f));
        REQUIRE_THAT(q.z, WithinAbs(0.5f, 0.0001f));
    }

    SECTION("normal is unit length") {
        REQUIRE_THAT(glm::length(tri.normal()), WithinAbs(1.0f, 0.0001f));
        REQUIRE_THAT(std::abs(tri.normal().y), WithinAbs(1.0f, 0.0001f));
    }
}

TEST_CASE("Triangle closest point to a segment", "[walk][geometry]") {
    Triangle tri = floorTriangle();
    glm::vec3 onTri;
    glm::vec3 onSeg;

    SECTION("vertical segment above the face") {
        Segment s(glm::vec3(0.25f, 0.1f, 0.25f), glm::vec3(0.25f, 0.6f, 0.25f));
        REQUIRE_THAT(tri.closestPointToSegment(s, onTri, onSeg), WithinAbs(0.1f, 0.0001f));
        REQUIRE_THAT(onSeg.y, WithinAbs(0.1f, 0.0001f));
        REQUIRE_THAT(onTri.y, WithinAbs(0.0f, 0.0001f));
    }

    SECTION("segment piercing the face has zero distance") {
        Segment s(glm::vec3(0.25f, -0.5f, 0.25f), glm::vec3(0.25f, 0.5f, 0.25f));
        glm::vec3 hit;
        REQUIRE(tri.intersectsSegment(s, hit));
        REQUIRE_THAT(tri.closestPointToSegment(s, onTri, onSeg), WithinAbs(0.0f, 0.0001f));
        REQUIRE_THAT(hit.y, WithinAbs(0.0f, 0.0001f));
    }

    SECTION("horizontal segment past an edge uses the edge") {
        Segment s(glm::vec3(-0.5f, 0.2f, 0.5f), glm::vec3(-0.5f, 0.2f, -0.5f));
        float d = tri.closestPointToSegment(s, onTri, onSeg);
        REQUIRE_THAT(d, WithinAbs(std::sqrt(0.5f * 0.5f + 0.2f * 0.2f), 0.0001f));
        REQUIRE_THAT(onTri.x, WithinAbs(0.0f, 0.0001f));
    }
}
