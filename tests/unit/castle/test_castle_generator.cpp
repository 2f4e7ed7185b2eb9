/**
 * @file test_castle_generator.cpp
 * @brief Unit tests for castle generation
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <vitrail/castle/castle_generator.h>
#include <glm/gtc/constants.hpp>
#include <cmath>
#include <memory>

using namespace vitrail::castle;
using namespace vitrail::render3d;
using Catch::Matchers::WithinAbs;

namespace {

struct GlassSet {
    std::vector<std::unique_ptr<Material>> owned;

    explicit GlassSet(const std::vector<float>& aspects) {
        for (float a : aspects) {
            auto m = std::make_unique<Material>("glass");
            m->transparent(true).transmission(1.0f).aspectRatio(a);
            owned.push_back(std::move(m));
        }
    }

    std::vector<Material*> pointers() const {
        std::vector<Material*> out;
        for (const auto& m : owned) out.push_back(m.get());
        return out;
    }
};

CastleParams paramsWithSlots(int slots, int seed = 12345) {
    CastleParams p;
    p.windowSlots = slots;
    p.seed = seed;
    return p;
}

float angleOf(const Node& node) {
    float a = std::atan2(node.position.z, node.position.x);
    return a < 0.0f ? a + glm::two_pi<float>() : a;
}

int countMeshes(const Node& root) {
    int count = 0;
    root.traverse([&count](const Node& n) {
        if (n.asRenderable()) ++count;
    });
    return count;
}

} // namespace

TEST_CASE("CastleGenerator builds one segment and pillar per slot", "[castle][generator]") {
    Scene scene;
    CastleGenerator castle;

    for (int n : {0, 1, 3, 4, 6}) {
        GlassSet glass(std::vector<float>(n, 1.0f));
        CastleResult result = castle.generate(scene, glass.pointers(), paramsWithSlots(n));

        REQUIRE(result.windowCount == n);
        REQUIRE(castle.walls().size() == static_cast<size_t>(n));
        REQUIRE(castle.pillars().size() == static_cast<size_t>(n));

        for (int i = 0; i < n; ++i) {
            float step = glm::two_pi<float>() / n;
            REQUIRE_THAT(angleOf(*castle.walls()[i]), WithinAbs(step * i, 0.0001f));
            // Pillars sit halfway between neighbouring segments
            REQUIRE_THAT(angleOf(*castle.pillars()[i]), WithinAbs(step * (i + 0.5f), 0.0001f));
        }
    }
}

TEST_CASE("CastleGenerator output is deterministic", "[castle][generator]") {
    GlassSet glass({1.0f, 2.0f, 0.5f, 1.3f, 0.8f});
    CastleParams params = paramsWithSlots(5, 4242);

    Scene sceneA;
    Scene sceneB;
    CastleGenerator a;
    CastleGenerator b;
    a.generate(sceneA, glass.pointers(), params);
    b.generate(sceneB, glass.pointers(), params);

    std::vector<glm::mat4> worldA;
    std::vector<glm::mat4> worldB;
    sceneA.traverse([&worldA](const Node& n) { worldA.push_back(n.worldMatrix()); });
    sceneB.traverse([&worldB](const Node& n) { worldB.push_back(n.worldMatrix()); });

    REQUIRE(worldA.size() == worldB.size());
    for (size_t i = 0; i < worldA.size(); ++i) {
        REQUIRE(worldA[i] == worldB[i]);
    }

    SECTION("stone tint is reproducible too") {
        const auto* meshA = static_cast<const MeshNode&>(*a.walls()[0]->children()[0]).geometry();
        const auto* meshB = static_cast<const MeshNode&>(*b.walls()[0]->children()[0]).geometry();
        REQUIRE(meshA->vertices[0].color == meshB->vertices[0].color);
    }
}

TEST_CASE("CastleGenerator sizes windows from material aspect", "[castle][generator]") {
    Scene scene;
    CastleGenerator castle;
    GlassSet glass({2.0f, 0.5f, 1.0f});
    castle.generate(scene, glass.pointers(), paramsWithSlots(3));

    const auto& windows = castle.windows();
    REQUIRE(windows[0].width > windows[0].height);
    REQUIRE(windows[1].height > windows[1].width);
    REQUIRE_THAT(windows[2].width, WithinAbs(windows[2].height, 0.0001f));

    SECTION("glass panes match their window size") {
        Box3 pane = castle.windowMeshes()[0]->geometry()->bounds();
        REQUIRE_THAT(pane.size().x, WithinAbs(windows[0].width, 0.0001f));
        REQUIRE_THAT(pane.size().y, WithinAbs(windows[0].height, 0.0001f));
    }
}

TEST_CASE("CastleGenerator glass panes", "[castle][generator]") {
    Scene scene;
    CastleGenerator castle;
    GlassSet glass({1.0f, 1.0f, 1.0f, 1.0f});
    CastleResult result = castle.generate(scene, glass.pointers(), paramsWithSlots(4));

    SECTION("one pane per material plus the skylight last") {
        REQUIRE(result.windowMeshes.size() == 5);
        const MeshNode* skylight = result.windowMeshes.back();
        REQUIRE(skylight->material() == glass.owned[0].get());
        REQUIRE_THAT(skylight->position.y, WithinAbs(0.9f * 0.8f, 0.0001f));
    }

    SECTION("panes sit just outside the wall, in the volumetric layer") {
        float ring = 1.2f;
        float offset = 0.096f * 0.5f + 0.001f;
        for (int i = 0; i < 4; ++i) {
            const MeshNode* pane = result.windowMeshes[i];
            glm::vec3 p = pane->position;
            REQUIRE_THAT(std::sqrt(p.x * p.x + p.z * p.z), WithinAbs(ring + offset, 0.0001f));
            REQUIRE_THAT(p.y, WithinAbs(0.45f, 0.0001f));
            REQUIRE(pane->hasLayer(LAYER_VOLUMETRIC_LIGHTING));
            REQUIRE(pane->castShadow);
            REQUIRE(pane->receiveShadow);
            REQUIRE_FALSE(pane->isCollidable());
        }
    }

    SECTION("missing materials leave the opening without glass") {
        Scene other;
        CastleGenerator sparse;
        std::vector<Material*> partial = {glass.owned[0].get(), nullptr, glass.owned[2].get()};
        CastleResult r = sparse.generate(other, partial, paramsWithSlots(4));

        REQUIRE(r.windowCount == 4);
        REQUIRE(sparse.walls().size() == 4);
        // Two panes and the skylight
        REQUIRE(r.windowMeshes.size() == 3);
    }
}

TEST_CASE("CastleGenerator with no materials still builds the ring", "[castle][generator]") {
    Scene scene;
    CastleGenerator castle;

    SECTION("zero slots leave only base and floor") {
        CastleResult r = castle.generate(scene, {}, paramsWithSlots(0));
        REQUIRE(r.windowCount == 0);
        REQUIRE(r.windowMeshes.empty());
        REQUIRE(countMeshes(*r.group) == 2);
    }

    SECTION("slots without materials have walls but no glass or skylight") {
        CastleResult r = castle.generate(scene, {}, paramsWithSlots(3));
        REQUIRE(r.windowCount == 3);
        REQUIRE(castle.walls().size() == 3);
        REQUIRE(r.windowMeshes.empty());
    }
}

TEST_CASE("CastleGenerator replaces its previous castle", "[castle][generator]") {
    Scene scene;
    CastleGenerator castle;
    GlassSet glass({1.0f, 1.0f, 1.0f, 1.0f});

    CastleResult first = castle.generate(scene, glass.pointers(), paramsWithSlots(4));
    std::shared_ptr<Mesh> firstPane = first.windowMeshes[0]->sharedGeometry();
    std::shared_ptr<Mesh> firstStone =
        static_cast<const MeshNode&>(*castle.walls()[0]->children()[0]).sharedGeometry();

    CastleResult second = castle.generate(scene, glass.pointers(), paramsWithSlots(4));

    REQUIRE(scene.children().size() == 1);
    REQUIRE(scene.children()[0].get() == second.group);
    REQUIRE(firstPane->disposed());
    REQUIRE(firstStone->disposed());
    REQUIRE_FALSE(second.windowMeshes[0]->geometry()->disposed());

    SECTION("clear detaches the castle") {
        castle.clear();
        REQUIRE(scene.children().empty());
        REQUIRE(castle.group() == nullptr);
        REQUIRE(castle.windowMeshes().empty());
    }
}

TEST_CASE("CastleGenerator takes its castle with it when destroyed", "[castle][generator]") {
    Scene scene;
    scene.add<Group>("lights");
    GlassSet glass({1.0f, 1.0f, 1.0f, 1.0f});
    std::shared_ptr<Mesh> stone;

    {
        CastleGenerator castle;
        castle.generate(scene, glass.pointers(), paramsWithSlots(4));
        REQUIRE(scene.children().size() == 2);
        stone = static_cast<const MeshNode&>(*castle.walls()[0]->children()[0]).sharedGeometry();
    }

    // Only the caller's own node is left, and nothing references the
    // generator's materials any more
    REQUIRE(scene.children().size() == 1);
    REQUIRE(scene.children()[0]->name == "lights");
    REQUIRE(stone->disposed());

    int renderables = 0;
    scene.traverse([&renderables](Node& node) {
        if (node.asRenderable()) ++renderables;
    });
    REQUIRE(renderables == 0);
}

TEST_CASE("CastleGenerator regenerate and material swaps", "[castle][generator]") {
    Scene scene;
    CastleGenerator castle;
    GlassSet glass({1.0f, 1.0f});
    GlassSet other({1.0f, 1.0f});

    SECTION("regenerate before generate does nothing") {
        REQUIRE_FALSE(castle.regenerate(glass.pointers()).has_value());
        REQUIRE(scene.children().empty());
    }

    SECTION("regenerate reuses the last scene and live params") {
        castle.generate(scene, glass.pointers(), paramsWithSlots(2));
        castle.params().windowSlots = 3;

        auto result = castle.regenerate(glass.pointers());
        REQUIRE(result.has_value());
        REQUIRE(result->windowCount == 3);
        REQUIRE(scene.children().size() == 1);
    }

    SECTION("updateWindowMaterials swaps without rebuilding") {
        CastleResult r = castle.generate(scene, glass.pointers(), paramsWithSlots(2));
        const Mesh* geometry = r.windowMeshes[1]->geometry();

        castle.updateWindowMaterials({nullptr, other.owned[1].get()});

        REQUIRE(r.windowMeshes[0]->material() == glass.owned[0].get());
        REQUIRE(r.windowMeshes[1]->material() == other.owned[1].get());
        REQUIRE(r.windowMeshes[1]->geometry() == geometry);
        REQUIRE(castle.group() == r.group);
    }
}

TEST_CASE("CastleGenerator wall pieces", "[castle][generator]") {
    Scene scene;
    CastleGenerator castle;
    GlassSet glass({1.0f});

    SECTION("slab walls have bottom, top, sides, arch and sill") {
        castle.generate(scene, glass.pointers(), paramsWithSlots(1));
        REQUIRE(castle.walls()[0]->children().size() == 6);
    }

    SECTION("thin slabs are skipped") {
        // Scaled wall height 0.3 puts the 0.4 window past both wall edges
        CastleParams p = paramsWithSlots(1);
        p.wallHeight = 0.2f;
        castle.generate(scene, glass.pointers(), p);
        REQUIRE(castle.walls()[0]->children().size() == 4);
    }

    SECTION("carved walls are one solid plus arch and sill") {
        CastleParams p = paramsWithSlots(1);
        p.carvedWalls = true;
        castle.generate(scene, glass.pointers(), p);
        REQUIRE(castle.walls()[0]->children().size() == 3);
        const Mesh* body = static_cast<const MeshNode&>(*castle.walls()[0]->children()[0]).geometry();
        REQUIRE(body->triangleCount() > 12);
    }

    SECTION("stone pieces use the shared stone material and collide") {
        castle.generate(scene, glass.pointers(), paramsWithSlots(1));
        for (const auto& piece : castle.walls()[0]->children()) {
            const auto& mesh = static_cast<const MeshNode&>(*piece);
            REQUIRE(mesh.material() == &castle.stoneMaterial());
            REQUIRE(mesh.isCollidable());
        }
    }
}
