/**
 * @file test_player_controller.cpp
 * @brief Unit tests for PlayerController movement, input and collision
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <vitrail/render3d/material.h>
#include <vitrail/render3d/mesh_builder.h>
#include <vitrail/walk/player_controller.h>
#include <glm/gtc/constants.hpp>
#include <cmath>
#include <memory>

using namespace vitrail;
using namespace vitrail::render3d;
using namespace vitrail::walk;
using Catch::Matchers::WithinAbs;

namespace {

constexpr float kDt = 1.0f / 60.0f;

struct World {
    Scene scene;
    Camera3D camera;
    InputTarget input;
    Material stone{"stone"};

    World() {
        camera.lookAt(glm::vec3(0, 0.8f, 2), glm::vec3(0, 0.8f, 0));
    }

    MeshNode& addFloor() {
        MeshNode& floor = scene.add<MeshNode>(MeshBuilder::plane(20.0f, 20.0f).build(), &stone, "floor");
        return floor;
    }

    void press(Key key) { input.dispatchKey({key, KeyAction::Down}); }
    void release(Key key) { input.dispatchKey({key, KeyAction::Up}); }
};

void settle(PlayerController& player, int ticks = 10) {
    for (int i = 0; i < ticks; ++i) {
        player.update(kDt);
    }
}

} // namespace

TEST_CASE("PlayerController starts at the configured position", "[walk][player]") {
    World w;
    PlayerController player(w.camera, w.input, w.scene);

    REQUIRE_THAT(player.getPosition().y, WithinAbs(0.8f, 0.0001f));
    REQUIRE_THAT(player.getPosition().z, WithinAbs(2.0f, 0.0001f));
    REQUIRE_THAT(w.camera.getPosition().z, WithinAbs(2.0f, 0.0001f));
    REQUIRE_FALSE(player.enabled());
    REQUIRE_FALSE(player.onGround());
    REQUIRE(w.input.listenerCount() == 4);
}

TEST_CASE("PlayerController is frozen until the pointer is locked", "[walk][player]") {
    World w;
    PlayerController player(w.camera, w.input, w.scene);
    player.setPosition(glm::vec3(0, 2, 0));

    settle(player, 30);
    REQUIRE_THAT(player.getPosition().y, WithinAbs(2.0f, 0.0001f));

    w.press(Key::W);
    player.lock();
    REQUIRE(player.isLocked());
    REQUIRE(player.enabled());

    // The key went down while disabled, so it was ignored
    settle(player, 1);
    REQUIRE_THAT(player.getPosition().z, WithinAbs(0.0f, 0.0001f));
}

TEST_CASE("PlayerController falls onto a floor and rests at standing height", "[walk][player]") {
    World w;
    w.addFloor();
    PlayerController player(w.camera, w.input, w.scene);
    player.buildCollisionFromScene();
    REQUIRE(player.colliders().size() == 1);

    player.setPosition(glm::vec3(0, 2, 0));
    player.lock();

    settle(player, 180);

    REQUIRE_THAT(player.getPosition().y, WithinAbs(0.8f, 0.0001f));
    REQUIRE(player.onGround());
    REQUIRE_THAT(player.velocity().y, WithinAbs(0.0f, 0.0001f));
    REQUIRE_THAT(w.camera.getPosition().y, WithinAbs(0.8f, 0.0001f));
}

TEST_CASE("PlayerController movement keys", "[walk][player]") {
    World w;
    PlayerController player(w.camera, w.input, w.scene);
    player.lock();
    settle(player);
    glm::vec3 start = player.getPosition();

    SECTION("forward follows the camera's horizontal heading") {
        w.press(Key::W);
        settle(player, 60);
        glm::vec3 moved = player.getPosition() - start;
        REQUIRE_THAT(moved.z, WithinAbs(-2.0f, 0.001f));
        REQUIRE_THAT(moved.x, WithinAbs(0.0f, 0.001f));
    }

    SECTION("looking down does not change altitude") {
        w.camera.lookAt(w.camera.getPosition(), w.camera.getPosition() + glm::vec3(0, -1, -1));
        w.press(Key::Up);
        settle(player, 30);
        REQUIRE_THAT(player.getPosition().y, WithinAbs(0.8f, 0.0001f));
        REQUIRE(player.getPosition().z < start.z);
    }

    SECTION("left and right strafe in opposite directions") {
        w.press(Key::A);
        settle(player, 30);
        float left = player.getPosition().x - start.x;
        w.release(Key::A);
        w.press(Key::D);
        settle(player, 60);
        float right = player.getPosition().x - start.x;
        REQUIRE(left < 0.0f);
        REQUIRE(right > 0.0f);
    }

    SECTION("diagonal input moves no faster than a single key") {
        w.press(Key::W);
        w.press(Key::D);
        settle(player, 60);
        glm::vec3 moved = player.getPosition() - start;
        moved.y = 0.0f;
        REQUIRE_THAT(glm::length(moved), WithinAbs(2.0f, 0.001f));
    }

    SECTION("backward cancels forward") {
        w.press(Key::W);
        w.press(Key::S);
        settle(player, 30);
        REQUIRE_THAT(player.getPosition().z, WithinAbs(start.z, 0.0001f));
    }
}

TEST_CASE("PlayerController jumping", "[walk][player]") {
    World w;
    PlayerController player(w.camera, w.input, w.scene);
    player.lock();
    settle(player);
    REQUIRE(player.onGround());

    w.press(Key::Space);
    REQUIRE_FALSE(player.onGround());
    REQUIRE_THAT(player.velocity().y, WithinAbs(4.0f, 0.0001f));

    SECTION("no double jump while airborne") {
        player.update(kDt);
        float vy = player.velocity().y;
        w.press(Key::Space);
        REQUIRE_THAT(player.velocity().y, WithinAbs(vy, 0.0001f));
    }

    SECTION("rises then lands again") {
        settle(player, 10);
        REQUIRE(player.getPosition().y > 0.8f);
        settle(player, 120);
        REQUIRE(player.onGround());
        REQUIRE_THAT(player.getPosition().y, WithinAbs(0.8f, 0.0001f));
    }
}

TEST_CASE("PlayerController lock state clears held keys", "[walk][player]") {
    World w;
    PlayerController player(w.camera, w.input, w.scene);
    player.lock();
    settle(player);

    SECTION("unlock stops movement") {
        w.press(Key::W);
        player.unlock();
        REQUIRE_FALSE(player.isLocked());
        REQUIRE_FALSE(player.enabled());

        player.lock();
        glm::vec3 before = player.getPosition();
        settle(player, 30);
        REQUIRE_THAT(player.getPosition().z, WithinAbs(before.z, 0.0001f));
    }

    SECTION("losing the lock externally also clears keys") {
        w.press(Key::D);
        w.input.exitPointerLock();
        REQUIRE_FALSE(player.enabled());

        w.input.requestPointerLock();
        glm::vec3 before = player.getPosition();
        settle(player, 30);
        REQUIRE_THAT(player.getPosition().x, WithinAbs(before.x, 0.0001f));
    }

    SECTION("key-up is honoured while disabled") {
        w.press(Key::W);
        player.unlock();
        w.release(Key::W);
        player.lock();
        glm::vec3 before = player.getPosition();
        settle(player, 30);
        REQUIRE_THAT(player.getPosition().z, WithinAbs(before.z, 0.0001f));
    }
}

TEST_CASE("PlayerController collision source filtering", "[walk][player]") {
    World w;
    Material glass("glass");
    glass.transparent(true);
    Material filter("filter");
    filter.transmission(0.8f);

    MeshNode& floor = w.addFloor();
    MeshNode& pane = w.scene.add<MeshNode>(MeshBuilder::box(1, 1, 0.05f).build(), &glass, "pane");
    w.scene.add<MeshNode>(MeshBuilder::box(1, 1, 0.05f).build(), &filter, "filter");
    w.scene.add<MeshNode>(MeshBuilder::box(0.02f, 0.02f, 0.02f).build(), &w.stone, "pebble");
    w.scene.add<Group>("empty");

    PlayerController player(w.camera, w.input, w.scene);
    player.buildCollisionFromScene();

    REQUIRE(player.colliders().size() == 1);
    REQUIRE(player.colliders()[0].source == &floor);

    SECTION("colliders are baked into world space") {
        Scene moved;
        MeshNode& raised = moved.add<MeshNode>(MeshBuilder::plane(2, 2).build(), &w.stone, "raised");
        raised.position.y = 3.0f;
        PlayerController other(w.camera, w.input, moved);
        other.buildCollisionFromScene();
        REQUIRE_THAT(other.colliders()[0].bvh->bounds().min.y, WithinAbs(3.0f, 0.0001f));
    }

    SECTION("rebuilding replaces the previous list") {
        player.buildCollisionFromScene();
        REQUIRE(player.colliders().size() == 1);
    }

    SECTION("addCollider skips the filters") {
        REQUIRE(player.addCollider(pane));
        REQUIRE(player.colliders().size() == 2);
    }

    SECTION("addCollider reports meshes without geometry") {
        MeshNode bare(std::shared_ptr<Mesh>(), &w.stone);
        REQUIRE_FALSE(player.addCollider(bare));
    }

    SECTION("addCollider propagates hierarchy errors") {
        MeshNode broken(Mesh(), &w.stone, "broken");
        REQUIRE_THROWS_AS(player.addCollider(broken), BVHBuildError);
    }
}

TEST_CASE("PlayerController skips meshes whose hierarchy fails", "[walk][player]") {
    World w;
    w.addFloor();
    auto bad = std::make_shared<Mesh>(MeshBuilder::box(1, 1, 1).build());
    bad->indices.pop_back();
    w.scene.add<MeshNode>(bad, &w.stone, "bad");

    PlayerController player(w.camera, w.input, w.scene);
    REQUIRE_NOTHROW(player.buildCollisionFromScene());
    REQUIRE(player.colliders().size() == 1);
}

TEST_CASE("PlayerController walls stop the player", "[walk][player]") {
    World w;
    w.addFloor();
    MeshNode& wall = w.scene.add<MeshNode>(MeshBuilder::box(4.0f, 2.0f, 0.1f).build(), &w.stone, "wall");
    wall.position = glm::vec3(0.0f, 1.0f, 1.0f);

    PlayerController player(w.camera, w.input, w.scene);
    player.buildCollisionFromScene();
    player.lock();
    settle(player);

    w.press(Key::W);
    settle(player, 120);

    // Wall face at z = 1.05; the spine stays a radius away
    REQUIRE(player.getPosition().z > 1.05f + 0.14f);
}

TEST_CASE("PlayerController dispose is idempotent", "[walk][player]") {
    World w;
    w.addFloor();
    auto player = std::make_unique<PlayerController>(w.camera, w.input, w.scene);
    player->buildCollisionFromScene();
    REQUIRE(w.input.listenerCount() == 4);

    REQUIRE_NOTHROW(player->dispose());
    REQUIRE_NOTHROW(player->dispose());

    REQUIRE(w.input.listenerCount() == 0);
    REQUIRE(player->colliders().empty());

    // Events after disposal reach nobody
    w.input.requestPointerLock();
    REQUIRE_FALSE(player->enabled());

    player.reset();
    REQUIRE(w.input.listenerCount() == 0);
}

TEST_CASE("PlayerSettings JSON mapping", "[walk][player]") {
    PlayerSettings s;
    fromJson(json{{"moveSpeed", 3.5}, {"gravity", 100.0}, {"startZ", -4.0}}, s);

    REQUIRE_THAT(s.moveSpeed.get(), WithinAbs(3.5f, 0.0001f));
    REQUIRE_THAT(s.gravity.get(), WithinAbs(50.0f, 0.0001f));
    REQUIRE_THAT(s.startPosition().z, WithinAbs(-4.0f, 0.0001f));

    json out = toJson(s);
    REQUIRE(out.size() == 9);
    REQUIRE(out["playerHeight"] == 0.8f);
}

TEST_CASE("PlayerController leaves the ground when geometry lifts it", "[walk][player]") {
    World w;
    w.addFloor();
    PlayerController player(w.camera, w.input, w.scene);
    player.buildCollisionFromScene();
    player.lock();
    settle(player);
    REQUIRE(player.onGround());

    // A ledge just under the capsule's lower sphere
    MeshNode& ledge = w.scene.add<MeshNode>(MeshBuilder::plane(4.0f, 4.0f).build(), &w.stone, "ledge");
    ledge.position = glm::vec3(0.0f, 0.7f, 2.0f);
    REQUIRE(player.addCollider(ledge));

    player.update(kDt);
    REQUIRE(player.getPosition().y > 0.81f);
    REQUIRE_FALSE(player.onGround());

    // No jumping from mid-air
    float vy = player.velocity().y;
    w.press(Key::Space);
    REQUIRE_THAT(player.velocity().y, WithinAbs(vy, 0.0001f));
    REQUIRE(player.velocity().y < 4.0f);
}

TEST_CASE("PlayerController pointer motion turns the view", "[walk][player]") {
    World w;
    PlayerController player(w.camera, w.input, w.scene);

    SECTION("ignored until the pointer is locked") {
        w.input.dispatchPointerMove({100.0f, 0.0f});
        REQUIRE_THAT(w.camera.forward().x, WithinAbs(0.0f, 0.0001f));
        REQUIRE_THAT(w.camera.forward().z, WithinAbs(-1.0f, 0.0001f));
    }

    SECTION("moving right turns right") {
        player.lock();
        w.input.dispatchPointerMove({100.0f, 0.0f});

        REQUIRE_THAT(w.camera.yaw(), WithinAbs(-0.2f, 0.0001f));
        REQUIRE(w.camera.forward().x > 0.0f);

        settle(player);
        glm::vec3 start = player.getPosition();
        w.press(Key::W);
        settle(player, 30);
        glm::vec3 moved = player.getPosition() - start;
        REQUIRE_THAT(moved.x / glm::length(moved), WithinAbs(std::sin(0.2f), 0.001f));
    }

    SECTION("moving down looks down without changing walking speed") {
        player.lock();
        w.input.dispatchPointerMove({0.0f, 200.0f});
        REQUIRE_THAT(w.camera.pitch(), WithinAbs(-0.4f, 0.0001f));

        settle(player);
        glm::vec3 start = player.getPosition();
        w.press(Key::W);
        settle(player, 60);
        REQUIRE_THAT(player.getPosition().z - start.z, WithinAbs(-2.0f, 0.001f));
        REQUIRE_THAT(player.getPosition().y, WithinAbs(0.8f, 0.0001f));
    }

    SECTION("pitch stops short of straight down") {
        player.lock();
        w.input.dispatchPointerMove({0.0f, 10000.0f});
        REQUIRE(w.camera.pitch() > -glm::half_pi<float>());
        REQUIRE(std::abs(w.camera.forward().z) > 0.0f);
    }
}
