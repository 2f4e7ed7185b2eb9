#pragma once

/**
 * @file player_controller.h
 * @brief First-person walking with capsule collision against the scene
 *
 * The controller owns the player's position and velocity; the camera only
 * follows. Movement is gated by pointer lock on the input target: while the
 * pointer is not locked, update() does nothing and movement keys are ignored.
 * Pointer motion while locked turns the camera (yaw and pitch); walking only
 * uses the horizontal part of the view direction.
 *
 * Collision uses a capsule whose spine starts at the eye position and rises
 * by playerHeight - 2 * playerRadius. Solid scene meshes are cloned into
 * world space once by buildCollisionFromScene() and indexed with a MeshBVH;
 * glass and other light-passing meshes are left out so the player can only
 * see through them, and very small meshes are skipped.
 *
 * @par Example
 * @code
 * PlayerController player(camera, input, scene);
 * player.buildCollisionFromScene();
 * player.lock();
 *
 * // Every frame
 * player.update(dt);
 * @endcode
 *
 * The camera, input target and scene must outlive the controller.
 */

#include <vitrail/config.h>
#include <vitrail/input.h>
#include <vitrail/param.h>
#include <vitrail/render3d/camera.h>
#include <vitrail/render3d/scene.h>
#include <vitrail/walk/capsule.h>
#include <vitrail/walk/mesh_bvh.h>
#include <glm/glm.hpp>
#include <memory>
#include <vector>

namespace vitrail::walk {

struct PlayerSettings {
    Param<float> playerHeight{"playerHeight", 0.8f, 0.2f, 3.0f};
    Param<float> playerRadius{"playerRadius", 0.15f, 0.02f, 1.0f};
    Param<float> moveSpeed{"moveSpeed", 2.0f, 0.0f, 20.0f};
    Param<float> gravity{"gravity", 9.8f, 0.0f, 50.0f};
    Param<float> jumpSpeed{"jumpSpeed", 4.0f, 0.0f, 20.0f};

    /// Radians of turn per pixel of pointer motion
    Param<float> lookSpeed{"lookSpeed", 0.002f, 0.0f, 0.02f};

    /// Meshes whose world bounding box diagonal is below this are not solid
    Param<float> minColliderSize{"minColliderSize", 0.05f, 0.0f, 1.0f};

    /// Horizontal start position; the start height is playerHeight
    Param<float> startX{"startX", 0.0f, -50.0f, 50.0f};
    Param<float> startZ{"startZ", 2.0f, -50.0f, 50.0f};

    glm::vec3 startPosition() const { return glm::vec3(startX.get(), playerHeight.get(), startZ.get()); }
};

json toJson(const PlayerSettings& settings);
void fromJson(const json& obj, PlayerSettings& settings);

/// World-space copy of a solid mesh
struct Collider {
    const render3d::Renderable* source = nullptr;
    std::unique_ptr<render3d::Mesh> geometry;
    std::unique_ptr<MeshBVH> bvh;
};

class PlayerController {
public:
    PlayerController(render3d::Camera3D& camera, InputTarget& input, render3d::Node& scene,
                     PlayerSettings settings = {});
    ~PlayerController();

    PlayerController(const PlayerController&) = delete;
    PlayerController& operator=(const PlayerController&) = delete;

    // -------------------------------------------------------------------------
    /// @name Simulation
    /// @{

    /// Advance one frame: gravity, held-key movement, collision, camera follow
    void update(float dt);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Collision
    /// @{

    /**
     * @brief Replace the collider list with every solid mesh in the scene
     *
     * A mesh whose hierarchy fails to build is skipped with a warning.
     */
    void buildCollisionFromScene();

    /**
     * @brief Add one mesh as a collider, without the glass and size filters
     * @return false if the mesh has no geometry
     * @throws BVHBuildError if the geometry cannot be indexed
     */
    bool addCollider(const render3d::Renderable& mesh);

    const std::vector<Collider>& colliders() const { return m_colliders; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Pointer Lock
    /// @{

    /// Ask the input target for pointer lock; movement starts once it is granted
    void lock();

    /// Release pointer lock and drop every held movement key
    void unlock();

    bool isLocked() const { return m_input.isPointerLocked(); }

    /// @}
    // -------------------------------------------------------------------------
    /// @name State
    /// @{

    glm::vec3 getPosition() const { return m_position; }

    /// Place the player (and camera) without touching velocity
    void setPosition(glm::vec3 position);

    glm::vec3 velocity() const { return m_velocity; }
    bool onGround() const { return m_onGround; }
    bool enabled() const { return m_enabled; }

    PlayerSettings& settings() { return m_settings; }
    const PlayerSettings& settings() const { return m_settings; }

    /// @}

    /**
     * @brief Detach input listeners and release collider geometry
     *
     * Safe to call more than once; also run by the destructor.
     */
    void dispose();

private:
    struct Keys {
        bool forward = false;
        bool backward = false;
        bool left = false;
        bool right = false;
    };

    void handleKeyDown(const KeyEvent& event);
    void handleKeyUp(const KeyEvent& event);
    void handlePointerMove(const PointerMoveEvent& event);
    void handlePointerLock(bool locked);
    void resolveCollisions();
    void releaseColliders();

    render3d::Camera3D& m_camera;
    InputTarget& m_input;
    render3d::Node& m_scene;
    PlayerSettings m_settings;

    glm::vec3 m_position;
    glm::vec3 m_velocity = glm::vec3(0.0f);
    bool m_onGround = false;
    bool m_enabled = false;
    Keys m_keys;

    std::vector<Collider> m_colliders;
    std::vector<ListenerId> m_listeners;
    bool m_disposed = false;
};

} // namespace vitrail::walk
