#include <vitrail/walk/player_controller.h>
#include <cmath>
#include <iostream>
#include <utility>

namespace vitrail::walk {

using render3d::Mesh;
using render3d::Node;
using render3d::Renderable;

namespace {

// Resting tolerance above standing height that still counts as grounded
constexpr float kGroundTolerance = 0.01f;

template<typename S, typename Fn>
void forEachSetting(S& s, Fn&& fn) {
    fn(s.playerHeight);
    fn(s.playerRadius);
    fn(s.moveSpeed);
    fn(s.gravity);
    fn(s.jumpSpeed);
    fn(s.lookSpeed);
    fn(s.minColliderSize);
    fn(s.startX);
    fn(s.startZ);
}

Collider makeCollider(const Renderable& source) {
    Collider collider;
    collider.source = &source;
    collider.geometry = std::make_unique<Mesh>(source.geometry()->clone());
    collider.geometry->applyMatrix(source.worldTransform());
    collider.bvh = std::make_unique<MeshBVH>(*collider.geometry);
    return collider;
}

} // anonymous namespace

json toJson(const PlayerSettings& settings) {
    json obj = json::object();
    forEachSetting(settings, [&obj](const auto& p) { writeParam(obj, p); });
    return obj;
}

void fromJson(const json& obj, PlayerSettings& settings) {
    if (!obj.is_object()) return;
    forEachSetting(settings, [&obj](auto& p) { readParam(obj, p); });
}

// -----------------------------------------------------------------------------
// Lifecycle
// -----------------------------------------------------------------------------

PlayerController::PlayerController(render3d::Camera3D& camera, InputTarget& input,
                                   Node& scene, PlayerSettings settings)
    : m_camera(camera)
    , m_input(input)
    , m_scene(scene)
    , m_settings(std::move(settings))
    , m_position(m_settings.startPosition())
{
    m_camera.moveTo(m_position);

    m_listeners.push_back(m_input.onKeyDown([this](const KeyEvent& e) { handleKeyDown(e); }));
    m_listeners.push_back(m_input.onKeyUp([this](const KeyEvent& e) { handleKeyUp(e); }));
    m_listeners.push_back(m_input.onPointerMove([this](const PointerMoveEvent& e) { handlePointerMove(e); }));
    m_listeners.push_back(m_input.onPointerLockChange([this](bool locked) { handlePointerLock(locked); }));
}

PlayerController::~PlayerController() {
    dispose();
}

void PlayerController::dispose() {
    if (m_disposed) return;
    m_disposed = true;

    for (ListenerId id : m_listeners) {
        m_input.removeListener(id);
    }
    m_listeners.clear();

    releaseColliders();
    m_enabled = false;
    m_keys = Keys{};
}

// -----------------------------------------------------------------------------
// Input
// -----------------------------------------------------------------------------

void PlayerController::handleKeyDown(const KeyEvent& event) {
    if (!m_enabled) return;

    switch (event.key) {
        case Key::W:
        case Key::Up:
            m_keys.forward = true;
            break;
        case Key::S:
        case Key::Down:
            m_keys.backward = true;
            break;
        case Key::A:
        case Key::Left:
            m_keys.left = true;
            break;
        case Key::D:
        case Key::Right:
            m_keys.right = true;
            break;
        case Key::Space:
            if (m_onGround) {
                m_velocity.y = m_settings.jumpSpeed;
                m_onGround = false;
            }
            break;
        default:
            break;
    }
}

void PlayerController::handleKeyUp(const KeyEvent& event) {
    switch (event.key) {
        case Key::W:
        case Key::Up:
            m_keys.forward = false;
            break;
        case Key::S:
        case Key::Down:
            m_keys.backward = false;
            break;
        case Key::A:
        case Key::Left:
            m_keys.left = false;
            break;
        case Key::D:
        case Key::Right:
            m_keys.right = false;
            break;
        default:
            break;
    }
}

void PlayerController::handlePointerMove(const PointerMoveEvent& event) {
    if (!m_enabled) return;

    const float speed = m_settings.lookSpeed;
    m_camera.look(m_camera.yaw() - event.dx * speed,
                  m_camera.pitch() - event.dy * speed);
}

void PlayerController::handlePointerLock(bool locked) {
    m_enabled = locked;
    if (!locked) {
        m_keys = Keys{};
    }
}

void PlayerController::lock() {
    m_input.requestPointerLock();
}

void PlayerController::unlock() {
    m_input.exitPointerLock();
    m_enabled = false;
    m_keys = Keys{};
}

// -----------------------------------------------------------------------------
// Simulation
// -----------------------------------------------------------------------------

void PlayerController::setPosition(glm::vec3 position) {
    m_position = position;
    m_camera.moveTo(m_position);
}

void PlayerController::update(float dt) {
    if (!m_enabled) return;

    m_velocity.y -= m_settings.gravity * dt;

    // Horizontal basis from the camera; looking up or down never changes altitude
    glm::vec3 front = m_camera.forward();
    front.y = 0.0f;
    glm::vec3 direction(0.0f);
    if (glm::length(front) > 1e-6f) {
        front = glm::normalize(front);
        glm::vec3 side = glm::normalize(glm::cross(m_camera.getUp(), front));

        if (m_keys.forward) direction += front;
        if (m_keys.backward) direction -= front;
        if (m_keys.left) direction += side;
        if (m_keys.right) direction -= side;
    }

    if (glm::length(direction) > 0.0f) {
        direction = glm::normalize(direction);
        m_position += direction * (m_settings.moveSpeed * dt);
    }

    m_position.y += m_velocity.y * dt;

    resolveCollisions();

    m_camera.moveTo(m_position);
}

void PlayerController::resolveCollisions() {
    const float height = m_settings.playerHeight;
    const float radius = m_settings.playerRadius;

    // Spine in player-local space, anchored at the eye
    const glm::vec3 localStart(0.0f);
    const glm::vec3 localEnd(0.0f, height - radius * 2.0f, 0.0f);

    CapsuleSegment capsule(localStart + m_position, localEnd + m_position, radius);
    for (const Collider& collider : m_colliders) {
        if (!collider.bvh) continue;
        capsule = resolveAgainst(capsule, *collider.bvh).capsule;
    }

    m_position = capsule.start() - localStart;

    if (m_position.y < height + kGroundTolerance) {
        m_position.y = height;
        if (m_velocity.y < 0.0f) {
            m_velocity.y = 0.0f;
            m_onGround = true;
        }
    } else {
        // Lifted by a jump or pushed up by geometry
        m_onGround = false;
    }
}

// -----------------------------------------------------------------------------
// Collision
// -----------------------------------------------------------------------------

void PlayerController::buildCollisionFromScene() {
    releaseColliders();

    const float minSize = m_settings.minColliderSize;

    m_scene.traverse([this, minSize](Node& node) {
        const Renderable* mesh = node.asRenderable();
        if (!mesh || !mesh->geometry()) return;

        // Glass stays see-through and walk-through
        if (!mesh->isCollidable()) return;

        if (mesh->worldBounds().diagonal() < minSize) return;

        try {
            m_colliders.push_back(makeCollider(*mesh));
        } catch (const BVHBuildError& e) {
            std::cerr << "[player] BVH generation failed for '" << node.name << "': "
                      << e.what() << std::endl;
        }
    });

    std::cout << "[player] Built collision for " << m_colliders.size() << " meshes" << std::endl;
}

bool PlayerController::addCollider(const Renderable& mesh) {
    if (!mesh.geometry()) {
        return false;
    }
    m_colliders.push_back(makeCollider(mesh));
    return true;
}

void PlayerController::releaseColliders() {
    for (Collider& collider : m_colliders) {
        collider.bvh.reset();
        if (collider.geometry) {
            collider.geometry->dispose();
        }
    }
    m_colliders.clear();
}

} // namespace vitrail::walk
