#pragma once

#include <glm/glm.hpp>

namespace vitrail::render3d {

/// Camera described by position, look target and up vector
class Camera3D {
public:
    Camera3D() = default;

    // -------------------------------------------------------------------------
    /// @name Position and Orientation
    /// @{

    /// Move the camera while keeping its look direction
    void moveTo(glm::vec3 pos);

    /// Set position, target, and up in one call
    void lookAt(glm::vec3 pos, glm::vec3 target, glm::vec3 up = glm::vec3(0, 1, 0));

    /// First-person look: yaw around +Y (0 looks down -Z), pitch up/down (radians)
    void look(float yaw, float pitch);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Accessors
    /// @{

    glm::vec3 getPosition() const { return m_position; }
    glm::vec3 getUp() const { return m_up; }

    /// Get forward direction (normalized world look direction)
    glm::vec3 forward() const;

    /// Yaw of the current look direction, matching look()
    float yaw() const;

    /// Pitch of the current look direction, matching look()
    float pitch() const;

    /// @}

private:
    glm::vec3 m_position = glm::vec3(0, 0, 5);
    glm::vec3 m_target = glm::vec3(0, 0, 0);
    glm::vec3 m_up = glm::vec3(0, 1, 0);
};

} // namespace vitrail::render3d
