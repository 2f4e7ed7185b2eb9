#include <vitrail/render3d/camera.h>
#include <glm/gtc/constants.hpp>
#include <cmath>

namespace vitrail::render3d {

void Camera3D::moveTo(glm::vec3 pos) {
    glm::vec3 offset = m_target - m_position;
    m_position = pos;
    m_target = pos + offset;
}

void Camera3D::lookAt(glm::vec3 pos, glm::vec3 target, glm::vec3 up) {
    m_position = pos;
    m_target = target;
    m_up = up;
}

void Camera3D::look(float yaw, float pitch) {
    // Keep away from straight up/down so forward() keeps a horizontal part
    pitch = glm::clamp(pitch, -glm::half_pi<float>() * 0.99f,
                               glm::half_pi<float>() * 0.99f);

    glm::vec3 dir(
        -std::sin(yaw) * std::cos(pitch),
        std::sin(pitch),
        -std::cos(yaw) * std::cos(pitch)
    );
    m_target = m_position + dir;
    m_up = glm::vec3(0, 1, 0);
}

glm::vec3 Camera3D::forward() const {
    return glm::normalize(m_target - m_position);
}

float Camera3D::yaw() const {
    glm::vec3 f = forward();
    return std::atan2(-f.x, -f.z);
}

float Camera3D::pitch() const {
    return std::asin(glm::clamp(forward().y, -1.0f, 1.0f));
}

} // namespace vitrail::render3d
