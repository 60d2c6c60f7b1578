/*
 * src/camera.cpp
 *
 * Copyright (c) 2025 Omar Berrow
*/

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <glm/geometric.hpp>
#include <glm/trigonometric.hpp>
#include <glm/vec3.hpp>

#include "camera.hpp"
#include "math.hpp"

namespace refractor {
    camera::camera(const glm::vec3& eye, const glm::vec3& center, const glm::vec3& up, float move_step)
        : m_eye(eye), m_center(center), m_up(up), m_move_step(move_step)
    {
        if (glm::length(center - eye) == 0.f)
            throw std::invalid_argument("camera: eye and center coincide");
        if (glm::length(glm::cross(glm::normalize(center - eye), up)) < 1e-6f)
            throw std::invalid_argument("camera: view direction is parallel to the up vector");
        update_basis();
    }

    void camera::update_basis()
    {
        m_forward = safe_normalize(m_center - m_eye);
        m_right = safe_normalize(glm::cross(m_forward, m_up));
        m_basis_up = glm::cross(m_right, m_forward);
    }

    glm::vec3 camera::base_change(const glm::vec3& direction) const
    {
        return direction.x * m_right + direction.y * m_basis_up - direction.z * m_forward;
    }

    void camera::move(camera_move command)
    {
        glm::vec3 delta = {};
        switch (command)
        {
            case camera_move::forward: delta = m_forward; break;
            case camera_move::backward: delta = -m_forward; break;
            case camera_move::left: delta = -m_right; break;
            case camera_move::right: delta = m_right; break;
        }
        delta *= m_move_step;
        m_eye += delta;
        m_center += delta;
        update_basis();
    }

    void camera::orbit(float yaw_delta, float pitch_delta)
    {
        glm::vec3 offset = m_eye - m_center;
        float radius = glm::length(offset);

        float yaw = std::atan2(offset.z, offset.x);
        float pitch = std::atan2(offset.y, std::hypot(offset.x, offset.z));
        // A camera built steeper than the limit keeps its pitch but cannot tilt further.
        const float max_pitch = std::max(glm::radians(max_pitch_degrees), std::fabs(pitch));
        yaw += yaw_delta;
        pitch = std::clamp(pitch + pitch_delta, -max_pitch, max_pitch);

        offset.x = radius * std::cos(pitch) * std::cos(yaw);
        offset.y = radius * std::sin(pitch);
        offset.z = radius * std::cos(pitch) * std::sin(yaw);
        m_eye = m_center + offset;
        update_basis();
    }
}
