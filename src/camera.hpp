/*
 * src/camera.hpp
 *
 * Copyright (c) 2025 Omar Berrow
*/

#pragma once

#include <glm/vec3.hpp>

namespace refractor {
    enum class camera_move {
        forward,
        backward,
        left,
        right,
    };

    // Look-at camera. The basis is always orthonormal: forward points from eye to
    // center, right = forward x up, and the basis up is rebuilt as right x forward.
    class camera {
        public:
            static constexpr float default_move_step = .25f;
            static constexpr float max_pitch_degrees = 89.f;

            // Throws std::invalid_argument when eye == center or the view direction is parallel to up.
            camera(const glm::vec3& eye, const glm::vec3& center, const glm::vec3& up, float move_step = default_move_step);

            // Maps a camera-space direction (x right, y up, -z forward) into world space.
            glm::vec3 base_change(const glm::vec3& direction) const;

            void move(camera_move command);
            // Pitch is clamped to +/-max_pitch_degrees, or to the starting pitch if that is steeper.
            void orbit(float yaw_delta, float pitch_delta);

            inline const glm::vec3& get_eye() const { return m_eye; }
            inline const glm::vec3& get_center() const { return m_center; }
            inline const glm::vec3& get_up() const { return m_up; }
            inline const glm::vec3& get_forward() const { return m_forward; }
            inline const glm::vec3& get_right() const { return m_right; }
            inline const glm::vec3& get_basis_up() const { return m_basis_up; }

        private:
            glm::vec3 m_eye = {};
            glm::vec3 m_center = {};
            glm::vec3 m_up = {};
            float m_move_step = {};

            glm::vec3 m_forward = {};
            glm::vec3 m_right = {};
            glm::vec3 m_basis_up = {};

        private:
            void update_basis();
    };
}
