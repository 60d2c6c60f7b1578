/*
 * src/renderer.hpp
 *
 * Copyright (c) 2025 Omar Berrow
*/

#pragma once

#include <vector>

#include <glm/vec3.hpp>

#include "camera.hpp"
#include "color.hpp"
#include "framebuffer.hpp"
#include "scene.hpp"
#include "shader.hpp"

namespace refractor {
    struct screen_coords
    {
        unsigned int x, y;
    };

    class renderer {
        public:
            static constexpr float default_fov_degrees = 60.f;

            renderer(const renderer&) = delete;
            renderer(renderer&&) = delete;
            explicit renderer(const shader_config& config = {}, float fov_degrees = default_fov_degrees);

            // Traces one primary ray per pixel and writes every pixel of fb.
            void render(framebuffer& fb, const scene& objects, const camera& cam,
                        const std::vector<glm::vec3>& light_positions, float ambient_light_intensity) const;

            // World-space direction of the primary ray through pixel at.
            glm::vec3 primary_ray(const screen_coords& at, unsigned int width, unsigned int height, const camera& cam) const;

            inline const shader& get_shader() const { return m_shader; }
            inline float get_fov() const { return m_fov; }

        private:
            shader m_shader = {};
            // Radians.
            float m_fov = {};
            float m_perspective_scale = {};
    };
}
