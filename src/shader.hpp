/*
 * src/shader.hpp
 *
 * Copyright (c) 2025 Omar Berrow
*/

#pragma once

#include <vector>

#include <glm/vec3.hpp>

#include "color.hpp"
#include "intersect.hpp"
#include "scene.hpp"

namespace refractor {
    enum class shadow_mode {
        // Stop at the first occluder in scene order, whether or not it is the nearest.
        first_occluder,
        nearest_occluder,
    };

    struct shader_config
    {
        float origin_bias = 1e-4f;
        // Returned once the recursion limit is exceeded.
        color skybox_color = color_make(68, 142, 228);
        int max_depth = 3;
        float light_scale = 1.5f;
        color sky_day = color_make(135, 206, 235);
        color ground_day = color_make(222, 184, 135);
        color sky_night = color_make(25, 25, 112);
        color ground_night = color_make(50, 50, 50);
        shadow_mode shadows = shadow_mode::first_occluder;
    };

    class shader {
        public:
            shader() = default;
            explicit shader(const shader_config& config) : m_config(config) {}

            color cast_ray(const glm::vec3& origin, const glm::vec3& direction, const scene& objects,
                           const std::vector<glm::vec3>& light_positions, int depth, float ambient_light_intensity) const;
            // 0 means fully lit, 1 fully shadowed.
            float cast_shadow(const intersect& hit, const glm::vec3& light_position, const scene& objects) const;
            // Nearest hit along the ray, or intersect::empty().
            intersect nearest_hit(const glm::vec3& origin, const glm::vec3& direction, const scene& objects) const;
            // Ground/sky gradient along direction.y, blended between night and day by ambient_light_intensity.
            color skybox(const glm::vec3& direction, float ambient_light_intensity) const;

            inline const shader_config& get_config() const { return m_config; }

        private:
            shader_config m_config = {};
    };

    // Schlick's approximation. A refractive index of -1 has no defined r0 and reflects nothing.
    float fresnel(float cos_theta, float refractive_index);
    glm::vec3 reflect(const glm::vec3& incident, const glm::vec3& normal);
    // Nudges the hit point off the surface, to the side direction points to.
    glm::vec3 offset_origin(const intersect& hit, const glm::vec3& direction, float bias);
    // Day/night factor in [0.2, 1] from the height of the sun.
    float ambient_light_intensity(const glm::vec3& light_position);
}
