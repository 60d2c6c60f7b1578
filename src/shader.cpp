/*
 * src/shader.cpp
 *
 * Copyright (c) 2025 Omar Berrow
*/

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

#include <glm/geometric.hpp>
#include <glm/vec3.hpp>

#include "math.hpp"
#include "shader.hpp"

namespace refractor {
    float fresnel(float cos_theta, float refractive_index)
    {
        float denom = 1.f + refractive_index;
        if (denom == 0.f)
            return 0.f;
        float r0 = (1.f - refractive_index) / denom;
        r0 *= r0;
        return r0 + (1.f - r0) * std::pow(1.f - cos_theta, 5.f);
    }

    glm::vec3 reflect(const glm::vec3& incident, const glm::vec3& normal)
    {
        return incident - 2.f * glm::dot(incident, normal) * normal;
    }

    glm::vec3 offset_origin(const intersect& hit, const glm::vec3& direction, float bias)
    {
        glm::vec3 offset = hit.normal * bias;
        if (glm::dot(direction, hit.normal) < 0)
            return hit.point - offset;
        return hit.point + offset;
    }

    float ambient_light_intensity(const glm::vec3& light_position)
    {
        constexpr float max_intensity = 1.f;
        constexpr float min_intensity = .2f;
        float height_factor = std::max(light_position.y + 1.f, 0.f) / 10.f;
        return min_intensity + (max_intensity - min_intensity) * std::clamp(height_factor, 0.f, 1.f);
    }

    color shader::skybox(const glm::vec3& direction, float ambient_light_intensity) const
    {
        float t = .5f * (direction.y + 1.f);
        color sky = color_lerp(m_config.sky_night, m_config.sky_day, ambient_light_intensity);
        color ground = color_lerp(m_config.ground_night, m_config.ground_day, ambient_light_intensity);
        return color_lerp(ground, sky, t);
    }

    intersect shader::nearest_hit(const glm::vec3& origin, const glm::vec3& direction, const scene& objects) const
    {
        intersect closest = intersect::empty();
        float zbuffer = std::numeric_limits<float>::infinity();
        objects.for_each_object([&](const scene_object& obj) {
            intersect i = obj.shape->ray_intersect(origin, direction);
            if (i.is_intersecting && i.distance < zbuffer)
            {
                zbuffer = i.distance;
                closest = i;
            }
            return true;
        });
        return closest;
    }

    float shader::cast_shadow(const intersect& hit, const glm::vec3& light_position, const scene& objects) const
    {
        glm::vec3 to_light = light_position - hit.point;
        float light_distance = glm::length(to_light);
        glm::vec3 light_dir = safe_normalize(to_light);
        glm::vec3 shadow_origin = offset_origin(hit, light_dir, m_config.origin_bias);

        bool occluded = false;
        float occluder_distance = std::numeric_limits<float>::infinity();
        objects.for_each_object([&](const scene_object& obj) {
            intersect i = obj.shape->ray_intersect(shadow_origin, light_dir);
            if (!i.is_intersecting || i.distance >= light_distance)
                return true;
            occluded = true;
            occluder_distance = std::min(occluder_distance, i.distance);
            return m_config.shadows == shadow_mode::nearest_occluder;
        });
        if (!occluded)
            return 0.f;

        float ratio = occluder_distance / light_distance;
        return 1.f - std::min(ratio * ratio, 1.f);
    }

    color shader::cast_ray(const glm::vec3& origin, const glm::vec3& direction, const scene& objects,
                           const std::vector<glm::vec3>& light_positions, int depth, float ambient_light_intensity) const
    {
        if (depth > m_config.max_depth)
            return m_config.skybox_color;

        intersect hit = nearest_hit(origin, direction, objects);
        if (!hit.is_intersecting)
            return skybox(direction, ambient_light_intensity);

        const material& mat = hit.material;
        color total_diffuse = color_black();
        color total_specular = color_black();
        glm::vec3 view_dir = safe_normalize(origin - hit.point);
        float cos_theta = std::max(0.f, -glm::dot(direction, hit.normal));
        float fresnel_effect = fresnel(cos_theta, mat.refractive_index);

        for (const auto& light_position : light_positions)
        {
            glm::vec3 light_dir = safe_normalize(light_position - hit.point);
            glm::vec3 reflect_dir = safe_normalize(reflect(-light_dir, hit.normal));

            float shadow_intensity = cast_shadow(hit, light_position, objects);
            float light_intensity = m_config.light_scale * (1.f - shadow_intensity);

            float diffuse_intensity = std::clamp(glm::dot(hit.normal, light_dir), 0.f, 1.f);
            // Each factor is applied and truncated in turn.
            color diffuse = color_multiply(mat.diffuse, mat.albedo[0]);
            diffuse = color_multiply(diffuse, diffuse_intensity);
            diffuse = color_multiply(diffuse, light_intensity);
            total_diffuse = color_add(total_diffuse, diffuse);

            float specular_intensity = std::pow(std::max(0.f, glm::dot(view_dir, reflect_dir)), mat.specular);
            color specular = color_multiply(color_white(), mat.albedo[1]);
            specular = color_multiply(specular, specular_intensity);
            specular = color_multiply(specular, light_intensity);
            specular = color_multiply(specular, fresnel_effect);
            total_specular = color_add(total_specular, specular);
        }

        color emission = mat.is_emissive ? mat.emission : color_black();
        return color_add(color_add(total_diffuse, total_specular), emission);
    }
}
