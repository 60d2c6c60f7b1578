/*
 * src/renderer.cpp
 *
 * Copyright (c) 2025 Omar Berrow
*/

#include <cmath>
#include <vector>

#include <glm/geometric.hpp>
#include <glm/trigonometric.hpp>
#include <glm/vec3.hpp>

#include "renderer.hpp"

namespace refractor {
    renderer::renderer(const shader_config& config, float fov_degrees)
        : m_shader(config),
          m_fov(glm::radians(fov_degrees))
    {
        m_perspective_scale = std::tan(m_fov * .5f);
    }

    glm::vec3 renderer::primary_ray(const screen_coords& at, unsigned int width, unsigned int height, const camera& cam) const
    {
        const float w = width;
        const float h = height;
        const float aspect_ratio = w / h;

        // y is flipped so that up on screen is +y.
        float screen_x = (2.f * at.x) / w - 1.f;
        float screen_y = -(2.f * at.y) / h + 1.f;
        screen_x *= aspect_ratio * m_perspective_scale;
        screen_y *= m_perspective_scale;

        glm::vec3 direction = glm::normalize(glm::vec3(screen_x, screen_y, -1.f));
        return cam.base_change(direction);
    }

    void renderer::render(framebuffer& fb, const scene& objects, const camera& cam,
                          const std::vector<glm::vec3>& light_positions, float ambient_light_intensity) const
    {
        const unsigned int width = fb.get_width();
        const unsigned int height = fb.get_height();
        screen_coords i = {};
        for (i.y = 0; i.y < height; i.y++)
        {
            for (i.x = 0; i.x < width; i.x++)
            {
                glm::vec3 direction = primary_ray(i, width, height, cam);
                color c = m_shader.cast_ray(cam.get_eye(), direction, objects, light_positions, 0, ambient_light_intensity);
                fb.set_current_color(c);
                fb.point(i.x, i.y);
            }
        }
    }
}
