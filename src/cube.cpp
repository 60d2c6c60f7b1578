/*
 * src/cube.cpp
 *
 * Copyright (c) 2025 Omar Berrow
*/

#include <limits>
#include <utility>

#include <glm/vec3.hpp>

#include "cube.hpp"

namespace refractor {
    intersect cube::ray_intersect(const glm::vec3& origin, const glm::vec3& direction) const
    {
        const float half = get_half_size();
        const glm::vec3 min = m_center - half;
        const glm::vec3 max = m_center + half;

        float t_enter = -std::numeric_limits<float>::infinity();
        float t_exit = std::numeric_limits<float>::infinity();
        int enter_axis = -1;
        int exit_axis = -1;

        for (int axis = 0; axis < 3; axis++)
        {
            if (direction[axis] == 0.f)
            {
                // Parallel to this slab, it only matters whether we start inside it.
                if (origin[axis] < min[axis] || origin[axis] > max[axis])
                    return intersect::empty();
                continue;
            }

            float t1 = (min[axis] - origin[axis]) / direction[axis];
            float t2 = (max[axis] - origin[axis]) / direction[axis];
            if (t1 > t2)
                std::swap(t1, t2);

            if (t1 > t_enter)
            {
                t_enter = t1;
                enter_axis = axis;
            }
            if (t2 < t_exit)
            {
                t_exit = t2;
                exit_axis = axis;
            }
        }

        // A zero direction never crosses any slab.
        if (enter_axis == -1 || exit_axis == -1)
            return intersect::empty();
        if (t_enter > t_exit)
            return intersect::empty();
        if (t_enter < 0 && t_exit < 0)
            return intersect::empty();

        glm::vec3 normal = {};
        float distance = 0;
        if (t_enter >= 0)
        {
            // Entering face, facing the side the ray came from.
            distance = t_enter;
            normal[enter_axis] = direction[enter_axis] > 0 ? -1.f : 1.f;
        }
        else
        {
            // Origin is inside; report where the ray leaves.
            distance = t_exit;
            normal[exit_axis] = direction[exit_axis] > 0 ? 1.f : -1.f;
        }

        return intersect::hit(origin + direction * distance, normal, distance, m_material);
    }
}
