/*
 * src/intersect.hpp
 *
 * Copyright (c) 2025 Omar Berrow
*/

#pragma once

#include <glm/vec3.hpp>

#include "material.hpp"

namespace refractor {
    struct intersect
    {
        glm::vec3 point = {};
        glm::vec3 normal = {};
        float distance = 0;
        struct material material = {};
        bool is_intersecting = false;

        static intersect empty() { return {}; }
        static intersect hit(const glm::vec3& point, const glm::vec3& normal, float distance, const struct material& mat)
        {
            return {point, normal, distance, mat, true};
        }
    };

    // Anything a ray can hit. The direction passed in is expected to be normalized.
    class geometry
    {
        public:
            virtual ~geometry() = default;
            virtual intersect ray_intersect(const glm::vec3& origin, const glm::vec3& direction) const = 0;
    };
}
