/*
 * src/cube.hpp
 *
 * Copyright (c) 2025 Omar Berrow
*/

#pragma once

#include <glm/vec3.hpp>

#include "intersect.hpp"
#include "material.hpp"

namespace refractor {
    // Axis-aligned cube. size is the edge length, so the faces sit at center +- size/2.
    class cube : public geometry
    {
        public:
            cube(const glm::vec3& center, float size, const struct material& mat)
                : m_center(center), m_size(size), m_material(mat)
            {}

            intersect ray_intersect(const glm::vec3& origin, const glm::vec3& direction) const override;

            inline const glm::vec3& get_center() const { return m_center; }
            inline float get_size() const { return m_size; }
            inline float get_half_size() const { return m_size * .5f; }
            inline const struct material& get_material() const { return m_material; }

        private:
            glm::vec3 m_center = {};
            float m_size = {};
            struct material m_material = {};
    };
}
