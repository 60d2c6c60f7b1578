/*
 * src/math.hpp
 *
 * Copyright (c) 2025 Omar Berrow
*/

#pragma once

#include <glm/geometric.hpp>
#include <glm/vec3.hpp>

namespace refractor {
    // glm::normalize divides by zero on a zero vector; this returns the zero vector instead.
    inline glm::vec3 safe_normalize(const glm::vec3& v)
    {
        float len = glm::length(v);
        if (len == 0.f)
            return glm::vec3(0.f);
        return v / len;
    }
}
