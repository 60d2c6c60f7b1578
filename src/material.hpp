/*
 * src/material.hpp
 *
 * Copyright (c) 2025 Omar Berrow
*/

#pragma once

#include <array>

#include "color.hpp"

namespace refractor {
    struct material
    {
        color diffuse = color_black();
        float specular = 0;
        // diffuse, specular, reflect, refract weights.
        std::array<float, 4> albedo = {};
        float refractive_index = 0;
        color emission = color_black();
        bool is_emissive = false;

        static constexpr material black() { return {}; }
    };
}
