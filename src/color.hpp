/*
 * src/color.hpp
 *
 * Copyright (c) 2025 Omar Berrow
*/

#pragma once

#include <algorithm>
#include <cstdint>

namespace refractor {
    // RRGGBBxx
    using color = uint32_t;

    inline constexpr color color_make(uint8_t r, uint8_t g, uint8_t b)
    {
        return (uint32_t(r) << 24) | (uint32_t(g) << 16) | (uint32_t(b) << 8);
    }
    inline constexpr uint8_t color_red(color c) { return (c >> 24) & 0xff; }
    inline constexpr uint8_t color_green(color c) { return (c >> 16) & 0xff; }
    inline constexpr uint8_t color_blue(color c) { return (c >> 8) & 0xff; }
    inline constexpr color color_black() { return color_make(0, 0, 0); }
    inline constexpr color color_white() { return color_make(255, 255, 255); }

    inline static color color_multiply(color c, float val)
    {
        uint32_t r = std::clamp(color_red(c) * val, 0.f, 255.f);
        uint32_t g = std::clamp(color_green(c) * val, 0.f, 255.f);
        uint32_t b = std::clamp(color_blue(c) * val, 0.f, 255.f);
        c = 0;
        c |= (r<<24);
        c |= (g<<16);
        c |= (b<<8);
        return c;
    }

    // Saturates at 255 per channel.
    inline static color color_add(color a, color b)
    {
        uint32_t r = std::min<uint32_t>(color_red(a) + color_red(b), 255);
        uint32_t g = std::min<uint32_t>(color_green(a) + color_green(b), 255);
        uint32_t bl = std::min<uint32_t>(color_blue(a) + color_blue(b), 255);
        return (r<<24) | (g<<16) | (bl<<8);
    }

    inline static color color_lerp(color a, color b, float t)
    {
        auto mix = [t](uint8_t x, uint8_t y) -> uint8_t {
            return std::clamp(x * (1.f - t) + y * t, 0.f, 255.f);
        };
        return color_make(mix(color_red(a), color_red(b)),
                          mix(color_green(a), color_green(b)),
                          mix(color_blue(a), color_blue(b)));
    }

    // 0x00RRGGBB, the layout display surfaces expect.
    inline constexpr uint32_t color_to_rgb(color c) { return c >> 8; }
}
