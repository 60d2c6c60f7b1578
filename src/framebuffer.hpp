/*
 * src/framebuffer.hpp
 *
 * Copyright (c) 2025 Omar Berrow
*/

#pragma once

#include <cstdint>
#include <vector>

#include "color.hpp"

namespace refractor {
    // Row-major 0x00RRGGBB pixels.
    class framebuffer {
        public:
            // Throws std::invalid_argument on a zero dimension.
            framebuffer(unsigned int width, unsigned int height);

            void clear(color c = color_black());
            inline void set_current_color(color c) { m_current_color = c; }
            // Out of range writes are dropped.
            void point(unsigned int x, unsigned int y);
            // Throws std::out_of_range.
            uint32_t pixel(unsigned int x, unsigned int y) const;

            inline unsigned int get_width() const { return m_width; }
            inline unsigned int get_height() const { return m_height; }
            inline const uint32_t* data() const { return m_buffer.data(); }

        private:
            unsigned int m_width = {};
            unsigned int m_height = {};
            std::vector<uint32_t> m_buffer = {};
            color m_current_color = color_white();
    };
}
