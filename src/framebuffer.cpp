/*
 * src/framebuffer.cpp
 *
 * Copyright (c) 2025 Omar Berrow
*/

#include <algorithm>
#include <stdexcept>

#include "framebuffer.hpp"

namespace refractor {
    framebuffer::framebuffer(unsigned int width, unsigned int height)
        : m_width(width), m_height(height)
    {
        if (!width || !height)
            throw std::invalid_argument("framebuffer: zero-sized buffer");
        m_buffer.resize(size_t(width) * height, color_to_rgb(color_black()));
    }

    void framebuffer::clear(color c)
    {
        std::fill(m_buffer.begin(), m_buffer.end(), color_to_rgb(c));
    }

    void framebuffer::point(unsigned int x, unsigned int y)
    {
        if (x >= m_width || y >= m_height)
            return;
        m_buffer[size_t(y) * m_width + x] = color_to_rgb(m_current_color);
    }

    uint32_t framebuffer::pixel(unsigned int x, unsigned int y) const
    {
        if (x >= m_width || y >= m_height)
            throw std::out_of_range("framebuffer: pixel out of range");
        return m_buffer[size_t(y) * m_width + x];
    }
}
