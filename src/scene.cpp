/*
 * src/scene.cpp
 *
 * Copyright (c) 2025 Omar Berrow
*/

#include "scene.hpp"

namespace refractor {
    size_t scene::light_count() const
    {
        size_t n = 0;
        for_each_object([&n](const scene_object& obj) {
            if (obj.is_light)
                n++;
            return true;
        });
        return n;
    }
}
