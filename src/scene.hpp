/*
 * src/scene.hpp
 *
 * Copyright (c) 2025 Omar Berrow
*/

#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

#include "intersect.hpp"

namespace refractor {
    struct scene_object
    {
        std::shared_ptr<const geometry> shape;
        bool is_light = false;
    };

    // Static objects are built once; dynamic ones are thrown away and regenerated every frame.
    // Iteration follows insertion order: the dynamic objects are visited where mark_dynamic_slot()
    // was called, or after every static object if it never was.
    class scene {
        public:
            scene() = default;

            inline void append_static(std::shared_ptr<const geometry> shape, bool is_light = false) { m_static_objects.push_back({std::move(shape), is_light}); }
            inline void append_dynamic(std::shared_ptr<const geometry> shape, bool is_light = false) { m_dynamic_objects.push_back({std::move(shape), is_light}); }
            inline void clear_dynamic() { m_dynamic_objects.clear(); }
            inline void clear() { m_static_objects.clear(); m_dynamic_objects.clear(); m_dynamic_slot = npos; }
            // Static objects appended after this are visited after the dynamic ones.
            inline void mark_dynamic_slot() { m_dynamic_slot = m_static_objects.size(); }

            inline size_t size() const { return m_static_objects.size() + m_dynamic_objects.size(); }
            inline size_t static_size() const { return m_static_objects.size(); }
            inline size_t dynamic_size() const { return m_dynamic_objects.size(); }
            size_t light_count() const;

            // Calls cb(const scene_object&) on every object until it returns false.
            template<typename F>
            void for_each_object(F&& cb) const
            {
                const size_t slot = std::min(m_dynamic_slot, m_static_objects.size());
                for (size_t i = 0; i < slot; i++)
                    if (!cb(m_static_objects[i]))
                        return;
                for (const auto& obj : m_dynamic_objects)
                    if (!cb(obj))
                        return;
                for (size_t i = slot; i < m_static_objects.size(); i++)
                    if (!cb(m_static_objects[i]))
                        return;
            }

        private:
            static constexpr size_t npos = static_cast<size_t>(-1);

            std::vector<scene_object> m_static_objects = {};
            std::vector<scene_object> m_dynamic_objects = {};
            size_t m_dynamic_slot = npos;
    };
}
