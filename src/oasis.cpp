/*
 * src/oasis.cpp
 *
 * Copyright (c) 2025 Omar Berrow
*/

#include <cmath>
#include <memory>
#include <utility>
#include <vector>

#include <glm/vec3.hpp>

#include "oasis.hpp"

namespace refractor::oasis {
    namespace {
        constexpr float terrain_size = 10.f;
        constexpr float light_cube_size = .5f;
        constexpr float pond_height = 4.9f;
        constexpr float wave_amplitude = .2f;

        constexpr float trunk_start_y = 5.f;
        constexpr float trunk_cube_size = .4f;
        constexpr int trunk_cubes = 5;
        constexpr float leaf_cube_size = .5f;

        constexpr int house_width = 5;
        constexpr int house_height = 3;
        constexpr int house_depth = 5;
        const glm::vec3 house_position = {-4.5f, 5.2f, -4.f};
        constexpr float house_cube_size = .5f;

        material matte(color diffuse)
        {
            return material{
                .diffuse = diffuse,
                .specular = 1.f,
                .albedo = {.9f, .1f, 0.f, 0.f},
                .refractive_index = 0.f,
            };
        }

        std::shared_ptr<const cube> make_cube(const glm::vec3& center, float size, const material& mat)
        {
            return std::make_shared<const cube>(center, size, mat);
        }
    }

    palette default_palette()
    {
        palette p = {};
        p.sand = matte(color_make(237, 201, 175));
        p.trunk = matte(color_make(139, 69, 19));
        p.leaf = matte(color_make(34, 139, 34));
        p.water = matte(color_make(0, 191, 255));
        p.light_cube = material{
            .diffuse = color_black(),
            .specular = 0.f,
            .albedo = {0.f, 0.f, 0.f, 0.f},
            .refractive_index = 0.f,
            .emission = color_make(255, 223, 0),
            .is_emissive = true,
        };
        return p;
    }

    const std::vector<glm::vec3>& light_cube_positions()
    {
        static const std::vector<glm::vec3> positions = {
            {1.f, 5.2f, -4.f},
            {4.5f, 5.2f, 2.f},
        };
        return positions;
    }

    cube_list generate_wave_grid(const material& water, size_t grid_size, float cube_size, float elapsed_time)
    {
        cube_list cubes;
        cubes.reserve(grid_size * grid_size);
        for (size_t x = 0; x < grid_size; x++)
        {
            for (size_t z = 0; z < grid_size; z++)
            {
                float wave_height = std::sin(elapsed_time * 2.f + float(x + z) * .5f) * wave_amplitude;
                cubes.push_back(make_cube({x * cube_size, pond_height + wave_height, z * cube_size}, cube_size, water));
            }
        }
        return cubes;
    }

    cube_list generate_sand_border(const material& sand, size_t grid_size, float cube_size)
    {
        cube_list cubes;
        for (size_t x = 0; x < grid_size; x++)
        {
            for (size_t z = 0; z < grid_size; z++)
            {
                bool on_edge = x == 0 || x == grid_size - 1 || z == 0 || z == grid_size - 1;
                if (on_edge)
                    cubes.push_back(make_cube({x * cube_size, pond_height, z * cube_size}, cube_size, sand));
            }
        }
        return cubes;
    }

    cube_list generate_sand_house(const material& sand, const glm::vec3& start_position, float cube_size)
    {
        cube_list cubes;
        for (int x = 0; x < house_width; x++)
        {
            for (int y = 0; y < house_height; y++)
            {
                for (int z = 0; z < house_depth; z++)
                {
                    bool is_door = x == 2 && z == 0 && y < 2;
                    bool is_window = y == 1 && (x == 1 || x == 3) && (z == 0 || z == house_depth - 1);
                    if (is_door || is_window)
                        continue;
                    cubes.push_back(make_cube(start_position + glm::vec3(x, y, z) * cube_size, cube_size, sand));
                }
            }
        }

        // Roof
        for (int x = 0; x < house_width; x++)
            for (int z = 0; z < house_depth; z++)
                cubes.push_back(make_cube(start_position + glm::vec3(x, house_height, z) * cube_size, cube_size, sand));
        return cubes;
    }

    void build_static(scene& s, const palette& p)
    {
        s.append_static(make_cube({0.f, 0.f, 0.f}, terrain_size, p.sand));
        for (const auto& pos : light_cube_positions())
            s.append_static(make_cube(pos, light_cube_size, p.light_cube), true);

        for (int i = 0; i < trunk_cubes; i++)
            s.append_static(make_cube({0.f, trunk_start_y + i * trunk_cube_size, 0.f}, trunk_cube_size, p.trunk));

        const float leaf_y = trunk_start_y + trunk_cubes * trunk_cube_size;
        const glm::vec3 leaves[] = {
            {0.f, leaf_y, 0.f},
            {.5f, leaf_y, .5f},
            {-.5f, leaf_y, .5f},
            {.5f, leaf_y, -.5f},
            {-.5f, leaf_y, -.5f},
        };
        for (const auto& pos : leaves)
            s.append_static(make_cube(pos, leaf_cube_size, p.leaf));

        // Water goes here, between the leaves and the pond rim.
        s.mark_dynamic_slot();
        for (auto& c : generate_sand_border(p.sand, pond_grid_size, pond_cube_size))
            s.append_static(std::move(c));
        for (auto& c : generate_sand_house(p.sand, house_position, house_cube_size))
            s.append_static(std::move(c));
    }

    void update_dynamic(scene& s, const palette& p, float elapsed_time)
    {
        s.clear_dynamic();
        for (auto& c : generate_wave_grid(p.water, pond_grid_size, pond_cube_size, elapsed_time))
            s.append_dynamic(std::move(c));
    }

    glm::vec3 sun_position(float angle, float radius)
    {
        return {radius * std::cos(angle), radius * std::sin(angle), 0.f};
    }

    std::vector<glm::vec3> light_positions(const glm::vec3& sun)
    {
        std::vector<glm::vec3> lights = light_cube_positions();
        lights.push_back(sun);
        return lights;
    }
}
