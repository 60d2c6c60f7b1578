/*
 * src/oasis.hpp
 *
 * Copyright (c) 2025 Omar Berrow
*/

#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include <glm/vec3.hpp>

#include "cube.hpp"
#include "material.hpp"
#include "scene.hpp"

namespace refractor {
    // The desert oasis: sand terrain, a palm tree, a pond with a sand rim,
    // a sand house and two glowing cubes, lit by an orbiting sun.
    namespace oasis {
        using cube_list = std::vector<std::shared_ptr<const cube>>;

        struct palette
        {
            material sand;
            material trunk;
            material leaf;
            material water;
            material light_cube;
        };
        palette default_palette();

        constexpr size_t pond_grid_size = 6;
        constexpr float pond_cube_size = .5f;
        constexpr float sun_orbit_radius = 15.f;
        // Below this ambient intensity it is night.
        constexpr float night_threshold = .3f;

        // Centers of the emissive cubes; they double as point lights.
        const std::vector<glm::vec3>& light_cube_positions();

        cube_list generate_wave_grid(const material& water, size_t grid_size, float cube_size, float elapsed_time);
        // Only the outer ring of a grid_size x grid_size grid.
        cube_list generate_sand_border(const material& sand, size_t grid_size, float cube_size);
        // 5x3x5 walls with a door and four windows, under a full 5x5 roof.
        cube_list generate_sand_house(const material& sand, const glm::vec3& start_position, float cube_size);

        // Terrain, light cubes, palm tree, pond rim and house; everything that never moves.
        // The water is visited after the palm and before the pond rim.
        void build_static(scene& s, const palette& p);
        // Replaces the dynamic objects with the water surface at elapsed_time seconds.
        void update_dynamic(scene& s, const palette& p, float elapsed_time);

        glm::vec3 sun_position(float angle, float radius = sun_orbit_radius);
        // Light cube centers followed by the sun.
        std::vector<glm::vec3> light_positions(const glm::vec3& sun);
        inline bool is_night(float ambient) { return ambient < night_threshold; }
    }
}
