/*
 * src/main.cpp
 *
 * Copyright (c) 2025 Omar Berrow
*/

#include <SDL2/SDL.h>
#include <SDL2/SDL_events.h>
#include <SDL2/SDL_keyboard.h>
#include <SDL2/SDL_scancode.h>
#include <SDL2/SDL_video.h>
#include <SDL2/SDL_surface.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <thread>
#include <vector>

#include <glm/vec3.hpp>

#include <stdio.h>

#include "camera.hpp"
#include "framebuffer.hpp"
#include "oasis.hpp"
#include "renderer.hpp"
#include "scene.hpp"
#include "shader.hpp"

#define psdlerror(s) fprintf(stderr, "%s: %s\n", s, SDL_GetError())

constexpr int window_width = 800;
constexpr int window_height = 600;
constexpr std::chrono::milliseconds frame_delay = std::chrono::milliseconds(16);
constexpr float rotation_speed = .05f;

using namespace refractor;

static void present(const framebuffer& fb, SDL_Surface* surface)
{
    if (SDL_MUSTLOCK(surface) && SDL_LockSurface(surface) != 0)
    {
        psdlerror("SDL_LockSurface");
        return;
    }
    uint8_t* fb8 = (uint8_t*)surface->pixels;
    const uint32_t bpp = surface->format->BytesPerPixel;
    const unsigned int w = std::min<unsigned int>(fb.get_width(), surface->w);
    const unsigned int h = std::min<unsigned int>(fb.get_height(), surface->h);
    for (unsigned int y = 0; y < h; y++)
    {
        for (unsigned int x = 0; x < w; x++)
        {
            uint32_t rgb = fb.pixel(x, y);
            uint8_t* px = fb8 + surface->pitch * y + x * bpp;
            px[surface->format->Rshift/8] = (rgb >> 16) & 0xff;
            px[surface->format->Gshift/8] = (rgb >> 8) & 0xff;
            px[surface->format->Bshift/8] = rgb & 0xff;
            if (surface->format->Amask)
                px[surface->format->Ashift/8] = 0xff;
        }
    }
    if (SDL_MUSTLOCK(surface))
        SDL_UnlockSurface(surface);
}

static void apply_held_keys(camera& cam)
{
    const Uint8* keys = SDL_GetKeyboardState(nullptr);
    if (keys[SDL_SCANCODE_W])
        cam.move(camera_move::forward);
    if (keys[SDL_SCANCODE_S])
        cam.move(camera_move::backward);
    if (keys[SDL_SCANCODE_A])
        cam.orbit(rotation_speed, 0.f);
    if (keys[SDL_SCANCODE_D])
        cam.orbit(-rotation_speed, 0.f);
    if (keys[SDL_SCANCODE_UP])
        cam.orbit(0.f, -rotation_speed);
    if (keys[SDL_SCANCODE_DOWN])
        cam.orbit(0.f, rotation_speed);
    if (keys[SDL_SCANCODE_LEFT])
        cam.move(camera_move::left);
    if (keys[SDL_SCANCODE_RIGHT])
        cam.move(camera_move::right);
}

static int run(SDL_Window* window)
{
    SDL_Surface* surface = SDL_GetWindowSurface(window);
    if (!surface)
    {
        psdlerror("SDL_GetWindowSurface");
        return -1;
    }

    framebuffer fb{window_width, window_height};
    camera cam{{5.f, 5.f, 10.f}, {0.f, 2.f, 0.f}, {0.f, 1.f, 0.f}};
    renderer renderer{shader_config{}};

    scene objects;
    const oasis::palette palette = oasis::default_palette();
    oasis::build_static(objects, palette);
    printf("scene: %zu static objects, %zu lights\n", objects.static_size(), objects.light_count());

    auto start_time = std::chrono::steady_clock::now();
    float angle = 0.f;
    bool was_night = false;
    bool quit = false;
    do {
        auto frame_start = std::chrono::steady_clock::now();

        angle += rotation_speed;
        glm::vec3 sun = oasis::sun_position(angle);
        std::vector<glm::vec3> light_positions = oasis::light_positions(sun);
        float ambient = ambient_light_intensity(sun);
        bool night = oasis::is_night(ambient);
        if (night != was_night)
            printf("%s\n", night ? "night falls" : "the sun rises");
        was_night = night;

        float elapsed = std::chrono::duration<float>(frame_start - start_time).count();
        oasis::update_dynamic(objects, palette, elapsed);

        SDL_Event event = {};
        while (SDL_PollEvent(&event))
        {
            if (event.type == SDL_QUIT)
                quit = true;
            else if (event.type == SDL_KEYDOWN && event.key.keysym.sym == SDLK_ESCAPE)
                quit = true;
        }
        if (quit)
            break;
        apply_held_keys(cam);

        renderer.render(fb, objects, cam, light_positions, ambient);
        present(fb, surface);
        if (SDL_UpdateWindowSurface(window) != 0)
            psdlerror("SDL_UpdateWindowSurface");

        auto frame_end = std::chrono::steady_clock::now();
        auto frame_ms = std::chrono::duration_cast<std::chrono::milliseconds>(frame_end - frame_start);
        if (frame_ms > frame_delay)
            printf("frame time = %ld ms\n", (long)frame_ms.count());
        std::this_thread::sleep_for(frame_delay);
    } while(!quit);

    return 0;
}

int main()
{
    if (SDL_Init(SDL_INIT_VIDEO) == -1)
    {
        psdlerror("SDL_Init");
        return -1;
    }

    SDL_Window* window = SDL_CreateWindow(
        "Refractor",
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        window_width, window_height,
        0);
    if (!window)
    {
        psdlerror("SDL_CreateWindow");
        SDL_Quit();
        return -1;
    }

    int ret = 0;
    try {
        ret = run(window);
    } catch (const std::exception& e) {
        fprintf(stderr, "fatal: %s\n", e.what());
        ret = -1;
    }

    SDL_DestroyWindow(window);
    SDL_Quit();

    return ret;
}
