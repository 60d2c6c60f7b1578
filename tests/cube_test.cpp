/*
 * tests/cube_test.cpp
 *
 * Copyright (c) 2025 Omar Berrow
*/

#include <cmath>

#include <gtest/gtest.h>

#include <glm/geometric.hpp>
#include <glm/vec3.hpp>

#include "cube.hpp"

using namespace refractor;

namespace {
    const material red = material{.diffuse = color_make(255, 0, 0), .specular = 10.f, .albedo = {.6f, .3f, 0.f, 0.f}};

    void expect_vec_near(const glm::vec3& a, const glm::vec3& b, float eps = 1e-5f)
    {
        EXPECT_NEAR(a.x, b.x, eps);
        EXPECT_NEAR(a.y, b.y, eps);
        EXPECT_NEAR(a.z, b.z, eps);
    }
}

TEST(Cube, EmptyIntersectIsZeroed)
{
    intersect i = intersect::empty();
    EXPECT_FALSE(i.is_intersecting);
    EXPECT_EQ(i.distance, 0.f);
    expect_vec_near(i.normal, glm::vec3(0.f));
}

TEST(Cube, HitsFromEveryAxis)
{
    cube c({0.f, 0.f, 0.f}, 2.f, red);
    for (int axis = 0; axis < 3; axis++)
    {
        for (float sign : {1.f, -1.f})
        {
            glm::vec3 dir(0.f);
            dir[axis] = sign;
            glm::vec3 origin = dir * 5.f;

            intersect i = c.ray_intersect(origin, -dir);
            ASSERT_TRUE(i.is_intersecting) << "axis " << axis << " sign " << sign;
            EXPECT_NEAR(i.distance, 4.f, 1e-5f);
            expect_vec_near(i.normal, dir);
            expect_vec_near(i.point, dir);
        }
    }
}

TEST(Cube, CarriesItsMaterial)
{
    cube c({0.f, 0.f, 0.f}, 2.f, red);
    intersect i = c.ray_intersect({0.f, 0.f, 5.f}, {0.f, 0.f, -1.f});
    ASSERT_TRUE(i.is_intersecting);
    EXPECT_EQ(i.material.diffuse, red.diffuse);
    EXPECT_EQ(i.material.specular, red.specular);
}

TEST(Cube, OffCenterCube)
{
    cube c({10.f, 4.f, -3.f}, 1.f, red);
    intersect i = c.ray_intersect({10.f, 10.f, -3.f}, {0.f, -1.f, 0.f});
    ASSERT_TRUE(i.is_intersecting);
    EXPECT_NEAR(i.distance, 5.5f, 1e-5f);
    expect_vec_near(i.normal, {0.f, 1.f, 0.f});
    expect_vec_near(i.point, {10.f, 4.5f, -3.f});
}

TEST(Cube, MissesOutsideSlab)
{
    cube c({0.f, 0.f, 0.f}, 2.f, red);
    EXPECT_FALSE(c.ray_intersect({3.f, 0.f, 5.f}, {0.f, 0.f, -1.f}).is_intersecting);
    EXPECT_FALSE(c.ray_intersect({0.f, 3.f, 5.f}, glm::normalize(glm::vec3(0.f, .1f, -1.f))).is_intersecting);
}

TEST(Cube, MissesBehindOrigin)
{
    cube c({0.f, 0.f, 0.f}, 2.f, red);
    EXPECT_FALSE(c.ray_intersect({0.f, 0.f, 5.f}, {0.f, 0.f, 1.f}).is_intersecting);
}

TEST(Cube, ParallelRayInsideSlabHasNoNaN)
{
    cube c({0.f, 0.f, 0.f}, 2.f, red);
    intersect i = c.ray_intersect({.5f, -.25f, 5.f}, {0.f, 0.f, -1.f});
    ASSERT_TRUE(i.is_intersecting);
    EXPECT_FALSE(std::isnan(i.distance));
    EXPECT_FALSE(std::isnan(i.normal.x) || std::isnan(i.normal.y) || std::isnan(i.normal.z));
    EXPECT_NEAR(i.distance, 4.f, 1e-5f);
    expect_vec_near(i.normal, {0.f, 0.f, 1.f});
}

TEST(Cube, ParallelRayOnSlabBoundaryHits)
{
    cube c({0.f, 0.f, 0.f}, 2.f, red);
    EXPECT_TRUE(c.ray_intersect({1.f, 0.f, 5.f}, {0.f, 0.f, -1.f}).is_intersecting);
}

TEST(Cube, ObliqueRayEntersNearestFace)
{
    cube c({0.f, 0.f, 0.f}, 2.f, red);
    glm::vec3 dir = glm::normalize(glm::vec3(-1.f, -.2f, 0.f));
    intersect i = c.ray_intersect({4.f, .5f, 0.f}, dir);
    ASSERT_TRUE(i.is_intersecting);
    expect_vec_near(i.normal, {1.f, 0.f, 0.f});
    EXPECT_NEAR(i.point.x, 1.f, 1e-5f);
}

TEST(Cube, InsideOriginReportsExitFace)
{
    cube c({0.f, 0.f, 0.f}, 2.f, red);
    intersect i = c.ray_intersect({0.f, 0.f, 0.f}, {1.f, 0.f, 0.f});
    ASSERT_TRUE(i.is_intersecting);
    EXPECT_NEAR(i.distance, 1.f, 1e-5f);
    expect_vec_near(i.normal, {1.f, 0.f, 0.f});
    expect_vec_near(i.point, {1.f, 0.f, 0.f});
}

TEST(Cube, ZeroDirectionMisses)
{
    cube c({0.f, 0.f, 0.f}, 2.f, red);
    EXPECT_FALSE(c.ray_intersect({0.f, 0.f, 0.f}, {0.f, 0.f, 0.f}).is_intersecting);
}
