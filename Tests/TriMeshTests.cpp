#include <gtest/gtest.h>

#include <cmath>
#include <glm/gtc/matrix_transform.hpp>
#include <limits>

#include "CoreUtilities.hpp"
#include "TriMesh.hpp"
#include "TriMeshUtils.hpp"

// ------------------------------------------------------------
// TriMesh
// ------------------------------------------------------------

TEST(TriMesh, EmptyMeshIsNotIndexable)
{
    TriMesh mesh;
    EXPECT_EQ(mesh.num_tris(), 0u);
    EXPECT_FALSE(mesh.indexable());
}

TEST(TriMesh, OutOfRangeIndexIsNotIndexable)
{
    TriMesh mesh;
    mesh.create_vert({0, 0, 0});
    mesh.create_vert({1, 0, 0});
    mesh.create_tri(0, 1, 2);

    EXPECT_FALSE(mesh.tri_valid(0));
    EXPECT_FALSE(mesh.indexable());
}

TEST(TriMesh, NonFinitePositionIsNotIndexable)
{
    TriMesh mesh;
    mesh.create_vert({0, 0, 0});
    mesh.create_vert({1, 0, 0});
    mesh.create_vert({0, std::numeric_limits<float>::quiet_NaN(), 1});
    mesh.create_tri(0, 1, 2);

    EXPECT_FALSE(mesh.indexable());
}

TEST(TriMesh, DegenerateTriangleHasZeroNormal)
{
    TriMesh mesh;
    mesh.create_vert({0, 0, 0});
    mesh.create_vert({1, 0, 0});
    mesh.create_vert({2, 0, 0});
    mesh.create_tri(0, 1, 2);

    EXPECT_TRUE(lw::is_zero(mesh.tri_normal(0)));
}

TEST(TriMesh, TransformedMovesPositionsOnly)
{
    const TriMesh box   = tmu::make_box(glm::vec3(0.0f), glm::vec3(1.0f));
    const TriMesh moved = box.transformed(glm::translate(glm::mat4(1.0f), glm::vec3(5.0f, 0.0f, 0.0f)));

    ASSERT_EQ(moved.num_tris(), box.num_tris());

    const auto [lo, hi] = moved.bounds();
    EXPECT_TRUE(lw::equal(lo, glm::vec3(4.0f, -1.0f, -1.0f)));
    EXPECT_TRUE(lw::equal(hi, glm::vec3(6.0f, 1.0f, 1.0f)));
}

TEST(TriMesh, AppendOffsetsIndices)
{
    TriMesh a = tmu::make_plane(glm::vec3(0.0f), 1.0f, 1.0f);
    const TriMesh b = tmu::make_plane(glm::vec3(0.0f, 2.0f, 0.0f), 1.0f, 1.0f);

    const uint32_t vertsBefore = a.num_verts();
    a.append(b);

    EXPECT_EQ(a.num_tris(), 4u);
    EXPECT_TRUE(a.indexable());
    EXPECT_EQ(a.tri_verts(2)[0], b.tri_verts(0)[0] + static_cast<int32_t>(vertsBefore));
}

// ------------------------------------------------------------
// Primitive builders
// ------------------------------------------------------------

TEST(TriMeshUtils, GridHasExactTriangleCountAndFacesUp)
{
    const TriMesh grid = tmu::make_grid(glm::vec3(0.0f), 10.0f, 4.0f, 25, 20);

    EXPECT_EQ(grid.num_tris(), 1000u);
    EXPECT_EQ(grid.num_verts(), 26u * 21u);

    for (uint32_t i = 0; i < grid.num_tris(); ++i)
        EXPECT_TRUE(lw::equal(grid.tri_normal(static_cast<int32_t>(i)), glm::vec3(0.0f, 1.0f, 0.0f)));
}

TEST(TriMeshUtils, BoxFacesPointOutward)
{
    const glm::vec3 center(1.0f, 2.0f, 3.0f);
    const TriMesh   box = tmu::make_box(center, glm::vec3(0.5f, 1.0f, 2.0f));

    ASSERT_EQ(box.num_tris(), 12u);

    for (uint32_t i = 0; i < box.num_tris(); ++i)
    {
        const TriVerts& t = box.tri_verts(static_cast<int32_t>(i));
        const glm::vec3 centroid =
            (box.vert_position(t[0]) + box.vert_position(t[1]) + box.vert_position(t[2])) / 3.0f;

        EXPECT_GT(glm::dot(box.tri_normal(static_cast<int32_t>(i)), centroid - center), 0.0f) << "triangle " << i;
    }
}

// ------------------------------------------------------------
// Ray / triangle
// ------------------------------------------------------------

TEST(RayTriangle, HitsFromEitherSide)
{
    const glm::vec3 a(-1, 0, -1), b(1, 0, -1), c(0, 0, 1);

    float t = 0.0f;
    EXPECT_TRUE(lw::ray_triangle_intersect(lw::make_ray({0, 2, 0}, {0, -1, 0}), a, b, c, t));
    EXPECT_NEAR(t, 2.0f, 1e-5f);

    EXPECT_TRUE(lw::ray_triangle_intersect(lw::make_ray({0, -3, 0}, {0, 1, 0}), a, b, c, t));
    EXPECT_NEAR(t, 3.0f, 1e-5f);
}

TEST(RayTriangle, IgnoresHitsBehindOrigin)
{
    const glm::vec3 a(-1, 0, -1), b(1, 0, -1), c(0, 0, 1);

    float t = 0.0f;
    EXPECT_FALSE(lw::ray_triangle_intersect(lw::make_ray({0, 2, 0}, {0, 1, 0}), a, b, c, t));
    EXPECT_FALSE(lw::ray_triangle_intersect(lw::make_ray({5, 2, 0}, {0, -1, 0}), a, b, c, t));
}

TEST(YawPitchRotation, ForwardMatchesAngles)
{
    const float yaw   = 0.7f;
    const float pitch = -0.3f;

    const glm::vec3 forward = -lw::yaw_pitch_rotation(yaw, pitch)[2];
    const glm::vec3 expected(-std::sin(yaw) * std::cos(pitch), std::sin(pitch), -std::cos(yaw) * std::cos(pitch));

    EXPECT_TRUE(lw::equal(forward, expected));
}
