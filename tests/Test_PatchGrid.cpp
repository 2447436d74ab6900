#include <gtest/gtest.h>

#include <cmath>
#include <numbers>
#include <vector>

#include <glm/glm.hpp>

#include "QuadFill.hpp"
#include "SceneQuadFillHost.hpp"
#include "SysMesh.hpp"
#include "SysMeshScene.hpp"

namespace
{
    constexpr float kTol = 1e-6f;

    // Square perimeter of side 2 in the XZ plane, walked in boundary order
    // for (sx, sy) = (2, 2): bottom, right, top, left.
    std::vector<glm::vec3> SquareBoundary()
    {
        return {{0, 0, 0}, {1, 0, 0}, {2, 0, 0}, {2, 0, 1}, {2, 0, 2}, {1, 0, 2}, {0, 0, 2}, {0, 0, 1}};
    }

    // Bumpy closed loop with `count` points, used where only the walk matters.
    std::vector<glm::vec3> WavyBoundary(int count)
    {
        std::vector<glm::vec3> pts;
        const float            step = 2.0f * std::numbers::pi_v<float> / static_cast<float>(count);
        for (int i = 0; i < count; ++i)
        {
            const float a = step * static_cast<float>(i);
            pts.push_back({std::cos(a) * 3.0f, 0.3f * std::sin(3.0f * a), -std::sin(a) * 2.0f});
        }
        return pts;
    }

    void ExpectNear(const glm::vec3& a, const glm::vec3& b, float tol)
    {
        EXPECT_NEAR(a.x, b.x, tol);
        EXPECT_NEAR(a.y, b.y, tol);
        EXPECT_NEAR(a.z, b.z, tol);
    }
} // namespace

// =============================================================================
// Boundary walk and resampling
// =============================================================================

TEST(BoundaryIndexWalk, PerimeterOrder)
{
    EXPECT_EQ(ops::fill::boundary_index_walk(2, 2), (std::vector<int32_t>{0, 1, 2, 5, 8, 7, 6, 3}));
    EXPECT_EQ(ops::fill::boundary_index_walk(1, 1), (std::vector<int32_t>{0, 1, 3, 2}));
    EXPECT_EQ(ops::fill::boundary_index_walk(2, 1), (std::vector<int32_t>{0, 1, 2, 5, 4, 3}));
    EXPECT_EQ(ops::fill::boundary_index_walk(3, 2).size(), 10u);
    EXPECT_TRUE(ops::fill::boundary_index_walk(0, 2).empty());
}

TEST(ResampleCurve, UniformAlongPolyline)
{
    const std::vector<glm::vec3> line{{0, 0, 0}, {1, 0, 0}, {2, 0, 0}};

    const std::vector<glm::vec3> four = ops::fill::resample_curve(line, 4);
    ASSERT_EQ(four.size(), 4u);
    EXPECT_NEAR(four[0].x, 0.0f, kTol);
    EXPECT_NEAR(four[1].x, 2.0f / 3.0f, kTol);
    EXPECT_NEAR(four[2].x, 4.0f / 3.0f, kTol);
    EXPECT_NEAR(four[3].x, 2.0f, kTol);

    // Same length: returned as is.
    EXPECT_EQ(ops::fill::resample_curve(line, 3), line);
}

// =============================================================================
// compute_patch_grid
// =============================================================================

TEST(ComputePatchGrid, CoonsReproducesPlanarSquare)
{
    const std::vector<glm::vec3> vpos = SquareBoundary();

    PatchGrid grid;
    ASSERT_TRUE(ops::fill::compute_patch_grid(vpos, 2, 2, 1e-6f, grid).ok());

    ASSERT_EQ(grid.num_verts(), 9);
    ExpectNear(grid.positions[4], glm::vec3(1.0f, 0.0f, 1.0f), kTol);
}

TEST(ComputePatchGrid, BoundaryVerticesAreNeverAltered)
{
    for (int sx = 1; sx <= 5; ++sx)
    {
        for (int sy = 1; sy <= 4; ++sy)
        {
            const std::vector<glm::vec3> vpos = WavyBoundary(2 * sx + 2 * sy);

            PatchGrid grid;
            ASSERT_TRUE(ops::fill::compute_patch_grid(vpos, sx, sy, 1e-6f, grid).ok());
            ASSERT_EQ(grid.boundary_walk.size(), vpos.size());

            for (size_t k = 0; k < vpos.size(); ++k)
                ExpectNear(grid.positions[grid.boundary_walk[k]], vpos[k], kTol);
        }
    }
}

TEST(ComputePatchGrid, FourEdgeLoopHasNoInterior)
{
    const std::vector<glm::vec3> vpos{{0, 0, 0}, {2, 0, 0}, {2, 1, -2}, {0, 0, -3}};

    PatchGrid grid;
    ASSERT_TRUE(ops::fill::compute_patch_grid(vpos, 1, 1, 1e-6f, grid).ok());

    ASSERT_EQ(grid.num_verts(), 4);
    EXPECT_EQ(grid.positions[0], vpos[0]);
    EXPECT_EQ(grid.positions[1], vpos[1]);
    EXPECT_EQ(grid.positions[3], vpos[2]);
    EXPECT_EQ(grid.positions[2], vpos[3]);
}

TEST(ComputePatchGrid, OddLoopPoleSharesFirstPosition)
{
    BoundaryLoop loop;
    const std::vector<glm::vec3> pts = WavyBoundary(7);
    for (int i = 0; i < 7; ++i)
    {
        loop.verts.push_back(i);
        loop.positions.push_back(pts[i]);
    }

    for (int offset = 0; offset < 7; ++offset)
    {
        EffectiveBoundary eff;
        ops::fill::effective_boundary(loop, offset, eff);
        ASSERT_EQ(eff.count(), 8);

        for (int sx = 1; sx <= 3; ++sx)
        {
            int sy = 0;
            ASSERT_TRUE(ops::fill::derive_span(eff.count(), sx, sy).ok());

            PatchGrid grid;
            ASSERT_TRUE(ops::fill::compute_patch_grid(eff.positions, sx, sy, 1e-6f, grid).ok());

            EXPECT_EQ(grid.positions[grid.boundary_walk.front()], grid.positions[grid.boundary_walk.back()]);
            EXPECT_EQ(grid.positions[grid.boundary_walk.front()], pts[offset]);
        }
    }
}

TEST(ComputePatchGrid, RebuildIsBitIdentical)
{
    const std::vector<glm::vec3> vpos = WavyBoundary(12);

    PatchGrid a;
    PatchGrid b;
    ASSERT_TRUE(ops::fill::compute_patch_grid(vpos, 3, 3, 1e-6f, a).ok());
    ASSERT_TRUE(ops::fill::compute_patch_grid(vpos, 3, 3, 1e-6f, b).ok());

    ASSERT_EQ(a.positions.size(), b.positions.size());
    for (size_t i = 0; i < a.positions.size(); ++i)
        EXPECT_EQ(a.positions[i], b.positions[i]);
    EXPECT_EQ(a.boundary_walk, b.boundary_walk);
}

TEST(ComputePatchGrid, RejectsMismatchedSpans)
{
    const std::vector<glm::vec3> vpos = WavyBoundary(8);

    PatchGrid grid;
    EXPECT_EQ(ops::fill::compute_patch_grid(vpos, 3, 2, 1e-6f, grid).code, FillError::InvalidSpan);
    EXPECT_EQ(ops::fill::compute_patch_grid(vpos, 4, 0, 1e-6f, grid).code, FillError::InvalidSpan);
}

TEST(ComputePatchGrid, ClosureToleranceControlsLeftCurve)
{
    // Last point sits 1e-3 away from the first: "closed" only with a loose tolerance.
    std::vector<glm::vec3> vpos = SquareBoundary();
    vpos.back()                 = glm::vec3(0.0f, 0.0f, 1e-3f);

    PatchGrid strict;
    PatchGrid loose;
    ASSERT_TRUE(ops::fill::compute_patch_grid(vpos, 2, 2, 1e-6f, strict).ok());
    ASSERT_TRUE(ops::fill::compute_patch_grid(vpos, 2, 2, 1e-2f, loose).ok());

    // Strict closes the curve with vpos[0]: L(1) = vpos[7].
    // Loose treats vpos[7] as the end and resamples [vpos6, vpos7] to 3 points.
    EXPECT_NE(strict.positions[4], loose.positions[4]);
    EXPECT_EQ(strict.positions[3], loose.positions[3]);
}

// =============================================================================
// build_patch
// =============================================================================

TEST(BuildPatch, InstantiatesGridFacingHoleNormal)
{
    SysMeshScene      scene;
    SceneQuadFillHost host(&scene);

    PatchGrid grid;
    ASSERT_TRUE(ops::fill::compute_patch_grid(SquareBoundary(), 2, 2, 1e-6f, grid).ok());

    for (float side : {1.0f, -1.0f})
    {
        const glm::vec3 holeNormal(0.0f, side, 0.0f);

        int32_t mesh = -1;
        ASSERT_TRUE(ops::fill::build_patch(host, grid, holeNormal, {1.0f, 1.0f}, mesh).ok());
        ASSERT_NE(scene.mesh(mesh), nullptr);

        const SysMesh* m = scene.mesh(mesh);
        EXPECT_EQ(m->num_verts(), 9u);
        EXPECT_EQ(m->num_polys(), 4u);

        for (int32_t v = 0; v < 9; ++v)
            EXPECT_EQ(m->vert_position(v), grid.positions[v]);

        for (int32_t p : m->all_polys())
            EXPECT_GT(glm::dot(m->poly_normal(p), holeNormal), 0.99f);
    }
}

TEST(BuildPatch, ReportsConstructionFailure)
{
    SysMeshScene      scene;
    SceneQuadFillHost host(&scene);

    PatchGrid grid;
    ASSERT_TRUE(ops::fill::compute_patch_grid(SquareBoundary(), 2, 2, 1e-6f, grid).ok());

    int32_t mesh = 7;
    EXPECT_EQ(ops::fill::build_patch(host, grid, {0, 1, 0}, {0.0f, 1.0f}, mesh).code, FillError::ConstructionFailure);
    EXPECT_EQ(mesh, -1);
    EXPECT_TRUE(scene.meshes().empty());
}
