#pragma once

#include <cstdint>
#include <glm/glm.hpp>
#include <span>
#include <vector>

#include "QuadFillTypes.hpp"
#include "SysMesh.hpp"

class QuadFillHost;

/**
 * @brief Boundary-constrained quad patch generation (hole filling).
 *
 * The pipeline is:
 *  1. capture_boundary()   : edges -> oriented BoundaryLoop
 *  2. effective_boundary() : rotate by offset, duplicate a pole for odd loops
 *  3. compute_patch_grid() : boundary walk + Coons interior, pure math
 *  4. build_patch()        : instantiate the grid as a host mesh
 */
namespace ops::fill
{
    /**
     * @brief Orders boundary edges of @p mesh into an oriented loop.
     *
     * Fails with InsufficientEdges for fewer than 4 edges and with
     * MalformedBoundary if the edges are not one simple cycle of real edges.
     * The resulting loop runs counter-clockwise around its hole normal.
     */
    FillStatus capture_boundary(const QuadFillHost& host, int32_t mesh, std::span<const IndexPair> edges, BoundaryLoop& out);

    /**
     * @brief Average normal of the faces bordering the hole.
     * @return Unit normal, or (0,1,0) if no usable face normal is found.
     */
    glm::vec3 detect_hole_normal(const QuadFillHost& host, int32_t mesh, std::span<const IndexPair> edges);

    /**
     * @brief Winding normal of a closed polygon (Newell's method).
     * @return Unit normal, or (0,1,0) if the loop has no area.
     */
    glm::vec3 loop_normal(std::span<const glm::vec3> positions);

    /// Reverses the loop if its winding normal points away from the hole normal.
    void reconcile_orientation(BoundaryLoop& loop);

    /// Offset and density ranges for a loop of @p loopSize vertices.
    FillLimits fill_limits(int loopSize) noexcept;

    /**
     * @brief Rotates @p loop by @p offset (taken modulo the loop size) and, for
     *        odd loops, appends a copy of the first rotated entry.
     *
     * @p out buffers are reused.
     */
    void effective_boundary(const BoundaryLoop& loop, int offset, EffectiveBoundary& out);

    /**
     * @brief Derived span Sy = (effectiveCount - 2*Sx) / 2.
     *
     * Fails with InvalidSpan if @p sx < 1 or the derived span is below 1.
     */
    FillStatus derive_span(int effectiveCount, int sx, int& outSy);

    /// Perimeter indices of a row-major (sx+1) x (sy+1) grid, in boundary order.
    std::vector<int32_t> boundary_index_walk(int sx, int sy);

    /// Piecewise-linear resample of @p curve to exactly @p count points.
    std::vector<glm::vec3> resample_curve(std::span<const glm::vec3> curve, int count);

    /**
     * @brief Lays the boundary positions on the grid perimeter and fills the
     *        interior by Coons-patch interpolation.
     *
     * @param vpos             Effective boundary positions, size 2*sx + 2*sy.
     * @param closureTolerance Per-axis tolerance deciding whether the left
     *                         curve already closes back to vpos[0].
     */
    FillStatus compute_patch_grid(std::span<const glm::vec3> vpos, int sx, int sy, float closureTolerance, PatchGrid& out);

    /**
     * @brief Instantiates @p grid as a new host mesh facing @p holeNormal.
     *
     * Fails with ConstructionFailure if the grid cannot be created, has an
     * unexpected vertex count, or cannot be positioned or flipped. A partially
     * built mesh is removed before returning.
     */
    FillStatus build_patch(QuadFillHost& host, const PatchGrid& grid, const glm::vec3& holeNormal, const glm::vec2& gridSize, int32_t& outMesh);

} // namespace ops::fill
