// SysMeshUtils.hpp
#pragma once

#include <cassert>
#include <cstdint>
#include <span>
#include <vector>

#include "SysMesh.hpp"

namespace smu // Sys mesh utilities
{

    /**
     * @brief Hash for canonical (sorted) IndexPair edges.
     *
     * Assumes the edge is already normalized using SysMesh::sort_edge().
     * Always hash sorted edges only.
     */
    struct IndexPairHash
    {
        size_t operator()(const IndexPair& e) const noexcept
        {
            assert(e.first <= e.second && "IndexPairHash requires sorted edges");

            const uint64_t a = static_cast<uint32_t>(e.first);
            const uint64_t b = static_cast<uint32_t>(e.second);
            return (a << 32) | b;
        }
    };

    /**
     * @brief Orders an unordered edge set that must form exactly one closed loop.
     *
     * The walk starts at the first vertex of the first edge and always steps to
     * the neighbor it did not come from, until it returns to the start.
     *
     * Fails (returns false, @p outVerts cleared) if:
     *  - an edge is degenerate or has a negative vertex index
     *  - some vertex does not have exactly two neighbors
     *  - the edges form more than one cycle
     *
     * Duplicate edges (in either direction) are collapsed first.
     *
     * @param edges    Unordered edge list.
     * @param outVerts Ordered vertex ring, one entry per vertex (start is not repeated).
     */
    [[nodiscard]] bool order_boundary_loop(std::span<const IndexPair> edges, std::vector<int32_t>& outVerts);

    /**
     * @brief Appends every vertex and polygon of @p source to @p target.
     *
     * Vertices are created in source slot order, so they land after all
     * existing target slots. Source is not modified.
     *
     * @return Per source slot, the new target vertex index (-1 for dead slots).
     */
    std::vector<int32_t> append_mesh(SysMesh& target, const SysMesh& source);

    /**
     * @brief Welds vertices from @p verts that lie within @p tolerance of each other.
     *
     * Only the listed vertices take part. The first vertex of each coincident
     * group (in list order) is kept and never moves; later ones are welded into
     * it. Polygons that reference welded vertices are rebuilt (same material),
     * polygons that collapse below three corners are removed, and welded
     * vertices left unreferenced are removed.
     *
     * @return Number of vertices welded away.
     */
    int weld_verts(SysMesh& mesh, std::span<const int32_t> verts, float tolerance);

    /**
     * @brief Reverses the winding of every polygon, keeping each polygon's first vertex.
     *
     * @return True if any polygon was rewritten.
     */
    bool reverse_winding(SysMesh& mesh);

} // namespace smu
