#include "QuadFill.hpp"

#include <algorithm>
#include <iterator>
#include <string>

#include "CoreUtilities.hpp"
#include "QuadFillHost.hpp"
#include "SysMeshUtils.hpp"

namespace ops::fill
{
    namespace
    {
        const glm::vec3 kDefaultNormal{0.0f, 1.0f, 0.0f};

        std::string span_text(int sx, int sy)
        {
            return "(Sx " + std::to_string(sx) + ", Sy " + std::to_string(sy) + ")";
        }

        const glm::vec3& clamped(const std::vector<glm::vec3>& curve, int i) noexcept
        {
            return curve[static_cast<size_t>(std::min(i, static_cast<int>(curve.size()) - 1))];
        }

    } // namespace

    FillStatus capture_boundary(const QuadFillHost& host, int32_t mesh, std::span<const IndexPair> edges, BoundaryLoop& out)
    {
        out = BoundaryLoop{};

        const std::string count = std::to_string(edges.size());

        if (edges.size() < 4)
            return FillStatus::failure(FillError::InsufficientEdges,
                                       "Need at least 4 border edges (got " + count + ").");

        std::vector<IndexPair> pairs;
        if (!host.edge_vertex_pairs(mesh, edges, pairs))
            return FillStatus::failure(FillError::MalformedBoundary,
                                       "Not all of the " + count + " edges belong to mesh " + std::to_string(mesh) + ".");

        std::vector<int32_t> ring;
        if (!smu::order_boundary_loop(pairs, ring))
            return FillStatus::failure(FillError::MalformedBoundary,
                                       "The " + count + " edges do not form one closed loop.");

        // Duplicate edges can leave fewer distinct vertices than edges.
        if (ring.size() < 4)
            return FillStatus::failure(FillError::InsufficientEdges,
                                       "Need at least 4 border edges (got " + std::to_string(ring.size()) + " distinct).");

        out.mesh  = mesh;
        out.verts = std::move(ring);
        out.positions.reserve(out.verts.size());
        for (int32_t v : out.verts)
            out.positions.push_back(host.vert_position(mesh, v));

        // One entry per loop edge, repeated input edges are not weighted twice.
        pairs.resize(out.verts.size());
        for (size_t i = 0; i < out.verts.size(); ++i)
            pairs[i] = {out.verts[i], out.verts[(i + 1) % out.verts.size()]};

        out.hole_normal = detect_hole_normal(host, mesh, pairs);
        reconcile_orientation(out);

        return FillStatus::success();
    }

    glm::vec3 detect_hole_normal(const QuadFillHost& host, int32_t mesh, std::span<const IndexPair> edges)
    {
        glm::vec3 sum(0.0f);
        int       count = 0;

        for (const IndexPair& e : edges)
        {
            for (int32_t f : host.faces_adjacent_to_edge(mesh, e))
            {
                sum += host.face_normal(mesh, f);
                ++count;
            }
        }

        if (count == 0)
            return kDefaultNormal;

        return un::safe_normalize(sum / static_cast<float>(count), kDefaultNormal, 1e-6f);
    }

    glm::vec3 loop_normal(std::span<const glm::vec3> positions)
    {
        const size_t n = positions.size();

        glm::vec3 normal(0.0f);
        for (size_t i = 0; i < n; ++i)
        {
            const glm::vec3& c = positions[i];
            const glm::vec3& d = positions[(i + 1) % n];

            normal.x += (c.y - d.y) * (c.z + d.z);
            normal.y += (c.z - d.z) * (c.x + d.x);
            normal.z += (c.x - d.x) * (c.y + d.y);
        }

        return un::safe_normalize(normal, kDefaultNormal, 1e-9f);
    }

    void reconcile_orientation(BoundaryLoop& loop)
    {
        loop.winding_normal = loop_normal(loop.positions);

        // Exactly orthogonal normals keep the captured order.
        if (glm::dot(loop.winding_normal, loop.hole_normal) < 0.0f)
        {
            std::reverse(loop.verts.begin(), loop.verts.end());
            std::reverse(loop.positions.begin(), loop.positions.end());
            loop.winding_normal = loop_normal(loop.positions);
        }
    }

    FillLimits fill_limits(int loopSize) noexcept
    {
        const int effective = loopSize + (loopSize % 2);

        FillLimits limits;
        limits.max_offset      = std::max(1, loopSize - 1);
        limits.max_density     = std::max(1, effective / 2 - 1);
        limits.default_density = std::max(1, limits.max_density / 2);
        return limits;
    }

    void effective_boundary(const BoundaryLoop& loop, int offset, EffectiveBoundary& out)
    {
        const int n = loop.size();
        if (n == 0)
        {
            out.positions.clear();
            out.verts.clear();
            return;
        }

        const int start = ((offset % n) + n) % n;
        const int count = loop.effective_count();

        out.positions.resize(static_cast<size_t>(count));
        out.verts.resize(static_cast<size_t>(count));

        for (int i = 0; i < n; ++i)
        {
            const size_t dst = static_cast<size_t>(i);
            const size_t src = static_cast<size_t>((start + i) % n);

            out.positions[dst] = loop.positions[src];
            out.verts[dst]     = loop.verts[src];
        }

        // Pole: the extra slot repeats the first rotated vertex.
        if (count > n)
        {
            out.positions.back() = out.positions.front();
            out.verts.back()     = out.verts.front();
        }
    }

    FillStatus derive_span(int effectiveCount, int sx, int& outSy)
    {
        outSy = (sx >= 1) ? (effectiveCount - 2 * sx) / 2 : 0;

        if (sx < 1 || outSy < 1)
            return FillStatus::failure(FillError::InvalidSpan,
                                       "Loop cuts too high for " + std::to_string(effectiveCount) + " boundary points " +
                                           span_text(sx, outSy) + ", reduce Sx.");

        return FillStatus::success();
    }

    std::vector<int32_t> boundary_index_walk(int sx, int sy)
    {
        std::vector<int32_t> walk;
        if (sx < 1 || sy < 1)
            return walk;

        const int stride = sx + 1;
        walk.reserve(static_cast<size_t>(2 * sx + 2 * sy));

        for (int x = 0; x <= sx; ++x) // bottom, left to right
            walk.push_back(x);
        for (int y = 1; y < sy; ++y) // right, bottom to top
            walk.push_back(y * stride + sx);
        for (int x = sx; x >= 0; --x) // top, right to left
            walk.push_back(sy * stride + x);
        for (int y = sy - 1; y > 0; --y) // left, top to bottom
            walk.push_back(y * stride);

        return walk;
    }

    std::vector<glm::vec3> resample_curve(std::span<const glm::vec3> curve, int count)
    {
        const int size = static_cast<int>(curve.size());

        if (size == count || count <= 0)
            return std::vector<glm::vec3>(curve.begin(), curve.end());

        if (size < 2)
            return std::vector<glm::vec3>(static_cast<size_t>(count), size == 1 ? curve[0] : glm::vec3(0.0f));

        std::vector<glm::vec3> out;
        out.reserve(static_cast<size_t>(count));

        for (int i = 0; i < count; ++i)
        {
            const float t = static_cast<float>(i) / static_cast<float>(std::max(count - 1, 1));
            const float s = t * static_cast<float>(size - 1);
            const int   j = std::min(static_cast<int>(s), size - 2);
            const float f = s - static_cast<float>(j);

            out.push_back(curve[static_cast<size_t>(j)] * (1.0f - f) + curve[static_cast<size_t>(j + 1)] * f);
        }

        return out;
    }

    FillStatus compute_patch_grid(std::span<const glm::vec3> vpos, int sx, int sy, float closureTolerance, PatchGrid& out)
    {
        const int n = 2 * sx + 2 * sy;
        if (sx < 1 || sy < 1 || static_cast<int>(vpos.size()) != n)
            return FillStatus::failure(FillError::InvalidSpan,
                                       std::to_string(vpos.size()) + " boundary points do not fit spans " + span_text(sx, sy) + ".");

        out.sx            = sx;
        out.sy            = sy;
        out.boundary_walk = boundary_index_walk(sx, sy);
        out.positions.assign(static_cast<size_t>(out.num_verts()), glm::vec3(0.0f));

        std::vector<bool> onBoundary(static_cast<size_t>(out.num_verts()), false);
        for (int k = 0; k < n; ++k)
        {
            const size_t idx   = static_cast<size_t>(out.boundary_walk[static_cast<size_t>(k)]);
            out.positions[idx] = vpos[static_cast<size_t>(k)];
            onBoundary[idx]    = true;
        }

        // Corners
        const glm::vec3 c00 = vpos[0];
        const glm::vec3 c10 = vpos[static_cast<size_t>(sx)];
        const glm::vec3 c11 = vpos[static_cast<size_t>(sx + sy)];
        const glm::vec3 c01 = vpos[static_cast<size_t>(2 * sx + sy)];

        // Boundary curves, all parametrized from the c00 side.
        const std::vector<glm::vec3> bottom(vpos.begin(), vpos.begin() + sx + 1);
        const std::vector<glm::vec3> right(vpos.begin() + sx, vpos.begin() + sx + sy + 1);
        const std::vector<glm::vec3> top(std::make_reverse_iterator(vpos.begin() + 2 * sx + sy + 1),
                                         std::make_reverse_iterator(vpos.begin() + sx + sy));

        // Left curve: close back to c00 unless the pole duplicate already did.
        std::vector<glm::vec3> rawLeft(vpos.begin() + 2 * sx + sy, vpos.end());
        if (!un::equal(vpos.back(), vpos.front(), closureTolerance))
            rawLeft.push_back(vpos.front());
        std::reverse(rawLeft.begin(), rawLeft.end());

        const std::vector<glm::vec3> left = resample_curve(rawLeft, sy + 1);

        // Coons interior
        const int stride = out.row_stride();
        for (int idx = 0; idx < out.num_verts(); ++idx)
        {
            if (onBoundary[static_cast<size_t>(idx)])
                continue;

            const int   col = idx % stride;
            const int   row = idx / stride;
            const float u   = static_cast<float>(col) / static_cast<float>(sx);
            const float v   = static_cast<float>(row) / static_cast<float>(sy);

            const glm::vec3& B = clamped(bottom, col);
            const glm::vec3& T = clamped(top, col);
            const glm::vec3& L = clamped(left, row);
            const glm::vec3& R = clamped(right, row);

            out.positions[static_cast<size_t>(idx)] =
                (1.0f - u) * L + u * R + (1.0f - v) * B + v * T -
                ((1.0f - u) * (1.0f - v) * c00 + u * (1.0f - v) * c10 + (1.0f - u) * v * c01 + u * v * c11);
        }

        return FillStatus::success();
    }

    FillStatus build_patch(QuadFillHost& host, const PatchGrid& grid, const glm::vec3& holeNormal, const glm::vec2& gridSize, int32_t& outMesh)
    {
        outMesh = -1;

        const int32_t mesh = host.create_grid(gridSize.x, gridSize.y, grid.sx, grid.sy);
        if (mesh < 0)
            return FillStatus::failure(FillError::ConstructionFailure,
                                       "Could not create a grid " + span_text(grid.sx, grid.sy) + ".");

        auto fail = [&](const std::string& what) {
            host.remove_mesh(mesh);
            return FillStatus::failure(FillError::ConstructionFailure, what + " " + span_text(grid.sx, grid.sy) + ".");
        };

        if (host.num_verts(mesh) != grid.num_verts())
            return fail("Grid has " + std::to_string(host.num_verts(mesh)) + " vertices, expected " +
                        std::to_string(grid.num_verts()));

        for (int32_t idx = 0; idx < grid.num_verts(); ++idx)
        {
            if (!host.set_vert_position(mesh, idx, grid.positions[static_cast<size_t>(idx)]))
                return fail("Could not position grid vertex " + std::to_string(idx));
        }

        // Average all patch faces to determine orientation.
        glm::vec3     avg(0.0f);
        const int32_t faces = host.num_polys(mesh);
        for (int32_t f = 0; f < faces; ++f)
            avg += un::safe_normalize(host.face_normal(mesh, f));

        const float mag = glm::length(avg);
        if (mag > 1e-6f && glm::dot(avg / mag, holeNormal) < 0.0f)
        {
            if (!host.flip_face_orientation(mesh))
                return fail("Could not flip grid");
        }

        outMesh = mesh;
        return FillStatus::success();
    }

} // namespace ops::fill
