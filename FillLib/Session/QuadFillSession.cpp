#include "QuadFillSession.hpp"

#include <iostream>
#include <utility>
#include <vector>

#include "QuadFill.hpp"
#include "QuadFillHost.hpp"

QuadFillSession::QuadFillSession(QuadFillHost& host, QuadFillSettings settings) :
    m_host{host},
    m_settings{std::move(settings)}
{
}

QuadFillSession::~QuadFillSession()
{
    cancel();
}

FillStatus QuadFillSession::capture_boundary(int32_t mesh, std::span<const IndexPair> edges)
{
    cancel();

    BoundaryLoop loop;
    FillStatus   status = ops::fill::capture_boundary(m_host, mesh, edges, loop);
    if (!status)
        return report(std::move(status));

    m_loop            = std::move(loop);
    m_limits          = ops::fill::fill_limits(m_loop.size());
    m_offset          = 0;
    m_density         = m_limits.default_density;
    m_topologyMonitor = SysMonitor(m_host.topology_counter(mesh), false);
    m_state           = State::Captured;

    const std::string count = std::to_string(m_loop.size());
    if (m_loop.odd())
        m_statusText = "ODD - " + count + " edges | 5-pole at offset | slide offset to reposition";
    else
        m_statusText = "Even - " + count + " edges | clean all-quad";

    log(m_statusText);

    status = rebuild_preview();
    if (!status)
        return report(std::move(status));

    return FillStatus::success(m_statusText);
}

FillStatus QuadFillSession::capture_selection(int32_t mesh)
{
    const std::vector<IndexPair> edges = m_host.selected_edges(mesh);
    return capture_boundary(mesh, edges);
}

FillStatus QuadFillSession::set_parameters(int offset, int density)
{
    if (m_state == State::Idle)
        return report(FillStatus::failure(FillError::InvalidState, "Capture a boundary before setting parameters."));

    FillStatus status = check_capture_current();
    if (!status)
        return report(std::move(status));

    int sy = 0;
    status = ops::fill::derive_span(m_loop.effective_count(), density, sy);
    if (!status)
        return report(std::move(status));

    const int n = m_loop.size();
    m_offset    = ((offset % n) + n) % n;
    m_density   = density;

    return report(rebuild_preview());
}

FillStatus QuadFillSession::commit()
{
    if (m_state != State::Previewing)
        return report(FillStatus::failure(FillError::InvalidState, "Preview the grid before committing."));

    FillStatus status = check_capture_current();
    if (!status)
        return report(std::move(status));

    const int32_t target      = m_loop.mesh;
    const bool    odd         = m_loop.odd();
    const int32_t targetVerts = m_host.num_verts(target);

    int32_t patchVerts = 0;
    int32_t welded     = 0;

    {
        Transaction txn(m_host, m_settings.transaction_name);

        // Any failure below reverts the target and restores the preview.
        auto fail = [&](const std::string& what) {
            txn.cancel();
            m_topologyMonitor = SysMonitor(m_host.topology_counter(target), false);

            FillStatus failure = FillStatus::failure(FillError::CommitFailure, what);
            FillStatus preview = rebuild_preview();
            if (!preview)
                failure.message += " Preview could not be rebuilt: " + preview.message;
            return report(std::move(failure));
        };

        discard_preview();

        // Same parameters as the last preview, so the result matches it exactly.
        int32_t patch = -1;
        {
            HistorySuppression suppress(m_host);

            int sy = 0;
            status = ops::fill::derive_span(m_loop.effective_count(), m_density, sy);
            if (status)
            {
                ops::fill::effective_boundary(m_loop, m_offset, m_effective);
                status = ops::fill::compute_patch_grid(m_effective.positions, m_density, sy, m_settings.closure_tolerance, m_grid);
            }
            if (status)
                status = ops::fill::build_patch(m_host, m_grid, m_loop.hole_normal, m_settings.grid_size, patch);
        }
        if (!status)
            return fail("Could not rebuild the patch: " + status.message);

        patchVerts = m_host.num_verts(patch);

        QuadFillHost::UnionResult merged = m_host.union_meshes(target, patch);
        if (merged.mesh < 0)
        {
            {
                HistorySuppression suppress(m_host);
                m_host.remove_mesh(patch);
            }
            return fail("Could not merge the patch into mesh " + std::to_string(target) + ".");
        }

        // Original boundary verts come first so they are the ones kept.
        std::vector<int32_t> seam(m_loop.verts.begin(), m_loop.verts.end());
        seam.reserve(seam.size() + m_grid.boundary_walk.size());
        for (int32_t idx : m_grid.boundary_walk)
            seam.push_back(merged.vert_remap[static_cast<size_t>(idx)]);

        welded = m_host.merge_verts_by_distance(merged.mesh, seam, m_settings.weld_tolerance);
        if (welded < m_effective.count())
            return fail("Seam weld closed " + std::to_string(welded) + " of " + std::to_string(m_effective.count()) +
                        " boundary vertices.");
    }

    m_statusText = odd ? "Quad fill done (5-pole)" : "Quad fill done";
    log(m_statusText + ": " + std::to_string(targetVerts) + " + " + std::to_string(patchVerts) + " - " +
        std::to_string(welded) + " welded vertices.");

    reset();
    m_weldedCount = welded;
    return FillStatus::success(m_statusText);
}

void QuadFillSession::cancel()
{
    discard_preview();
    reset();
}

FillStatus QuadFillSession::rebuild_preview()
{
    int        sy     = 0;
    FillStatus status = ops::fill::derive_span(m_loop.effective_count(), m_density, sy);
    if (!status)
        return status;

    HistorySuppression suppress(m_host);

    discard_preview();
    m_state = State::Captured;

    ops::fill::effective_boundary(m_loop, m_offset, m_effective);

    status = ops::fill::compute_patch_grid(m_effective.positions, m_density, sy, m_settings.closure_tolerance, m_grid);
    if (!status)
        return status;

    status = ops::fill::build_patch(m_host, m_grid, m_loop.hole_normal, m_settings.grid_size, m_previewMesh);
    if (!status)
        return status;

    m_state = State::Previewing;
    return FillStatus::success();
}

FillStatus QuadFillSession::check_capture_current()
{
    const bool gone  = m_host.num_verts(m_loop.mesh) < 0;
    const bool stale = m_topologyMonitor.valid() && m_topologyMonitor.peek();
    if (!gone && !stale)
        return FillStatus::success();

    FillStatus status = FillStatus::failure(FillError::MalformedBoundary,
                                            "Mesh " + std::to_string(m_loop.mesh) +
                                                (gone ? " no longer exists" : " changed since capture") +
                                                ", recapture the boundary.");
    cancel();
    return status;
}

void QuadFillSession::discard_preview()
{
    if (m_previewMesh < 0)
        return;

    HistorySuppression suppress(m_host);
    m_host.remove_mesh(m_previewMesh);
    m_previewMesh = -1;
}

void QuadFillSession::reset()
{
    m_state = State::Idle;
    m_loop  = BoundaryLoop{};
    m_grid  = PatchGrid{};
    m_effective.positions.clear();
    m_effective.verts.clear();
    m_limits          = FillLimits{};
    m_topologyMonitor = SysMonitor{};
    m_offset          = 0;
    m_density         = 1;
    m_previewMesh     = -1;
}

FillStatus QuadFillSession::report(FillStatus status) const
{
    if (!status.ok())
        log(std::string(to_string(status.code)) + ": " + status.message);
    return status;
}

void QuadFillSession::log(const std::string& text) const
{
    if (m_settings.verbose)
        std::cerr << "[QuadFill] " << text << '\n';
}
