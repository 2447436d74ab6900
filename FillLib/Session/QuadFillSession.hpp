#pragma once

#include <cstdint>
#include <span>
#include <string>

#include "QuadFillTypes.hpp"
#include "SysCounter.hpp"
#include "SysMesh.hpp"

class QuadFillHost;

/**
 * @class QuadFillSession
 * @brief Interactive preview/commit workflow for filling one hole.
 *
 * Idle -> Captured -> Previewing -> (Previewing | Idle after commit or cancel).
 *
 * A capture publishes offset/density limits, resets the parameters and builds
 * the first preview. Every parameter change rebuilds the preview mesh with
 * history suppressed, so previews never reach the undo stack. commit() wraps
 * the final union and seam weld in a single named transaction.
 *
 * The target mesh is referenced by id and never owned. The preview mesh is
 * owned by the session and removed on cancel, commit, recapture and destruction.
 */
class QuadFillSession
{
public:
    enum class State
    {
        Idle,
        Captured,
        Previewing,
    };

    explicit QuadFillSession(QuadFillHost& host, QuadFillSettings settings = {});
    ~QuadFillSession();

    QuadFillSession(const QuadFillSession&)            = delete;
    QuadFillSession& operator=(const QuadFillSession&) = delete;

    /**
     * @brief Captures the hole bounded by @p edges of @p mesh and builds the first preview.
     *
     * Any previous capture is discarded. On failure the session is Idle.
     */
    FillStatus capture_boundary(int32_t mesh, std::span<const IndexPair> edges);

    /// Same as capture_boundary() using the mesh's current edge selection.
    FillStatus capture_selection(int32_t mesh);

    /**
     * @brief Sets rotation offset and density (Sx) and rebuilds the preview.
     *
     * The offset wraps around the loop. A density with no valid derived span
     * fails with InvalidSpan and leaves the current preview untouched.
     */
    FillStatus set_parameters(int offset, int density);

    /**
     * @brief Merges the patch into the target mesh as one history entry.
     *
     * On CommitFailure the target is left unchanged and the session stays in
     * Previewing with a rebuilt preview.
     */
    FillStatus commit();

    /// Discards the preview (not recorded) and returns to Idle.
    void cancel();

    State state() const noexcept
    {
        return m_state;
    }

    const BoundaryLoop& boundary() const noexcept
    {
        return m_loop;
    }

    const EffectiveBoundary& effective() const noexcept
    {
        return m_effective;
    }

    const PatchGrid& patch() const noexcept
    {
        return m_grid;
    }

    const FillLimits& limits() const noexcept
    {
        return m_limits;
    }

    const QuadFillSettings& settings() const noexcept
    {
        return m_settings;
    }

    int offset() const noexcept
    {
        return m_offset;
    }

    int density() const noexcept
    {
        return m_density;
    }

    /// Id of the live preview mesh, or -1.
    int32_t preview_mesh() const noexcept
    {
        return m_previewMesh;
    }

    /// Vertices welded away by the last successful commit.
    int32_t welded_count() const noexcept
    {
        return m_weldedCount;
    }

    /// One-line summary of the last capture or commit.
    const std::string& status_text() const noexcept
    {
        return m_statusText;
    }

private:
    FillStatus rebuild_preview();
    FillStatus check_capture_current();
    void       discard_preview();
    void       reset();
    FillStatus report(FillStatus status) const;
    void       log(const std::string& text) const;

private:
    QuadFillHost&     m_host;
    QuadFillSettings  m_settings;
    State             m_state{State::Idle};
    BoundaryLoop      m_loop;
    EffectiveBoundary m_effective;
    PatchGrid         m_grid;
    FillLimits        m_limits;
    SysMonitor        m_topologyMonitor; ///< Detects target edits made outside the session.
    std::string       m_statusText;
    int32_t           m_previewMesh{-1};
    int32_t           m_weldedCount{0};
    int               m_offset{0};
    int               m_density{1};
};
