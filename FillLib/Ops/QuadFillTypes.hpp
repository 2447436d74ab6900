#pragma once

#include <cstdint>
#include <glm/glm.hpp>
#include <string>
#include <utility>
#include <vector>

/// Failure categories reported by the fill ops and the session.
enum class FillError
{
    None,
    InsufficientEdges,   ///< Fewer than 4 boundary edges.
    MalformedBoundary,   ///< Edges are not one simple cycle, or the capture went stale.
    InvalidSpan,         ///< Density leaves no room for a derived span >= 1.
    ConstructionFailure, ///< The grid primitive could not be created or positioned.
    CommitFailure,       ///< Union or seam weld failed while committing.
    InvalidState,        ///< Call made in the wrong session state.
};

/// @return A stable name for @p error ("InvalidSpan", ...).
const char* to_string(FillError error) noexcept;

/**
 * @brief Result of a fill op or session call.
 *
 * Carries an error code and a human readable message with the counts and
 * parameters involved. A default constructed status is a success.
 */
struct [[nodiscard]] FillStatus
{
    FillError   code{FillError::None};
    std::string message;

    bool ok() const noexcept
    {
        return code == FillError::None;
    }

    explicit operator bool() const noexcept
    {
        return ok();
    }

    static FillStatus success(std::string msg = {})
    {
        return FillStatus{FillError::None, std::move(msg)};
    }

    static FillStatus failure(FillError error, std::string msg)
    {
        return FillStatus{error, std::move(msg)};
    }
};

/// Tunables for a fill session.
struct QuadFillSettings
{
    float       weld_tolerance{1e-4f};     ///< Seam weld distance.
    float       closure_tolerance{1e-6f};  ///< Per-axis tolerance of the "left curve already closed" test.
    glm::vec2   grid_size{1.0f, 1.0f};     ///< Extent of the freshly allocated planar grid.
    std::string transaction_name{"QuadFill"};
    bool        verbose{true};             ///< Log capture/commit events to std::cerr.
};

/**
 * @brief Ordered boundary of a hole, oriented counter-clockwise around hole_normal.
 */
struct BoundaryLoop
{
    int32_t                mesh{-1};
    std::vector<int32_t>   verts;
    std::vector<glm::vec3> positions;
    glm::vec3              hole_normal{0.0f, 1.0f, 0.0f};
    glm::vec3              winding_normal{0.0f, 1.0f, 0.0f};

    int size() const noexcept
    {
        return static_cast<int>(verts.size());
    }

    bool odd() const noexcept
    {
        return (size() % 2) != 0;
    }

    /// Boundary length after pole duplication (always even).
    int effective_count() const noexcept
    {
        return size() + (odd() ? 1 : 0);
    }

    bool empty() const noexcept
    {
        return verts.empty();
    }
};

/**
 * @brief Boundary rotated by an offset, with the pole duplicate appended for odd loops.
 *
 * verts[i] is the mesh vertex whose position is positions[i]. The buffers are
 * reused between rebuilds.
 */
struct EffectiveBoundary
{
    std::vector<glm::vec3> positions;
    std::vector<int32_t>   verts;

    int count() const noexcept
    {
        return static_cast<int>(positions.size());
    }
};

/**
 * @brief Structured (sx+1) x (sy+1) vertex grid, row-major (index = row * (sx+1) + col).
 *
 * boundary_walk lists the perimeter indices: bottom row left to right, right
 * column bottom to top, top row right to left, left column top to bottom.
 */
struct PatchGrid
{
    int                    sx{0};
    int                    sy{0};
    std::vector<glm::vec3> positions;
    std::vector<int32_t>   boundary_walk;

    int row_stride() const noexcept
    {
        return sx + 1;
    }

    int num_verts() const noexcept
    {
        return (sx + 1) * (sy + 1);
    }
};

/// Slider ranges published after a capture.
struct FillLimits
{
    int max_offset{1};
    int max_density{1};
    int default_density{1};
};
