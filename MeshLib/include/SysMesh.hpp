//
//  SysMesh.hpp
//  Mesh
//

#ifndef SYS_MESH_HPP_INCLUDED
#define SYS_MESH_HPP_INCLUDED

#include <cstdint>
#include <glm/vec3.hpp>
#include <memory>
#include <utility>
#include <vector>

#include "History.hpp"
#include "SysCounter.hpp"

using IndexPair    = std::pair<int32_t, int32_t>;
using SysVertPolys = std::vector<int32_t>;
using SysEdgePolys = std::vector<int32_t>;
using SysPolyVerts = std::vector<int32_t>;
using SysPolyEdges = std::vector<IndexPair>;

/**
 * @brief Editable polygon mesh with per-mesh undo recording.
 *
 * Vertices and polygons live in slot-stable storage: indices never shift,
 * removal leaves a tombstone and new elements are always appended after the
 * current slot range.
 *
 * Every mutation records an undo action into the mesh's local history unless
 * recording() is false, which happens while the history is replaying or while
 * the suppression depth the mesh watches is non-zero.
 */
class SysMesh
{
public:
    /**
     * @param sharedSuppressDepth Optional pointer to a suppression depth owned
     *                            by the caller (typically the scene). When null
     *                            the mesh uses its own depth, which stays at zero.
     */
    explicit SysMesh(const int* sharedSuppressDepth = nullptr);
    SysMesh(const SysMesh&)            = delete;
    SysMesh& operator=(const SysMesh&) = delete;
    SysMesh(SysMesh&&)                 = delete;
    SysMesh& operator=(SysMesh&&)      = delete;

    ~SysMesh();

    History* history() const noexcept;

    /// Releases the current mesh history so that it can be inserted into a global
    /// history. This will clear out the mesh's local history so that it can begin
    /// recording new changes.
    std::unique_ptr<History> release_history();

    /// @return True if mutations are currently being recorded into history().
    [[nodiscard]] bool recording() const noexcept;

    /// Vertices ------------------------------------------

    /// @return A list of all valid vertex indices in the mesh.
    [[nodiscard]] const std::vector<int32_t>& all_verts() const noexcept;

    /// @return The number of valid vertices in the mesh.
    [[nodiscard]] uint32_t num_verts() const noexcept;

    /// @return The size of the vertex buffer (the index range).
    [[nodiscard]] uint32_t vert_buffer_size() const noexcept;

    /// @return An index to a newly created vertex with the specified position.
    int32_t create_vert(const glm::vec3& pos) noexcept;

    /// Removes the specified vertex along with every polygon that uses it.
    void remove_vert(int32_t vert_index) noexcept;

    /// Moves the vertex to the specified position.
    void move_vert(int32_t vert_index, const glm::vec3& new_pos) noexcept;

    /// @return The position of the specified vertex.
    [[nodiscard]] const glm::vec3& vert_position(int32_t vert_index) const noexcept;

    /// @return The polygons connected to the specified vertex.
    [[nodiscard]] const SysVertPolys& vert_polys(int32_t vert_index) const noexcept;

    /// @return True if the vertex lies on a boundary edge.
    [[nodiscard]] bool boundary_vert(int32_t vert_index) const noexcept;

    /// Edges ---------------------------------------------

    /// @return A list of all valid edges in the mesh (unique, sorted).
    [[nodiscard]] std::vector<IndexPair> all_edges() const;

    /// @return The polygons connected to the specified edge.
    [[nodiscard]] SysEdgePolys edge_polys(const IndexPair& edge) const noexcept;

    /// @return True if the edge joins two distinct live vertices and belongs to a polygon.
    [[nodiscard]] bool edge_valid(const IndexPair& edge) const noexcept;

    /// @return True if the edge is a 1-manifold boundary edge.
    [[nodiscard]] bool boundary_edge(const IndexPair& edge) const noexcept;

    /// @return All boundary edges of the mesh (sorted).
    [[nodiscard]] std::vector<IndexPair> boundary_edges() const;

    /// Polygons ------------------------------------------

    /// @return A list of all valid polygon indices in the mesh.
    [[nodiscard]] const std::vector<int32_t>& all_polys() const noexcept;

    /// @return The number of valid polygons in the mesh.
    [[nodiscard]] uint32_t num_polys() const noexcept;

    /// @return The size of the polygon buffer (the index range).
    [[nodiscard]] uint32_t poly_buffer_size() const noexcept;

    /// @return An index to a newly created polygon with the specified vertices and material.
    int32_t create_poly(const SysPolyVerts& verts, uint32_t material_id = 0) noexcept;

    /// Removes the specified polygon.
    void remove_poly(int32_t poly_index) noexcept;

    /// @return The material associated with the specified polygon.
    [[nodiscard]] uint32_t poly_material(int32_t poly_index) const noexcept;

    /// @return True if the polygon has the specified edge.
    [[nodiscard]] bool poly_has_edge(int32_t poly_index, const IndexPair& edge) const noexcept;

    /// @return The vertices of the specified polygon.
    [[nodiscard]] const SysPolyVerts& poly_verts(int32_t poly_index) const noexcept;

    /// @return The edges of the specified polygon, in winding order.
    [[nodiscard]] SysPolyEdges poly_edges(int32_t poly_index) const noexcept;

    /// @return The normal of the polygon (Newell), or zero for degenerate polygons.
    [[nodiscard]] glm::vec3 poly_normal(int32_t poly_index) const noexcept;

    /// @return The center of the polygon.
    [[nodiscard]] glm::vec3 poly_center(int32_t poly_index) const noexcept;

    /// Selection -----------------------------------------

    /// @return True if edge got selected/deselected, else false.
    bool select_edge(const IndexPair& edge, bool select) noexcept;

    /// @return True if edge is selected
    [[nodiscard]] bool edge_selected(const IndexPair& edge) const noexcept;

    /// @return A list of all the selected edges (normalized, selection order).
    [[nodiscard]] const std::vector<IndexPair>& selected_edges() const noexcept;

    /// Clear all selected edges.
    void clear_selected_edges() noexcept;

    /// Change Counters -----------------------------------

    /// Modified whenever the mesh has been modified in any way.
    [[nodiscard]] const SysCounterPtr& change_counter() const noexcept;
    /// Modified whenever the mesh topology has been modified.
    [[nodiscard]] const SysCounterPtr& topology_counter() const noexcept;
    /// Modified whenever the mesh has been deformed.
    [[nodiscard]] const SysCounterPtr& deform_counter() const noexcept;
    /// Modified whenever the mesh element selection has been modified.
    [[nodiscard]] const SysCounterPtr& select_counter() const noexcept;

    /// Returns a sorted edge (lowest index first) for stable edge comparisons
    static IndexPair sort_edge(const IndexPair& edge) noexcept;

    [[nodiscard]] bool poly_valid(int32_t poly_index) const noexcept;

    [[nodiscard]] bool vert_valid(int32_t vert_index) const noexcept;

    /// History replay ------------------------------------

    /// Revives a removed vertex slot. Used by undo/redo only.
    void restore_vert(int32_t vert_index, const glm::vec3& pos) noexcept;

    /// Revives a removed polygon slot. Used by undo/redo only.
    void restore_poly(int32_t poly_index, const SysPolyVerts& verts, uint32_t material_id) noexcept;

private:
    std::unique_ptr<struct SysMeshData> data;
};

#endif
