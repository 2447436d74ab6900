#pragma once

#include <cstdint>
#include <glm/glm.hpp>
#include <span>
#include <string_view>
#include <vector>

#include "SysCounter.hpp"
#include "SysMesh.hpp"

/**
 * @class QuadFillHost
 * @brief Mesh query/edit collaborator the hole filler runs against.
 *
 * Meshes are addressed by integer id, edges by their vertex pair and faces by
 * polygon index. Calls returning an index or count return -1 on failure.
 *
 * create_grid() contract: the returned mesh has (spansX+1)*(spansY+1) vertices
 * numbered row-major from 0 and spansX*spansY quads numbered from 0, facing +Y.
 */
class QuadFillHost
{
public:
    /// Result of union_meshes().
    struct UnionResult
    {
        int32_t              mesh{-1};   ///< Combined mesh id (-1 on failure).
        std::vector<int32_t> vert_remap; ///< Source vertex index -> combined vertex index.
    };

    virtual ~QuadFillHost() = default;

    /// Mesh queries -----------------------------------

    /**
     * @brief Resolves boundary edges to their vertex pairs.
     * @return False if the mesh is unknown or any edge is not a real edge of it.
     */
    virtual bool edge_vertex_pairs(int32_t mesh, std::span<const IndexPair> edges, std::vector<IndexPair>& out) const = 0;

    virtual glm::vec3 vert_position(int32_t mesh, int32_t vert) const = 0;

    virtual glm::vec3 face_normal(int32_t mesh, int32_t face) const = 0;

    virtual std::vector<int32_t> faces_adjacent_to_edge(int32_t mesh, const IndexPair& edge) const = 0;

    virtual int32_t num_verts(int32_t mesh) const = 0;

    virtual int32_t num_polys(int32_t mesh) const = 0;

    /// @return The mesh's current edge selection.
    virtual std::vector<IndexPair> selected_edges(int32_t mesh) const = 0;

    /// @return Counter bumped on every topology change of the mesh, or nullptr.
    virtual SysCounterPtr topology_counter(int32_t mesh) const = 0;

    /// Mesh edits -------------------------------------

    virtual bool set_vert_position(int32_t mesh, int32_t vert, const glm::vec3& pos) = 0;

    /// @return Id of a new planar grid mesh, or -1.
    virtual int32_t create_grid(float width, float height, int spansX, int spansY) = 0;

    /**
     * @brief Appends mesh @p source to mesh @p target; source is consumed.
     *
     * Appended vertices come after every existing target vertex.
     */
    virtual UnionResult union_meshes(int32_t target, int32_t source) = 0;

    /// @return Number of vertices welded away, or -1 if the mesh is unknown.
    virtual int32_t merge_verts_by_distance(int32_t mesh, std::span<const int32_t> verts, float tolerance) = 0;

    virtual bool flip_face_orientation(int32_t mesh) = 0;

    virtual bool remove_mesh(int32_t mesh) = 0;

    /// History ----------------------------------------

    virtual void begin_history_suppression() = 0;
    virtual void end_history_suppression()   = 0;

    virtual void open_transaction(std::string_view name) = 0;
    virtual void close_transaction()                     = 0;

    /// Reverts edits made since the transaction opened and closes it without an entry.
    virtual void cancel_transaction() = 0;
};

/**
 * @brief Scoped history suppression. Edits made while alive are not recorded.
 */
class HistorySuppression
{
public:
    explicit HistorySuppression(QuadFillHost& host) : m_host(host)
    {
        m_host.begin_history_suppression();
    }

    ~HistorySuppression()
    {
        m_host.end_history_suppression();
    }

    HistorySuppression(const HistorySuppression&)            = delete;
    HistorySuppression& operator=(const HistorySuppression&) = delete;

private:
    QuadFillHost& m_host;
};

/**
 * @brief Scoped named transaction. Closed on destruction unless cancel() ran.
 */
class Transaction
{
public:
    Transaction(QuadFillHost& host, std::string_view name) : m_host(host)
    {
        m_host.open_transaction(name);
    }

    ~Transaction()
    {
        if (m_open)
            m_host.close_transaction();
    }

    Transaction(const Transaction&)            = delete;
    Transaction& operator=(const Transaction&) = delete;

    /// Reverts everything recorded inside the transaction and closes it.
    void cancel()
    {
        if (!m_open)
            return;

        m_open = false;
        m_host.cancel_transaction();
    }

private:
    QuadFillHost& m_host;
    bool          m_open{true};
};
