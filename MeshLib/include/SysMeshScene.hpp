#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "History.hpp"

class SysMesh;

/**
 * @brief Scene of SysMesh objects with a scene-wide undo/redo stack.
 *
 * Meshes are addressed by a stable integer id. Mesh edits are first recorded
 * in each mesh's local history; commitMeshChanges() (or closing the outermost
 * transaction) folds all pending local histories into one scene history entry.
 *
 * Two scoped mechanisms control what ends up in the scene history:
 * - history suppression: while the depth is non-zero, no mesh in the scene
 *   records anything (edits made then can never be undone).
 * - transactions: while a transaction is open, nothing is committed; when the
 *   outermost transaction closes, every pending edit becomes one named entry.
 *
 * Both are depth counted, so nested scopes restore the outer state.
 */
class SysMeshScene
{
public:
    SysMeshScene();
    virtual ~SysMeshScene();

    SysMeshScene(const SysMeshScene&)            = delete;
    SysMeshScene& operator=(const SysMeshScene&) = delete;

    /**
     * @brief Returns the global scene-level undo/redo stack.
     */
    History& history()
    {
        return m_sceneHistory;
    }

    /// Meshes --------------------------------------------

    /// @return Id of a new empty mesh. Ids of removed, never committed meshes are reused.
    int32_t create_mesh();

    /**
     * @brief Removes a mesh from the scene. Not recorded in any history.
     *
     * A mesh whose edits already live in the scene history is retired rather
     * than destroyed, so undo/redo never replays into freed memory.
     *
     * @return False if the id does not name a live mesh.
     */
    bool remove_mesh(int32_t id);

    /// @return The mesh with the given id, or nullptr.
    [[nodiscard]] SysMesh* mesh(int32_t id) const noexcept;

    /// @return All live meshes, in id order.
    [[nodiscard]] std::vector<SysMesh*> meshes() const;

    /// @return Number of id slots (live, retired and free).
    [[nodiscard]] int32_t mesh_slots() const noexcept
    {
        return static_cast<int32_t>(m_meshes.size());
    }

    /// History suppression -------------------------------

    void begin_history_suppression() noexcept;
    void end_history_suppression() noexcept;

    [[nodiscard]] bool history_suppressed() const noexcept
    {
        return m_suppressDepth > 0;
    }

    /// Transactions --------------------------------------

    /// Opens a (possibly nested) transaction. Only the outermost name is kept.
    void open_transaction(std::string_view name);

    /// Closes a transaction. @return True if the outermost close produced a history entry.
    bool close_transaction();

    /// Reverts every pending mesh edit and closes a transaction without committing.
    void cancel_transaction();

    [[nodiscard]] bool in_transaction() const noexcept
    {
        return m_transactionDepth > 0;
    }

    /**
     * @brief Commits all pending mesh edits as a single undoable action.
     *
     * Releases each mesh's current history and wraps them all into one
     * scene-wide History labelled @p name. Nothing is recorded if no mesh
     * has pending edits. Deferred while a transaction is open.
     *
     * @return True if a scene history entry was added.
     */
    bool commitMeshChanges(std::string_view name = {});

    /**
     * @brief Aborts (undoes) all uncommitted changes on all meshes.
     */
    void abortMeshChanges();

    /**
     * @brief Returns true if there are uncommitted mesh edits (per-mesh histories)
     *        that have not yet been wrapped into the scene history.
     */
    [[nodiscard]] bool hasPendingMeshChanges() const;

private:
    struct MeshSlot
    {
        std::unique_ptr<SysMesh> mesh;
        bool                     live{false};
        bool                     committed{false}; ///< Edits of this mesh live in m_sceneHistory.
    };

    History               m_sceneHistory; ///< History stack that tracks scene-wide undo blocks
    std::vector<MeshSlot> m_meshes;
    std::vector<int32_t>  m_freeSlots; ///< Removed slots with no history behind them.
    std::string           m_transactionName;
    int                   m_suppressDepth{0};
    int                   m_transactionDepth{0};
};
