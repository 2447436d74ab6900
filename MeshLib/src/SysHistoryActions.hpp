#ifndef SYS_HISTORY_ACTIONS_HPP_INCLUDED
#define SYS_HISTORY_ACTIONS_HPP_INCLUDED

#include "SysMesh.hpp"
#include "SysMeshData.hpp"

// Actions are replayed with the owning SysMesh as context pointer. The mesh
// history is busy during replay, so the mesh calls below record nothing.

struct UndoCreateVertex : public HistoryAction
{
    void undo(void* data) override
    {
        SysMesh* mesh = static_cast<SysMesh*>(data);
        mesh->remove_vert(vert_index);
    }

    void redo(void* data) override
    {
        SysMesh* mesh = static_cast<SysMesh*>(data);
        mesh->restore_vert(vert_index, vert_pos);
    }

    glm::vec3 vert_pos{0.0f};
    int32_t   vert_index{-1};
};

// -------------------------------------------------------------------------------

struct UndoRemoveVertex : public HistoryAction
{
    // Polys that used the vertex were removed (and recorded) before this
    // action, so they come back after it on undo.
    void undo(void* data) override
    {
        SysMesh* mesh = static_cast<SysMesh*>(data);
        mesh->restore_vert(vert_index, vert_pos);
    }

    void redo(void* data) override
    {
        SysMesh* mesh = static_cast<SysMesh*>(data);
        assert(mesh->vert_polys(vert_index).empty() && "UndoRemoveVertex::redo: vertex still referenced");
        mesh->remove_vert(vert_index);
    }

    glm::vec3 vert_pos{0.0f};
    int32_t   vert_index{-1};
};

// -------------------------------------------------------------------------------

struct UndoMoveVertex : public HistoryAction
{
    void undo(void* data) override
    {
        SysMesh*        mesh    = static_cast<SysMesh*>(data);
        const glm::vec3 new_pos = mesh->vert_position(vert_index);
        mesh->move_vert(vert_index, old_pos);
        old_pos = new_pos;
    }

    void redo(void* data) override
    {
        undo(data);
    }

    glm::vec3 old_pos{0.0f};
    int32_t   vert_index{-1};
};

// -------------------------------------------------------------------------------

struct UndoCreatePoly : public HistoryAction
{
    void undo(void* data) override
    {
        SysMesh* mesh = static_cast<SysMesh*>(data);
        mesh->remove_poly(poly.index);
    }

    void redo(void* data) override
    {
        SysMesh* mesh = static_cast<SysMesh*>(data);
        mesh->restore_poly(poly.index, poly.data.verts, poly.data.material_id);
    }

    SysFullPoly poly;
};

// -------------------------------------------------------------------------------

struct UndoRemovePoly : public HistoryAction
{
    void undo(void* data) override
    {
        SysMesh* mesh = static_cast<SysMesh*>(data);
        mesh->restore_poly(poly.index, poly.data.verts, poly.data.material_id);
    }

    void redo(void* data) override
    {
        SysMesh* mesh = static_cast<SysMesh*>(data);
        mesh->remove_poly(poly.index);
    }

    SysFullPoly poly;
};

// -------------------------------------------------------------------------------

struct UndoSelectEdge : public HistoryAction
{
    void undo(void* data) override
    {
        SysMesh* mesh = static_cast<SysMesh*>(data);
        mesh->select_edge(edge, !select);
    }

    void redo(void* data) override
    {
        SysMesh* mesh = static_cast<SysMesh*>(data);
        mesh->select_edge(edge, select);
    }

    IndexPair edge{-1, -1};
    bool      select{false};
};

// -------------------------------------------------------------------------------

struct UndoClearEdgeSel : public HistoryAction
{
    void undo(void* data) override
    {
        SysMesh* mesh = static_cast<SysMesh*>(data);
        for (const IndexPair& edge : sel)
            mesh->select_edge(edge, true);
    }

    void redo(void* data) override
    {
        SysMesh* mesh = static_cast<SysMesh*>(data);
        mesh->clear_selected_edges();
    }

    std::vector<IndexPair> sel;
};

#endif // SYS_HISTORY_ACTIONS_HPP_INCLUDED
