//
//  SysMesh.cpp
//  Mesh
//

#include "SysMesh.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <glm/glm.hpp>

#include "SysHistoryActions.hpp"
#include "SysMeshData.hpp"

SysMesh::SysMesh(const int* sharedSuppressDepth) : data{std::make_unique<SysMeshData>()}
{
    data->history_busy = false;
    data->history      = std::make_unique<History>(this, &data->history_busy);

    if (sharedSuppressDepth)
        data->suppress_depth = sharedSuppressDepth;
}

SysMesh::~SysMesh() = default;

History* SysMesh::history() const noexcept
{
    return data->history.get();
}

std::unique_ptr<History> SysMesh::release_history()
{
    // Move out the current history (transaction so far)
    std::unique_ptr<History> h = std::move(data->history);

    // Replace with a fresh one wired to the same busy guard
    data->history = std::make_unique<History>(this, &data->history_busy);

    return h;
}

bool SysMesh::recording() const noexcept
{
    return !data->history->is_busy() && *data->suppress_depth == 0;
}

/// -------------------------------------------------------
/// Vertices
/// -------------------------------------------------------

const std::vector<int32_t>& SysMesh::all_verts() const noexcept
{
    return data->verts.valid_indices();
}

uint32_t SysMesh::num_verts() const noexcept
{
    return static_cast<uint32_t>(data->verts.size());
}

uint32_t SysMesh::vert_buffer_size() const noexcept
{
    return static_cast<uint32_t>(data->verts.slots());
}

int32_t SysMesh::create_vert(const glm::vec3& pos) noexcept
{
    SysVert new_vert{};
    new_vert.pos             = pos;
    const int32_t vert_index = data->verts.insert(std::move(new_vert));

    if (recording())
    {
        auto* undo       = data->history->emplace<UndoCreateVertex>();
        undo->vert_index = vert_index;
        undo->vert_pos   = pos;
    }

    data->topology_counter->change();
    return vert_index;
}

void SysMesh::remove_vert(int32_t vert_index) noexcept
{
    assert(vert_valid(vert_index) && "Vertex has already been removed!");

    // Copy, remove_poly() edits the adjacency we iterate.
    const SysVertPolys affected_polys = data->verts[vert_index].polys;
    for (int32_t poly_index : affected_polys)
    {
        if (poly_valid(poly_index))
            remove_poly(poly_index);
    }

    if (recording())
    {
        auto* undo       = data->history->emplace<UndoRemoveVertex>();
        undo->vert_index = vert_index;
        undo->vert_pos   = data->verts[vert_index].pos;
    }

    data->verts[vert_index].polys.clear();
    data->verts.remove(vert_index);
    data->topology_counter->change();
}

void SysMesh::move_vert(int32_t vert_index, const glm::vec3& new_pos) noexcept
{
    assert(vert_valid(vert_index) && "Invalid vertex index!");

    if (recording())
    {
        auto* undo       = data->history->emplace<UndoMoveVertex>();
        undo->vert_index = vert_index;
        undo->old_pos    = vert_position(vert_index);
    }

    data->verts[vert_index].pos = new_pos;
    data->deform_counter->change();
}

const glm::vec3& SysMesh::vert_position(int32_t vert_index) const noexcept
{
    return data->verts[vert_index].pos;
}

const SysVertPolys& SysMesh::vert_polys(int32_t vert_index) const noexcept
{
    return data->verts[vert_index].polys;
}

bool SysMesh::boundary_vert(int32_t vert_index) const noexcept
{
    for (int32_t poly_index : vert_polys(vert_index))
    {
        for (const IndexPair& edge : poly_edges(poly_index))
        {
            if (edge.first != vert_index && edge.second != vert_index)
                continue;

            if (boundary_edge(edge))
                return true;
        }
    }
    return false;
}

/// -------------------------------------------------------
/// Edges
/// -------------------------------------------------------

std::vector<IndexPair> SysMesh::all_edges() const
{
    std::vector<IndexPair> edges;
    edges.reserve(static_cast<size_t>(num_polys()) * 4);

    for (int32_t poly_index : all_polys())
    {
        for (const IndexPair& e : poly_edges(poly_index))
            edges.push_back(sort_edge(e));
    }

    std::sort(edges.begin(), edges.end());
    edges.erase(std::unique(edges.begin(), edges.end()), edges.end());

    return edges;
}

SysEdgePolys SysMesh::edge_polys(const IndexPair& edge) const noexcept
{
    SysEdgePolys results = {};
    if (!vert_valid(edge.first))
        return results;

    for (int32_t poly_index : data->verts[edge.first].polys)
    {
        if (poly_has_edge(poly_index, edge))
            results.push_back(poly_index);
    }

    return results;
}

bool SysMesh::edge_valid(const IndexPair& edge) const noexcept
{
    if (edge.first == edge.second)
        return false;

    if (!vert_valid(edge.first) || !vert_valid(edge.second))
        return false;

    return !edge_polys(edge).empty();
}

bool SysMesh::boundary_edge(const IndexPair& edge) const noexcept
{
    return edge_polys(edge).size() == 1;
}

std::vector<IndexPair> SysMesh::boundary_edges() const
{
    std::vector<IndexPair> result;
    for (const IndexPair& edge : all_edges())
    {
        if (boundary_edge(edge))
            result.push_back(edge);
    }
    return result;
}

/// -------------------------------------------------------
/// Polys
/// -------------------------------------------------------

const std::vector<int32_t>& SysMesh::all_polys() const noexcept
{
    return data->polys.valid_indices();
}

uint32_t SysMesh::num_polys() const noexcept
{
    return static_cast<uint32_t>(data->polys.size());
}

uint32_t SysMesh::poly_buffer_size() const noexcept
{
    return static_cast<uint32_t>(data->polys.slots());
}

int32_t SysMesh::create_poly(const SysPolyVerts& verts, uint32_t material_id) noexcept
{
    assert(verts.size() >= 3 && "Polygon needs at least three vertices!");

    SysPoly new_poly{};
    new_poly.verts           = verts;
    new_poly.material_id     = material_id;
    const int32_t poly_index = data->polys.insert(new_poly);

    if (recording())
    {
        auto* undo       = data->history->emplace<UndoCreatePoly>();
        undo->poly.index = poly_index;
        undo->poly.data  = new_poly;
    }

    // Add the new polygon to its vertices.
    for (int32_t vert_index : verts)
    {
        assert(vert_valid(vert_index) && "Polygon references an invalid vertex!");
        SysVertPolys& vp = data->verts[vert_index].polys;
        if (std::find(vp.begin(), vp.end(), poly_index) == vp.end())
            vp.push_back(poly_index);
    }

    data->topology_counter->change();
    return poly_index;
}

void SysMesh::remove_poly(int32_t poly_index) noexcept
{
    assert(poly_valid(poly_index) && "Polygon has already been removed!");

    // Edges owned by this polygon alone disappear with it. Deselect them first
    // so the history records it.
    for (const IndexPair& edge : poly_edges(poly_index))
    {
        if (edge_polys(edge).size() == 1)
            select_edge(edge, false);
    }

    if (recording())
    {
        auto* undo       = data->history->emplace<UndoRemovePoly>();
        undo->poly.index = poly_index;
        undo->poly.data  = data->polys[poly_index];
    }

    for (int32_t vert_index : data->polys[poly_index].verts)
        std::erase(data->verts[vert_index].polys, poly_index);

    data->polys.remove(poly_index);
    data->topology_counter->change();
}

uint32_t SysMesh::poly_material(int32_t poly_index) const noexcept
{
    return data->polys[poly_index].material_id;
}

bool SysMesh::poly_has_edge(int32_t poly_index, const IndexPair& edge) const noexcept
{
    const SysPolyVerts& pv = data->polys[poly_index].verts;
    const size_t        n  = pv.size();

    for (size_t i = 0; i < n; ++i)
    {
        const int32_t a = pv[i];
        const int32_t b = pv[(i + 1) % n];

        if ((a == edge.first && b == edge.second) || (a == edge.second && b == edge.first))
            return true;
    }
    return false;
}

const SysPolyVerts& SysMesh::poly_verts(int32_t poly_index) const noexcept
{
    assert(poly_valid(poly_index) && "nth polygon does not exist!");
    return data->polys[poly_index].verts;
}

SysPolyEdges SysMesh::poly_edges(int32_t poly_index) const noexcept
{
    SysPolyEdges        results;
    const SysPolyVerts& pv = data->polys[poly_index].verts;
    const int32_t       n  = static_cast<int32_t>(pv.size());

    results.reserve(pv.size());
    for (int32_t prev = n - 1, next = 0; next < n; prev = next++)
        results.emplace_back(pv[prev], pv[next]);

    return results;
}

glm::vec3 SysMesh::poly_normal(int32_t poly_index) const noexcept
{
    assert(poly_valid(poly_index) && "nth polygon does not exist!");
    const SysPolyVerts& pv = data->polys[poly_index].verts;
    const int32_t       n  = static_cast<int32_t>(pv.size());

    glm::vec3 norm(0.f);
    for (int32_t prev = n - 1, next = 0; next < n; prev = next++)
    {
        const glm::vec3& prev_pos = data->verts[pv[prev]].pos;
        const glm::vec3& next_pos = data->verts[pv[next]].pos;
        norm[0] += (prev_pos[1] - next_pos[1]) * (prev_pos[2] + next_pos[2]);
        norm[1] += (prev_pos[2] - next_pos[2]) * (prev_pos[0] + next_pos[0]);
        norm[2] += (prev_pos[0] - next_pos[0]) * (prev_pos[1] + next_pos[1]);
    }

    const float len2 = glm::dot(norm, norm);
    if (len2 < 1e-20f)
        return glm::vec3(0.0f);

    return norm / std::sqrt(len2);
}

glm::vec3 SysMesh::poly_center(int32_t poly_index) const noexcept
{
    const SysPolyVerts& pv = poly_verts(poly_index);
    glm::vec3           pos(0.f);
    for (int32_t vert_index : pv)
        pos += vert_position(vert_index);

    return pos / static_cast<float>(pv.size());
}

/// -------------------------------------------------------
/// Selection
/// -------------------------------------------------------

bool SysMesh::select_edge(const IndexPair& edgeIn, bool select) noexcept
{
    const IndexPair edge              = sort_edge(edgeIn);
    const bool      currentlySelected = data->edge_selection.contains(edge);

    if (select == currentlySelected)
        return false;

    if (recording())
    {
        auto* undo   = data->history->emplace<UndoSelectEdge>();
        undo->edge   = edge;
        undo->select = select;
    }

    if (select)
        data->edge_selection.insert(edge);
    else
        data->edge_selection.erase(edge);

    data->select_counter->change();
    return true;
}

bool SysMesh::edge_selected(const IndexPair& edgeIn) const noexcept
{
    return data->edge_selection.contains(edgeIn);
}

const std::vector<IndexPair>& SysMesh::selected_edges() const noexcept
{
    return data->edge_selection.ordered();
}

void SysMesh::clear_selected_edges() noexcept
{
    if (data->edge_selection.empty())
        return;

    if (recording())
    {
        auto* undo = data->history->emplace<UndoClearEdgeSel>();
        undo->sel  = data->edge_selection.ordered();
    }

    data->edge_selection.clear();
    data->select_counter->change();
}

/// -------------------------------------------------------
/// Counters
/// -------------------------------------------------------

const SysCounterPtr& SysMesh::change_counter() const noexcept
{
    return data->change_counter;
}

const SysCounterPtr& SysMesh::topology_counter() const noexcept
{
    return data->topology_counter;
}

const SysCounterPtr& SysMesh::deform_counter() const noexcept
{
    return data->deform_counter;
}

const SysCounterPtr& SysMesh::select_counter() const noexcept
{
    return data->select_counter;
}

IndexPair SysMesh::sort_edge(const IndexPair& edge) noexcept
{
    return (edge.first < edge.second) ? edge : IndexPair{edge.second, edge.first};
}

bool SysMesh::poly_valid(int32_t poly_index) const noexcept
{
    return data->polys.valid(poly_index);
}

bool SysMesh::vert_valid(int32_t vert_index) const noexcept
{
    return data->verts.valid(vert_index);
}

/// -------------------------------------------------------
/// History replay
/// -------------------------------------------------------

void SysMesh::restore_vert(int32_t vert_index, const glm::vec3& pos) noexcept
{
    SysVert vert{};
    vert.pos = pos;
    data->verts.restore(vert_index, std::move(vert));
    data->topology_counter->change();
}

void SysMesh::restore_poly(int32_t poly_index, const SysPolyVerts& verts, uint32_t material_id) noexcept
{
    SysPoly poly{};
    poly.verts       = verts;
    poly.material_id = material_id;
    data->polys.restore(poly_index, std::move(poly));

    for (int32_t vert_index : verts)
    {
        assert(vert_valid(vert_index) && "Restored polygon references an invalid vertex!");
        SysVertPolys& vp = data->verts[vert_index].polys;
        if (std::find(vp.begin(), vp.end(), poly_index) == vp.end())
            vp.push_back(poly_index);
    }

    data->topology_counter->change();
}
