#include "SceneQuadFillHost.hpp"

#include "SysMesh.hpp"
#include "SysMeshScene.hpp"
#include "SysMeshUtils.hpp"

SceneQuadFillHost::SceneQuadFillHost(SysMeshScene* scene) : m_scene{scene}
{
}

bool SceneQuadFillHost::edge_vertex_pairs(int32_t mesh, std::span<const IndexPair> edges, std::vector<IndexPair>& out) const
{
    out.clear();

    const SysMesh* m = m_scene->mesh(mesh);
    if (!m)
        return false;

    out.reserve(edges.size());
    for (const IndexPair& e : edges)
    {
        if (!m->edge_valid(e))
        {
            out.clear();
            return false;
        }
        out.push_back(e);
    }
    return true;
}

glm::vec3 SceneQuadFillHost::vert_position(int32_t mesh, int32_t vert) const
{
    const SysMesh* m = m_scene->mesh(mesh);
    if (!m || !m->vert_valid(vert))
        return glm::vec3(0.0f);

    return m->vert_position(vert);
}

glm::vec3 SceneQuadFillHost::face_normal(int32_t mesh, int32_t face) const
{
    const SysMesh* m = m_scene->mesh(mesh);
    if (!m || !m->poly_valid(face))
        return glm::vec3(0.0f);

    return m->poly_normal(face);
}

std::vector<int32_t> SceneQuadFillHost::faces_adjacent_to_edge(int32_t mesh, const IndexPair& edge) const
{
    const SysMesh* m = m_scene->mesh(mesh);
    if (!m)
        return {};

    return m->edge_polys(edge);
}

int32_t SceneQuadFillHost::num_verts(int32_t mesh) const
{
    const SysMesh* m = m_scene->mesh(mesh);
    return m ? static_cast<int32_t>(m->num_verts()) : -1;
}

int32_t SceneQuadFillHost::num_polys(int32_t mesh) const
{
    const SysMesh* m = m_scene->mesh(mesh);
    return m ? static_cast<int32_t>(m->num_polys()) : -1;
}

std::vector<IndexPair> SceneQuadFillHost::selected_edges(int32_t mesh) const
{
    const SysMesh* m = m_scene->mesh(mesh);
    if (!m)
        return {};

    return m->selected_edges();
}

SysCounterPtr SceneQuadFillHost::topology_counter(int32_t mesh) const
{
    const SysMesh* m = m_scene->mesh(mesh);
    return m ? m->topology_counter() : nullptr;
}

bool SceneQuadFillHost::set_vert_position(int32_t mesh, int32_t vert, const glm::vec3& pos)
{
    SysMesh* m = m_scene->mesh(mesh);
    if (!m || !m->vert_valid(vert))
        return false;

    m->move_vert(vert, pos);
    return true;
}

int32_t SceneQuadFillHost::create_grid(float width, float height, int spansX, int spansY)
{
    if (spansX < 1 || spansY < 1 || !(width > 0.0f) || !(height > 0.0f))
        return -1;

    const int32_t id = m_scene->create_mesh();
    SysMesh*      m  = m_scene->mesh(id);

    const int SX = spansX + 1;
    const int SY = spansY + 1;

    // Rows advance along -Z so that (x, -z) is counter-clockwise and quads face +Y.
    for (int row = 0; row < SY; ++row)
    {
        const float fy = static_cast<float>(row) / static_cast<float>(spansY);
        for (int col = 0; col < SX; ++col)
        {
            const float fx = static_cast<float>(col) / static_cast<float>(spansX);
            m->create_vert(glm::vec3((fx - 0.5f) * width, 0.0f, (0.5f - fy) * height));
        }
    }

    for (int row = 0; row < spansY; ++row)
    {
        for (int col = 0; col < spansX; ++col)
        {
            const int32_t a = row * SX + col;
            const int32_t b = a + 1;
            const int32_t c = (row + 1) * SX + col + 1;
            const int32_t d = (row + 1) * SX + col;
            m->create_poly({a, b, c, d});
        }
    }

    return id;
}

QuadFillHost::UnionResult SceneQuadFillHost::union_meshes(int32_t target, int32_t source)
{
    UnionResult result;
    if (target == source)
        return result;

    SysMesh* dst = m_scene->mesh(target);
    SysMesh* src = m_scene->mesh(source);
    if (!dst || !src)
        return result;

    result.vert_remap = smu::append_mesh(*dst, *src);
    result.mesh       = target;

    m_scene->remove_mesh(source);
    return result;
}

int32_t SceneQuadFillHost::merge_verts_by_distance(int32_t mesh, std::span<const int32_t> verts, float tolerance)
{
    SysMesh* m = m_scene->mesh(mesh);
    if (!m)
        return -1;

    return smu::weld_verts(*m, verts, tolerance);
}

bool SceneQuadFillHost::flip_face_orientation(int32_t mesh)
{
    SysMesh* m = m_scene->mesh(mesh);
    if (!m)
        return false;

    return smu::reverse_winding(*m);
}

bool SceneQuadFillHost::remove_mesh(int32_t mesh)
{
    return m_scene->remove_mesh(mesh);
}

void SceneQuadFillHost::begin_history_suppression()
{
    m_scene->begin_history_suppression();
}

void SceneQuadFillHost::end_history_suppression()
{
    m_scene->end_history_suppression();
}

void SceneQuadFillHost::open_transaction(std::string_view name)
{
    m_scene->open_transaction(name);
}

void SceneQuadFillHost::close_transaction()
{
    m_scene->close_transaction();
}

void SceneQuadFillHost::cancel_transaction()
{
    m_scene->cancel_transaction();
}
