#pragma once

#include "QuadFillHost.hpp"

class SysMeshScene;

/**
 * @class SceneQuadFillHost
 * @brief QuadFillHost backed by a SysMeshScene.
 *
 * History suppression and transactions map onto the scene's own depth counted
 * scopes, so one closed transaction becomes one scene history entry.
 */
class SceneQuadFillHost : public QuadFillHost
{
public:
    explicit SceneQuadFillHost(SysMeshScene* scene);
    ~SceneQuadFillHost() override = default;

    SysMeshScene* scene() const noexcept
    {
        return m_scene;
    }

    bool edge_vertex_pairs(int32_t mesh, std::span<const IndexPair> edges, std::vector<IndexPair>& out) const override;

    glm::vec3 vert_position(int32_t mesh, int32_t vert) const override;

    glm::vec3 face_normal(int32_t mesh, int32_t face) const override;

    std::vector<int32_t> faces_adjacent_to_edge(int32_t mesh, const IndexPair& edge) const override;

    int32_t num_verts(int32_t mesh) const override;

    int32_t num_polys(int32_t mesh) const override;

    std::vector<IndexPair> selected_edges(int32_t mesh) const override;

    SysCounterPtr topology_counter(int32_t mesh) const override;

    bool set_vert_position(int32_t mesh, int32_t vert, const glm::vec3& pos) override;

    int32_t create_grid(float width, float height, int spansX, int spansY) override;

    UnionResult union_meshes(int32_t target, int32_t source) override;

    int32_t merge_verts_by_distance(int32_t mesh, std::span<const int32_t> verts, float tolerance) override;

    bool flip_face_orientation(int32_t mesh) override;

    bool remove_mesh(int32_t mesh) override;

    void begin_history_suppression() override;
    void end_history_suppression() override;

    void open_transaction(std::string_view name) override;
    void close_transaction() override;
    void cancel_transaction() override;

private:
    SysMeshScene* m_scene = nullptr;
};
