#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

#include <glm/glm.hpp>

#include "SysCounter.hpp"
#include "SysMesh.hpp"

namespace
{
    // Unit quad in the XZ plane facing +Y.
    void MakeQuad(SysMesh& mesh)
    {
        mesh.create_vert({0.0f, 0.0f, 0.0f});
        mesh.create_vert({1.0f, 0.0f, 0.0f});
        mesh.create_vert({1.0f, 0.0f, -1.0f});
        mesh.create_vert({0.0f, 0.0f, -1.0f});
        mesh.create_poly({0, 1, 2, 3});
    }
} // namespace

TEST(SysMesh, SlotsStayStableAcrossRemoval)
{
    SysMesh mesh;
    MakeQuad(mesh);

    mesh.remove_poly(0);
    mesh.remove_vert(1);

    EXPECT_EQ(mesh.num_verts(), 3u);
    EXPECT_EQ(mesh.vert_buffer_size(), 4u);
    EXPECT_FALSE(mesh.vert_valid(1));
    EXPECT_TRUE(mesh.vert_valid(3));
    EXPECT_EQ(mesh.vert_position(3), glm::vec3(0.0f, 0.0f, -1.0f));

    // New elements always go after the current slot range.
    EXPECT_EQ(mesh.create_vert({5.0f, 0.0f, 0.0f}), 4);
    EXPECT_EQ(mesh.create_poly({0, 2, 3}), 1);
}

TEST(SysMesh, RemoveVertRemovesItsPolys)
{
    SysMesh mesh;
    MakeQuad(mesh);

    mesh.remove_vert(2);

    EXPECT_EQ(mesh.num_polys(), 0u);
    EXPECT_TRUE(mesh.vert_polys(0).empty());
}

TEST(SysMesh, EdgeQueries)
{
    SysMesh mesh;
    MakeQuad(mesh);
    mesh.create_vert({2.0f, 0.0f, 0.0f});
    mesh.create_vert({2.0f, 0.0f, -1.0f});
    mesh.create_poly({1, 4, 5, 2});

    EXPECT_TRUE(mesh.edge_valid({1, 2}));
    EXPECT_TRUE(mesh.edge_valid({2, 1}));
    EXPECT_FALSE(mesh.edge_valid({0, 2}));
    EXPECT_FALSE(mesh.edge_valid({0, 0}));

    EXPECT_EQ(mesh.edge_polys({1, 2}).size(), 2u);
    EXPECT_FALSE(mesh.boundary_edge({1, 2}));
    EXPECT_TRUE(mesh.boundary_edge({0, 1}));
    EXPECT_EQ(mesh.boundary_edges().size(), 6u);
    EXPECT_EQ(mesh.all_edges().size(), 7u);
    EXPECT_TRUE(mesh.boundary_vert(0));
}

TEST(SysMesh, PolyNormalAndCenter)
{
    SysMesh mesh;
    MakeQuad(mesh);

    const glm::vec3 n = mesh.poly_normal(0);
    EXPECT_NEAR(n.x, 0.0f, 1e-6f);
    EXPECT_NEAR(n.y, 1.0f, 1e-6f);
    EXPECT_NEAR(n.z, 0.0f, 1e-6f);

    const glm::vec3 c = mesh.poly_center(0);
    EXPECT_NEAR(c.x, 0.5f, 1e-6f);
    EXPECT_NEAR(c.z, -0.5f, 1e-6f);

    const SysPolyEdges edges = mesh.poly_edges(0);
    ASSERT_EQ(edges.size(), 4u);
    EXPECT_EQ(edges.front(), IndexPair(3, 0));
    EXPECT_EQ(edges.back(), IndexPair(2, 3));
}

TEST(SysMesh, UndoRestoresRemovedPolyAndAdjacency)
{
    SysMesh mesh;
    MakeQuad(mesh);
    (void)mesh.release_history();

    mesh.remove_poly(0);
    ASSERT_EQ(mesh.num_polys(), 0u);

    mesh.history()->undo();
    ASSERT_TRUE(mesh.poly_valid(0));
    EXPECT_EQ(mesh.poly_verts(0), (SysPolyVerts{0, 1, 2, 3}));
    EXPECT_EQ(mesh.vert_polys(2), (SysVertPolys{0}));

    mesh.history()->redo();
    EXPECT_FALSE(mesh.poly_valid(0));
    EXPECT_TRUE(mesh.vert_polys(2).empty());
}

TEST(SysMesh, UndoMoveAndCreate)
{
    SysMesh mesh;
    MakeQuad(mesh);
    (void)mesh.release_history();

    mesh.move_vert(0, {0.0f, 3.0f, 0.0f});
    const int32_t v = mesh.create_vert({9.0f, 9.0f, 9.0f});

    mesh.history()->undo();
    EXPECT_EQ(mesh.vert_position(0), glm::vec3(0.0f));
    EXPECT_FALSE(mesh.vert_valid(v));

    mesh.history()->redo();
    EXPECT_EQ(mesh.vert_position(0), glm::vec3(0.0f, 3.0f, 0.0f));
    ASSERT_TRUE(mesh.vert_valid(v));
    EXPECT_EQ(mesh.vert_position(v), glm::vec3(9.0f));
}

TEST(SysMesh, EdgeSelectionIsOrderedAndUndoable)
{
    SysMesh mesh;
    MakeQuad(mesh);
    (void)mesh.release_history();

    EXPECT_TRUE(mesh.select_edge({2, 1}, true));
    EXPECT_TRUE(mesh.select_edge({0, 3}, true));
    EXPECT_FALSE(mesh.select_edge({1, 2}, true));

    EXPECT_TRUE(mesh.edge_selected({1, 2}));
    EXPECT_EQ(mesh.selected_edges(), (std::vector<IndexPair>{{1, 2}, {0, 3}}));

    mesh.clear_selected_edges();
    EXPECT_TRUE(mesh.selected_edges().empty());

    mesh.history()->undo();
    EXPECT_TRUE(mesh.selected_edges().empty());
    mesh.history()->redo();
    EXPECT_TRUE(mesh.selected_edges().empty());

    ASSERT_TRUE(mesh.history()->undo_step());
    EXPECT_EQ(mesh.selected_edges().size(), 2u);
}

TEST(SysMesh, SharedSuppressionDepthStopsRecording)
{
    int     depth = 1;
    SysMesh mesh(&depth);

    EXPECT_FALSE(mesh.recording());
    MakeQuad(mesh);
    EXPECT_FALSE(mesh.history()->can_undo());

    depth = 0;
    EXPECT_TRUE(mesh.recording());
    mesh.move_vert(0, {1.0f, 1.0f, 1.0f});
    EXPECT_TRUE(mesh.history()->can_undo());
}

TEST(SysMesh, CountersTrackKindOfChange)
{
    SysMesh    mesh;
    SysMonitor topo(mesh.topology_counter(), false);
    SysMonitor deform(mesh.deform_counter(), false);
    SysMonitor any(mesh.change_counter(), false);

    MakeQuad(mesh);
    EXPECT_TRUE(topo.changed());
    EXPECT_FALSE(deform.peek());
    EXPECT_TRUE(any.changed());

    mesh.move_vert(0, {0.0f, 1.0f, 0.0f});
    EXPECT_FALSE(topo.peek());
    EXPECT_TRUE(deform.changed());
    EXPECT_TRUE(any.peek());
}
