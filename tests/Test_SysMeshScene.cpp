#include <gtest/gtest.h>

#include <glm/glm.hpp>

#include "SysMesh.hpp"
#include "SysMeshScene.hpp"

TEST(SysMeshScene, MeshesAreAddressedById)
{
    SysMeshScene scene;

    const int32_t a = scene.create_mesh();
    const int32_t b = scene.create_mesh();

    EXPECT_NE(a, b);
    ASSERT_NE(scene.mesh(a), nullptr);
    EXPECT_EQ(scene.meshes().size(), 2u);

    EXPECT_TRUE(scene.remove_mesh(a));
    EXPECT_EQ(scene.mesh(a), nullptr);
    EXPECT_FALSE(scene.remove_mesh(a));
    EXPECT_EQ(scene.mesh(-1), nullptr);
    EXPECT_EQ(scene.mesh(42), nullptr);
    EXPECT_EQ(scene.meshes().size(), 1u);

    // The slot of a mesh with no committed edits is reused.
    EXPECT_EQ(scene.create_mesh(), a);
    EXPECT_EQ(scene.mesh_slots(), 2);
}

TEST(SysMeshScene, RepeatedCreateRemoveKeepsSlotCount)
{
    SysMeshScene  scene;
    const int32_t keep = scene.create_mesh();

    for (int i = 0; i < 50; ++i)
    {
        const int32_t temp = scene.create_mesh();
        scene.mesh(temp)->create_vert(glm::vec3(static_cast<float>(i)));
        EXPECT_TRUE(scene.remove_mesh(temp));
    }

    EXPECT_EQ(scene.mesh_slots(), 2);
    EXPECT_EQ(scene.meshes().size(), 1u);
    EXPECT_NE(scene.mesh(keep), nullptr);
}

TEST(SysMeshScene, RetiredMeshIdIsNotReused)
{
    SysMeshScene  scene;
    const int32_t id = scene.create_mesh();

    scene.mesh(id)->create_vert(glm::vec3(1.0f));
    ASSERT_TRUE(scene.commitMeshChanges("Create"));
    ASSERT_TRUE(scene.remove_mesh(id));

    EXPECT_NE(scene.create_mesh(), id);
    EXPECT_EQ(scene.mesh_slots(), 2);
}

TEST(SysMeshScene, CommitFoldsMeshHistoriesIntoOneEntry)
{
    SysMeshScene scene;
    SysMesh*     a = scene.mesh(scene.create_mesh());
    SysMesh*     b = scene.mesh(scene.create_mesh());

    a->create_vert(glm::vec3(1.0f));
    b->create_vert(glm::vec3(2.0f));
    EXPECT_TRUE(scene.hasPendingMeshChanges());

    EXPECT_TRUE(scene.commitMeshChanges("Two meshes"));
    EXPECT_FALSE(scene.hasPendingMeshChanges());
    EXPECT_EQ(scene.history().size(), 1);
    EXPECT_EQ(scene.history().undo_name(), "Two meshes");

    ASSERT_TRUE(scene.history().undo_step());
    EXPECT_EQ(a->num_verts(), 0u);
    EXPECT_EQ(b->num_verts(), 0u);

    ASSERT_TRUE(scene.history().redo_step());
    EXPECT_EQ(a->num_verts(), 1u);
    EXPECT_EQ(b->num_verts(), 1u);

    // Nothing pending, nothing recorded.
    EXPECT_FALSE(scene.commitMeshChanges("Empty"));
    EXPECT_EQ(scene.history().size(), 1);
}

TEST(SysMeshScene, SuppressionNestsAndRestores)
{
    SysMeshScene scene;
    SysMesh*     mesh = scene.mesh(scene.create_mesh());

    scene.begin_history_suppression();
    scene.begin_history_suppression();
    mesh->create_vert(glm::vec3(0.0f));
    scene.end_history_suppression();

    EXPECT_TRUE(scene.history_suppressed());
    mesh->create_vert(glm::vec3(1.0f));
    scene.end_history_suppression();

    EXPECT_FALSE(scene.history_suppressed());
    EXPECT_FALSE(scene.hasPendingMeshChanges());

    mesh->create_vert(glm::vec3(2.0f));
    EXPECT_TRUE(scene.hasPendingMeshChanges());
}

TEST(SysMeshScene, NestedTransactionCommitsOnceWithOuterName)
{
    SysMeshScene scene;
    SysMesh*     mesh = scene.mesh(scene.create_mesh());

    scene.open_transaction("Outer");
    mesh->create_vert(glm::vec3(0.0f));

    scene.open_transaction("Inner");
    mesh->create_vert(glm::vec3(1.0f));
    EXPECT_FALSE(scene.close_transaction());

    // Deferred while the outer scope is open.
    EXPECT_FALSE(scene.commitMeshChanges("Sneaky"));
    EXPECT_EQ(scene.history().size(), 0);

    EXPECT_TRUE(scene.close_transaction());
    EXPECT_FALSE(scene.in_transaction());
    EXPECT_EQ(scene.history().size(), 1);
    EXPECT_EQ(scene.history().undo_name(), "Outer");

    ASSERT_TRUE(scene.history().undo_step());
    EXPECT_EQ(mesh->num_verts(), 0u);
}

TEST(SysMeshScene, EmptyTransactionRecordsNothing)
{
    SysMeshScene scene;
    SysMesh*     mesh = scene.mesh(scene.create_mesh());

    scene.open_transaction("Preview only");
    scene.begin_history_suppression();
    mesh->create_vert(glm::vec3(0.0f));
    scene.end_history_suppression();

    EXPECT_FALSE(scene.close_transaction());
    EXPECT_EQ(scene.history().size(), 0);
    EXPECT_EQ(mesh->num_verts(), 1u);
}

TEST(SysMeshScene, CancelTransactionRevertsEdits)
{
    SysMeshScene scene;
    SysMesh*     mesh = scene.mesh(scene.create_mesh());
    mesh->create_vert(glm::vec3(0.0f));
    ASSERT_TRUE(scene.commitMeshChanges("Base"));

    scene.open_transaction("Doomed");
    mesh->move_vert(0, glm::vec3(5.0f));
    mesh->create_vert(glm::vec3(1.0f));
    scene.cancel_transaction();

    EXPECT_FALSE(scene.in_transaction());
    EXPECT_EQ(mesh->num_verts(), 1u);
    EXPECT_EQ(mesh->vert_position(0), glm::vec3(0.0f));
    EXPECT_EQ(scene.history().size(), 1);
    EXPECT_FALSE(scene.hasPendingMeshChanges());
}

TEST(SysMeshScene, AbortUndoesPendingChanges)
{
    SysMeshScene scene;
    SysMesh*     mesh = scene.mesh(scene.create_mesh());

    mesh->create_vert(glm::vec3(0.0f));
    scene.abortMeshChanges();

    EXPECT_EQ(mesh->num_verts(), 0u);
    EXPECT_FALSE(scene.hasPendingMeshChanges());
}

TEST(SysMeshScene, RemovedCommittedMeshStaysReplayable)
{
    SysMeshScene  scene;
    const int32_t id   = scene.create_mesh();
    SysMesh*      mesh = scene.mesh(id);

    mesh->create_vert(glm::vec3(0.0f));
    ASSERT_TRUE(scene.commitMeshChanges("Create"));

    EXPECT_TRUE(scene.remove_mesh(id));
    EXPECT_EQ(scene.mesh(id), nullptr);

    // Replays into the retired mesh, not into freed memory.
    EXPECT_TRUE(scene.history().undo_step());
    EXPECT_TRUE(scene.history().redo_step());
}
