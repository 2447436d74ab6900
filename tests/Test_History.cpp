#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "History.hpp"

namespace
{
    // Appends its value to the context vector on redo, pops it on undo.
    struct PushAction final : HistoryAction
    {
        explicit PushAction(int v) : value(v) {}

        void undo(void* data) override
        {
            static_cast<std::vector<int>*>(data)->pop_back();
        }

        void redo(void* data) override
        {
            static_cast<std::vector<int>*>(data)->push_back(value);
        }

        int value;
    };

    // Records the action into `h` and applies it, the way SysMesh does.
    void Push(History& h, std::vector<int>& log, int v)
    {
        log.push_back(v);
        h.emplace<PushAction>(v);
    }
} // namespace

TEST(History, UndoRedoSteps)
{
    std::vector<int> log;
    History          h(&log);

    Push(h, log, 1);
    Push(h, log, 2);
    Push(h, log, 3);

    EXPECT_EQ(h.size(), 3);
    EXPECT_TRUE(h.can_undo());
    EXPECT_FALSE(h.can_redo());

    EXPECT_TRUE(h.undo_step());
    EXPECT_EQ(log, (std::vector<int>{1, 2}));
    EXPECT_TRUE(h.can_redo());

    EXPECT_TRUE(h.redo_step());
    EXPECT_EQ(log, (std::vector<int>{1, 2, 3}));

    h.undo();
    EXPECT_TRUE(log.empty());
    EXPECT_FALSE(h.undo_step());

    h.redo();
    EXPECT_EQ(log, (std::vector<int>{1, 2, 3}));
}

TEST(History, InsertDropsRedoTail)
{
    std::vector<int> log;
    History          h(&log);

    Push(h, log, 1);
    Push(h, log, 2);
    ASSERT_TRUE(h.undo_step());

    Push(h, log, 7);
    EXPECT_EQ(h.size(), 2);
    EXPECT_FALSE(h.can_redo());

    h.undo();
    h.redo();
    EXPECT_EQ(log, (std::vector<int>{1, 7}));
}

TEST(History, NestedHistoryIsOneNamedStep)
{
    std::vector<int> log;
    History          scene(nullptr);

    auto inner = std::make_unique<History>(&log);
    inner->set_name("Batch");
    Push(*inner, log, 1);
    Push(*inner, log, 2);
    scene.insert(std::move(inner));

    EXPECT_EQ(scene.size(), 1);
    EXPECT_EQ(scene.undo_name(), "Batch");

    ASSERT_TRUE(scene.undo_step());
    EXPECT_TRUE(log.empty());
    EXPECT_EQ(scene.undo_name(), "");

    ASSERT_TRUE(scene.redo_step());
    EXPECT_EQ(log, (std::vector<int>{1, 2}));
}

TEST(History, ExternalBusyFlagMirrorsReplay)
{
    bool busy = false;

    struct BusyWitness final : HistoryAction
    {
        explicit BusyWitness(bool* b) : flag(b) {}
        void undo(void*) override { seen = *flag; }
        void redo(void*) override { seen = *flag; }
        bool* flag;
        bool  seen = false;
    };

    History h(nullptr, &busy);
    auto*   witness = h.emplace<BusyWitness>(&busy);

    EXPECT_FALSE(h.is_busy());
    h.undo();
    EXPECT_TRUE(witness->seen);
    EXPECT_FALSE(busy);
    EXPECT_FALSE(h.is_busy());
}

TEST(History, ClearResetsTimeline)
{
    std::vector<int> log;
    History          h(&log);

    Push(h, log, 1);
    Push(h, log, 2);
    ASSERT_TRUE(h.undo_step());
    h.clear();

    EXPECT_EQ(h.size(), 0);
    EXPECT_FALSE(h.can_undo());
    EXPECT_FALSE(h.can_redo());
}

TEST(History, UndoAllStopsAtBeginning)
{
    std::vector<int> log;
    History          h(&log);

    Push(h, log, 1);
    Push(h, log, 2);
    Push(h, log, 3);
    ASSERT_TRUE(h.undo_step());

    h.undo();
    EXPECT_TRUE(log.empty());
    EXPECT_FALSE(h.is_busy());
    EXPECT_EQ(h.size(), 3);

    h.redo();
    EXPECT_EQ(log, (std::vector<int>{1, 2, 3}));
    EXPECT_FALSE(h.can_redo());
}
