#include <mark_scene/undo_history.hpp>
#include <gtest/gtest.h>

using mark_scene::UndoHistory;

namespace {

// A counter stands in for the editable document.
struct Document {
    int value = 0;
    int restores = 0;
    UndoHistory history{
        [this] { return nlohmann::json(value); },
        [this](const nlohmann::json& j) { value = j.get<int>(); ++restores; }};

    void edit(int v) {
        history.begin_edit();
        value = v;
        history.end_edit();
    }
};

} // namespace

TEST(UndoHistory, BaselineIsNeverUndone) {
    Document doc;
    doc.history.reset(0);
    EXPECT_FALSE(doc.history.can_undo());
    EXPECT_FALSE(doc.history.undo());
    EXPECT_EQ(doc.restores, 0);
}

TEST(UndoHistory, UndoAndRedoReplaySnapshots) {
    Document doc;
    doc.history.reset(0);
    doc.edit(1);
    doc.edit(2);
    EXPECT_EQ(doc.history.undo_depth(), 3u);

    ASSERT_TRUE(doc.history.undo());
    EXPECT_EQ(doc.value, 1);
    ASSERT_TRUE(doc.history.undo());
    EXPECT_EQ(doc.value, 0);
    EXPECT_FALSE(doc.history.undo());

    ASSERT_TRUE(doc.history.redo());
    EXPECT_EQ(doc.value, 1);
    EXPECT_EQ(doc.history.redo_depth(), 1u);
}

TEST(UndoHistory, UnchangedSessionPushesNothing) {
    Document doc;
    doc.history.reset(0);
    doc.history.begin_edit();
    EXPECT_FALSE(doc.history.end_edit());
    EXPECT_EQ(doc.history.undo_depth(), 1u);
}

TEST(UndoHistory, NewEditClearsRedo) {
    Document doc;
    doc.history.reset(0);
    doc.edit(1);
    ASSERT_TRUE(doc.history.undo());
    EXPECT_TRUE(doc.history.can_redo());

    doc.edit(5);
    EXPECT_FALSE(doc.history.can_redo());
    EXPECT_EQ(doc.history.undo_depth(), 2u);
}

TEST(UndoHistory, AbortClosesWithoutCapture) {
    Document doc;
    doc.history.reset(0);
    doc.history.begin_edit();
    doc.value = 9;
    doc.history.abort_edit();
    EXPECT_FALSE(doc.history.is_editing());
    EXPECT_FALSE(doc.history.end_edit());
    EXPECT_EQ(doc.history.undo_depth(), 1u);
}

TEST(UndoHistory, EditsDuringReplayAreIgnored) {
    int value = 0;
    UndoHistory* self = nullptr;
    UndoHistory history(
        [&] { return nlohmann::json(value); },
        [&](const nlohmann::json& j) {
            value = j.get<int>();
            self->begin_edit();
            EXPECT_TRUE(self->is_replaying());
            EXPECT_FALSE(self->end_edit());
        });
    self = &history;
    history.reset(0);
    history.begin_edit();
    value = 3;
    ASSERT_TRUE(history.end_edit());

    ASSERT_TRUE(history.undo());
    EXPECT_EQ(value, 0);
    EXPECT_FALSE(history.is_editing());
    EXPECT_EQ(history.undo_depth(), 1u);
}
