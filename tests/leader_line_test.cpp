#include <mark_model/leader_line.hpp>
#include <mark_model/mark.hpp>
#include <mark_model/mark_constants.hpp>
#include <mark_geometry/intersect.hpp>
#include <gtest/gtest.h>
#include <algorithm>

using namespace mark_model;

namespace {

// Terminus must sit on the body outline, on the segment anchor -> center.
void expect_on_outline_toward_center(const Mark& m) {
    ASSERT_TRUE(m.leader.has_value());
    const Point a = m.leader->anchor;
    const Point t = m.leader->terminus;
    const Point c = scene_center(m);
    EXPECT_NEAR(mark_geometry::distance_to_segment(t, {a, c}), 0.0, 1e-6);

    double best = 1e9;
    for (const auto& outline : outline_scene(m)) {
        for (std::size_t i = 0; i < outline.size(); ++i) {
            const mark_geometry::Segment edge{outline[i], outline[(i + 1) % outline.size()]};
            best = std::min(best, mark_geometry::distance_to_segment(t, edge));
        }
    }
    EXPECT_NEAR(best, 0.0, 1e-6);
}

} // namespace

TEST(LeaderLine, PreviewStartsAtAnchorWithReducedOpacity) {
    Mark sq = make_square({100, 100});
    begin_attach(sq, {0, 0});
    ASSERT_TRUE(sq.leader.has_value());
    EXPECT_TRUE(sq.leader->preview);
    EXPECT_DOUBLE_EQ(sq.leader->opacity, defaults::leader_preview_opacity);
    EXPECT_EQ(sq.leader->terminus, (Point{0, 0}));

    update_preview(sq, {40, 40});
    EXPECT_EQ(sq.leader->terminus, (Point{40, 40}));
}

TEST(LeaderLine, PreviewFollowsPointerUntilConfirmed) {
    Mark c = make_circle({0, 0});
    begin_attach(c, {0, 0});
    set_position(c, {120, 0});
    update_preview(c, {120, 0});
    EXPECT_EQ(c.leader->terminus, (Point{120, 0}));

    set_scale(c, 1.5);
    EXPECT_EQ(c.leader->terminus, (Point{120, 0}));

    confirm_attach(c);
    EXPECT_NEAR(c.leader->terminus.x, 120.0 - c.radius * 1.5, 0.05);
    EXPECT_NEAR(c.leader->terminus.y, 0.0, 1e-6);
}

TEST(LeaderLine, ConfirmTerminatesOnOutline) {
    Mark sq = make_square({100, 100}, 20);
    begin_attach(sq, {0, 100});
    confirm_attach(sq);
    EXPECT_FALSE(sq.leader->preview);
    EXPECT_DOUBLE_EQ(sq.leader->opacity, 1.0);
    EXPECT_NEAR(sq.leader->terminus.x, 90.0, 1e-9);
    EXPECT_NEAR(sq.leader->terminus.y, 100.0, 1e-9);
}

TEST(LeaderLine, InvariantHoldsAfterBodyChanges) {
    Mark tri = make_triangle({200, 150});
    begin_attach(tri, {50, 40});
    confirm_attach(tri);
    expect_on_outline_toward_center(tri);

    set_position(tri, {260, 180});
    expect_on_outline_toward_center(tri);
    EXPECT_EQ(tri.leader->anchor, (Point{50, 40}));

    set_rotation(tri, 33.0);
    expect_on_outline_toward_center(tri);

    set_scale(tri, 1.7);
    expect_on_outline_toward_center(tri);
}

TEST(LeaderLine, CircleUsesRoundOutline) {
    Mark c = make_circle({0, 0}, 10);
    begin_attach(c, {-30, -30});
    confirm_attach(c);
    EXPECT_NEAR(mark_geometry::distance(c.leader->terminus, {0, 0}), 10.0, 0.05);
}

TEST(LeaderLine, AnchorInsideBodyFallsBackToCenterRay) {
    Mark sq = make_square({0, 0}, 40);
    begin_attach(sq, {5, 0});
    confirm_attach(sq);
    // Hits the far side of the ring along anchor -> center.
    EXPECT_NEAR(sq.leader->terminus.x, -20.0, 1e-9);
}

TEST(LeaderLine, AnchorOnCenterTerminatesAtCenter) {
    Mark sq = make_square({0, 0}, 40);
    begin_attach(sq, {0, 0});
    confirm_attach(sq);
    EXPECT_EQ(sq.leader->terminus, (Point{0, 0}));
}

TEST(LeaderLine, MoveAnchorIsOnlyAnchorMutator) {
    Mark sq = make_square({100, 100}, 20);
    begin_attach(sq, {0, 100});
    confirm_attach(sq);
    move_anchor(sq, {100, 0});
    EXPECT_EQ(sq.leader->anchor, (Point{100, 0}));
    EXPECT_NEAR(sq.leader->terminus.y, 90.0, 1e-9);
}

TEST(LeaderLine, NotesNeverOwnLines) {
    Mark note = make_note_text({0, 0}, "하자", default_text_measure());
    begin_attach(note, {10, 10});
    EXPECT_FALSE(note.leader.has_value());
}

TEST(LeaderLine, RestoreRecomputesTerminus) {
    Mark sq = make_square({100, 100}, 20);
    restore_attach(sq, {0, 100}, {1234, 5678});
    ASSERT_TRUE(sq.leader.has_value());
    EXPECT_FALSE(sq.leader->preview);
    EXPECT_NEAR(sq.leader->terminus.x, 90.0, 1e-9);
}
