#include <mark_model/label.hpp>
#include <mark_model/mark.hpp>
#include <mark_model/mark_constants.hpp>
#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>
#include <sstream>

using namespace mark_model;

TEST(MarkModel, FactoriesUseDefaultSizes) {
    EXPECT_DOUBLE_EQ(make_circle({0, 0}).radius, defaults::circle_radius);
    EXPECT_DOUBLE_EQ(make_square({0, 0}).size, defaults::square_size);
    EXPECT_DOUBLE_EQ(make_triangle({0, 0}).size, defaults::triangle_size);
    const Mark s = make_scurve({0, 0});
    EXPECT_DOUBLE_EQ(s.w, defaults::scurve_width);
    EXPECT_DOUBLE_EQ(s.h, defaults::scurve_height);
    EXPECT_DOUBLE_EQ(s.mid_radius, defaults::scurve_mid_radius);
}

TEST(MarkModel, CapabilitiesFollowKind) {
    EXPECT_TRUE(owns_leader_line(MarkKind::SCurve));
    EXPECT_FALSE(owns_leader_line(MarkKind::NoteText));
    EXPECT_TRUE(is_memo(MarkKind::MemoFreePath));
    EXPECT_FALSE(is_serializable(MarkKind::MemoLine));
    EXPECT_TRUE(has_defect_record(MarkKind::Circle));
    EXPECT_FALSE(has_defect_record(MarkKind::Square));
}

TEST(MarkModel, CircleScaleSaturates) {
    Mark c = make_circle({0, 0});
    set_scale(c, 10.0);
    EXPECT_DOUBLE_EQ(c.scale, defaults::circle_max_scale);
    set_scale(c, 0.01);
    EXPECT_DOUBLE_EQ(c.scale, defaults::circle_min_scale);
    set_scale(c, -1.0);
    EXPECT_DOUBLE_EQ(c.scale, defaults::circle_min_scale);
}

TEST(MarkModel, NonCircleScaleIsUnbounded) {
    Mark sq = make_square({0, 0});
    set_scale(sq, 4.0);
    EXPECT_DOUBLE_EQ(sq.scale, 4.0);
    set_scale(sq, 0.0);
    EXPECT_DOUBLE_EQ(sq.scale, 4.0);
}

TEST(MarkModel, RejectedScaleIsLoggedAtDebug) {
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    auto previous = spdlog::default_logger();
    auto capture = std::make_shared<spdlog::logger>("scale_capture", sink);
    capture->set_level(spdlog::level::debug);
    spdlog::set_default_logger(capture);

    Mark c = make_circle({0, 0});
    set_scale(c, 1.5);
    set_scale(c, 0.0);
    set_scale(c, -1.0);
    spdlog::set_default_logger(previous);

    EXPECT_DOUBLE_EQ(c.scale, 1.5);
    const std::string text = out.str();
    EXPECT_NE(text.find("set_scale ignored kind=circle scale=0"), std::string::npos);
    EXPECT_NE(text.find("scale=-1"), std::string::npos);
}

TEST(MarkModel, SceneBoundsFollowPositionAndScale) {
    Mark sq = make_square({100, 50}, 20);
    set_scale(sq, 2.0);
    const Rect r = scene_bounds(sq);
    EXPECT_NEAR(r.x, 80.0, 1e-9);
    EXPECT_NEAR(r.y, 30.0, 1e-9);
    EXPECT_NEAR(r.width, 40.0, 1e-9);
    const Point c = scene_center(sq);
    EXPECT_NEAR(c.x, 100.0, 1e-9);
    EXPECT_NEAR(c.y, 50.0, 1e-9);
}

TEST(MarkModel, HitTestPerShape) {
    const Mark c = make_circle({0, 0}, 10);
    EXPECT_TRUE(hit_test(c, {7, 7}));
    EXPECT_FALSE(hit_test(c, {9, 9}));

    const Mark t = make_triangle({0, 0}, 40);
    EXPECT_TRUE(hit_test(t, {0, 0}));
    EXPECT_FALSE(hit_test(t, {-19, -15}));

    Mark memo = make_memo_line({0, 0}, {100, 0});
    EXPECT_TRUE(hit_test(memo, {50, defaults::memo_hit_width * 0.5 - 1}));
    EXPECT_FALSE(hit_test(memo, {50, defaults::memo_hit_width}));

    Mark hidden = make_square({0, 0});
    hidden.visible = false;
    EXPECT_FALSE(hit_test(hidden, {0, 0}));
}

TEST(MarkModel, CircleOutlineIsFlattenedCircle) {
    const Mark c = make_circle({50, 50}, 10);
    const auto outlines = outline_scene(c);
    ASSERT_EQ(outlines.size(), 1u);
    EXPECT_EQ(outlines[0].size(), static_cast<std::size_t>(defaults::circle_outline_segments));
    for (const auto& p : outlines[0])
        EXPECT_NEAR(mark_geometry::distance(p, {50, 50}), 10.0, 1e-9);
}

TEST(MarkModel, TranslateMovesMemoPoints) {
    Mark path = make_memo_free_path({0, 0});
    add_memo_point(path, {10, 0});
    add_memo_point(path, {10, 10});
    translate(path, {5, 5});
    ASSERT_EQ(path.points.size(), 3u);
    EXPECT_EQ(path.points.back(), (Point{15, 15}));
}

TEST(MarkModel, MemoLineEndAndLength) {
    Mark line = make_memo_line({0, 0}, {0, 0});
    set_memo_end(line, {3, 4});
    EXPECT_DOUBLE_EQ(memo_line_length(line), 5.0);
    add_memo_point(line, {9, 9});
    EXPECT_EQ(line.points.size(), 2u);
}

TEST(MarkModel, NoteTextMeasuredWithInjectedMeasure) {
    const TextMeasure fixed = [](std::string_view, double) { return Size{50, 20}; };
    const Mark note = make_note_text({10, 10}, "하자", fixed);
    const Rect r = local_bounds(note);
    EXPECT_DOUBLE_EQ(r.width, 50 + defaults::text_margin * 2);
    EXPECT_DOUBLE_EQ(r.height, 20 + defaults::text_margin * 2);
}

TEST(MarkModel, DefaultMeasureCountsCodePoints) {
    const Size s = estimate_text_size("하자", 10.0);
    EXPECT_DOUBLE_EQ(s.width, 2 * 10.0 * 0.6);
    EXPECT_DOUBLE_EQ(s.height, 13.0);
    EXPECT_DOUBLE_EQ(estimate_text_size("a\nbb", 10.0).height, 26.0);
}

TEST(Label, SitsAtBottomRightOfBody) {
    const TextMeasure fixed = [](std::string_view, double) { return Size{30, 12}; };
    Mark c = make_circle({0, 0}, 10);
    enable_label(c, "벽체", fixed);
    ASSERT_TRUE(c.label.has_value());
    EXPECT_DOUBLE_EQ(c.label->local_pos.x, 10 + defaults::label_margin_x);
    EXPECT_DOUBLE_EQ(c.label->local_pos.y, 10 - 12 + defaults::label_margin_y);

    set_position(c, {100, 100});
    const Rect lb = label_scene_bounds(c);
    EXPECT_NEAR(lb.x, 100 + 10 + defaults::label_margin_x, 1e-9);
    EXPECT_TRUE(label_hit_test(c, {lb.x + 1, lb.y + 1}));
}

TEST(Label, NotOwnedByNotesOrMemos) {
    Mark note = make_note_text({0, 0}, "x", default_text_measure());
    enable_label(note, "label", default_text_measure());
    EXPECT_FALSE(note.label.has_value());
}

TEST(Label, TextSourcePerKind) {
    Mark c = make_circle({0, 0});
    c.defect = DefectInfo::initial();
    EXPECT_EQ(label_text_for(c), defaults::default_member);

    Mark sq = make_square({0, 0});
    sq.legacy_display_id = "A-3";
    EXPECT_EQ(label_text_for(sq), "A-3");
}
