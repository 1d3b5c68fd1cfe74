#include <mark_loaders/mark_records.hpp>
#include <mark_loaders/snapshot.hpp>
#include <mark_model/leader_line.hpp>
#include <mark_model/mark.hpp>
#include <gtest/gtest.h>

using namespace mark_loaders;
using mark_model::MarkKind;

TEST(MarkRecords, TypeRegistryNames) {
    EXPECT_STREQ(record_type_name(MarkKind::Circle), "CircleMark");
    EXPECT_STREQ(record_type_name(MarkKind::SCurve), "SCurveWithMidCircle");
    EXPECT_EQ(kind_from_type_name("SCurveMark"), MarkKind::SCurve);
    EXPECT_EQ(kind_from_type_name("TriangleMark"), MarkKind::Triangle);
    EXPECT_FALSE(kind_from_type_name("HexagonMark").has_value());
}

TEST(MarkRecords, CircleRecordCarriesDefectAndLine) {
    auto c = mark_model::make_circle({120, 80});
    c.internal_id = "abc";
    mark_model::set_circle_id(c, 3);
    mark_model::DefectInfo info = mark_model::DefectInfo::initial();
    info.location = "거실";
    info.size.width_mm = "0.3";
    info.progress = true;
    c.defect = info;
    mark_model::begin_attach(c, {10, 10});
    mark_model::confirm_attach(c);

    const auto rec = mark_to_record(c);
    EXPECT_EQ(rec["type"], "CircleMark");
    EXPECT_EQ(rec["display_id"], 3);
    EXPECT_EQ(rec["internal_id"], "abc");
    EXPECT_EQ(rec["defect_info"]["member"], "벽체");
    EXPECT_EQ(rec["defect_info"]["size"]["width_mm"], "0.3");
    EXPECT_EQ(rec["defect_info"]["progress"], true);
    ASSERT_TRUE(rec.contains("line"));
    EXPECT_EQ(rec["line"]["p1"][0], 10.0);

    auto back = mark_from_record(rec);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->kind, MarkKind::Circle);
    EXPECT_EQ(back->display_id, 3);
    EXPECT_EQ(back->internal_id, "abc");
    ASSERT_TRUE(back->defect.has_value());
    EXPECT_EQ(*back->defect, info);
    EXPECT_FALSE(back->leader.has_value());

    auto line = record_line(rec);
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(line->first, (mark_model::Point{10, 10}));
}

TEST(MarkRecords, ShapeFieldsAndTransform) {
    auto sc = mark_model::make_scurve({5, 6}, 50, 70);
    mark_model::set_scale(sc, 1.5);
    mark_model::set_rotation(sc, 30);
    const auto rec = mark_to_record(sc);
    EXPECT_EQ(rec["w"], 50.0);
    EXPECT_EQ(rec["h"], 70.0);
    EXPECT_TRUE(rec["display_id"].is_null());

    auto back = mark_from_record(rec);
    ASSERT_TRUE(back.has_value());
    EXPECT_DOUBLE_EQ(back->scale, 1.5);
    EXPECT_DOUBLE_EQ(back->rotation, 30.0);
    EXPECT_DOUBLE_EQ(back->w, 50.0);
}

TEST(MarkRecords, UnknownTypeAndMalformedFieldsAreRejected) {
    EXPECT_FALSE(mark_from_record({{"type", "HexagonMark"}, {"x", 1}, {"y", 2}}).has_value());
    EXPECT_FALSE(mark_from_record({{"x", 1}, {"y", 2}}).has_value());
    EXPECT_FALSE(mark_from_record({{"type", "SquareMark"}, {"x", "left"}}).has_value());
    EXPECT_FALSE(mark_from_record(nlohmann::json::array()).has_value());
}

TEST(MarkRecords, LegacyStringDisplayIdIsKept) {
    auto back = mark_from_record({{"type", "SquareMark"}, {"x", 0}, {"y", 0}, {"display_id", "B-7"}});
    ASSERT_TRUE(back.has_value());
    EXPECT_FALSE(back->display_id.has_value());
    EXPECT_EQ(back->legacy_display_id, "B-7");
    EXPECT_EQ(mark_to_record(*back)["display_id"], "B-7");
}

TEST(MarkRecords, CircleWithoutDefectInfoGetsEmptyRecord) {
    auto back = mark_from_record({{"type", "CircleMark"}, {"x", 0}, {"y", 0}, {"display_id", 2.0}});
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->display_id, 2);
    ASSERT_TRUE(back->defect.has_value());
    EXPECT_EQ(*back->defect, mark_model::DefectInfo{});
}

TEST(MarkRecords, OutOfRangeDisplayIdIsDropped) {
    const auto read_id = [](const nlohmann::json& did) {
        auto m = mark_from_record({{"type", "CircleMark"}, {"x", 0}, {"y", 0}, {"display_id", did}});
        EXPECT_TRUE(m.has_value());
        return m ? m->display_id : std::nullopt;
    };
    EXPECT_EQ(read_id(5), 5);
    EXPECT_EQ(read_id(2147483646), 2147483646);
    EXPECT_FALSE(read_id(2147483647).has_value());
    EXPECT_FALSE(read_id(0).has_value());
    EXPECT_FALSE(read_id(-3).has_value());
    EXPECT_FALSE(read_id(1e300).has_value());
}

TEST(MarkRecords, NumericSizeFieldsReadAsText) {
    const auto info = defect_info_from_json({{"size", {{"width_mm", 0.5}, {"count_ea", 2}}}});
    EXPECT_EQ(info.size.width_mm, "0.5");
    EXPECT_EQ(info.size.count_ea, "2");
    EXPECT_TRUE(info.member.empty());
}

TEST(MemoRecords, LineAndFreePath) {
    const auto line = mark_model::make_memo_line({1, 2}, {30, 40});
    const auto rec = memo_to_record(line);
    EXPECT_EQ(rec["type"], "memo_line");
    auto back = memo_from_record(rec);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->points.back(), (mark_model::Point{30, 40}));

    auto path = mark_model::make_memo_free_path({0, 0});
    mark_model::add_memo_point(path, {5, 5});
    mark_model::add_memo_point(path, {10, 0});
    const auto prec = memo_to_record(path);
    EXPECT_EQ(prec["type"], "memo_free");
    EXPECT_EQ(prec["pts"].size(), 3u);
    auto pback = memo_from_record(prec);
    ASSERT_TRUE(pback.has_value());
    EXPECT_EQ(pback->points.size(), 3u);

    EXPECT_FALSE(memo_from_record({{"type", "memo_free"}, {"pts", nlohmann::json::array()}}).has_value());
    EXPECT_FALSE(memo_from_record({{"type", "memo_line"}, {"p1", {0, 0}}}).has_value());
}

TEST(Snapshot, ShapeAndVersion) {
    const auto snap = make_snapshot("plan.png", nlohmann::json::array({{{"type", "SquareMark"}}}),
        nlohmann::json::array());
    EXPECT_EQ(snapshot_image(snap), "plan.png");
    EXPECT_EQ(snapshot_items(snap).size(), 1u);
    EXPECT_TRUE(snapshot_memos(snap).empty());
    EXPECT_EQ(read_snapshot_version(snap), snapshot_version);

    const nlohmann::json legacy = {{"image", "old.png"}, {"items", nlohmann::json::array()}};
    EXPECT_EQ(read_snapshot_version(legacy), 0);
    EXPECT_TRUE(snapshot_memos(legacy).is_array());
}
