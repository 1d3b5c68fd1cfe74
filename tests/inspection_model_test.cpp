#include <inspection_model/inspections.hpp>
#include <inspection_model/project_edit.hpp>
#include <gtest/gtest.h>
#include <set>

using namespace inspection_model;

TEST(ProjectModel, NewIdHasPrefixAndHexSuffix) {
    const std::string id = new_id("part");
    ASSERT_EQ(id.size(), 15u);
    EXPECT_EQ(id.substr(0, 5), "part_");
    EXPECT_EQ(id.find_first_not_of("0123456789abcdef", 5), std::string::npos);
    EXPECT_NE(new_id("part"), new_id("part"));
    EXPECT_EQ(Project::create_empty().id.substr(0, 5), "proj_");
}

TEST(ProjectModel, NewIdsDoNotRepeat) {
    std::set<std::string> ids;
    for (int i = 0; i < 500; ++i) ids.insert(new_id("subpart"));
    EXPECT_EQ(ids.size(), 500u);
}

TEST(ProjectEdit, PartsAndSubpartsRejectBlankNames) {
    Project project = Project::create_empty();
    EXPECT_EQ(add_part(project, "   "), nullptr);

    Part* part = add_part(project, "  101동 ");
    ASSERT_NE(part, nullptr);
    EXPECT_EQ(part->name, "101동");
    const std::string part_id = part->id;

    EXPECT_FALSE(rename_part(project, part_id, ""));
    EXPECT_TRUE(rename_part(project, part_id, "102동"));
    EXPECT_EQ(find_part(project, part_id)->name, "102동");

    EXPECT_EQ(add_subpart(*part, "", "plan.png"), nullptr);
    EXPECT_EQ(add_subpart(*part, "3층", ""), nullptr);
    SubPart* sp = add_subpart(*part, "3층", "plan.png");
    ASSERT_NE(sp, nullptr);
    const std::string sp_id = sp->id;
    EXPECT_TRUE(rename_subpart(*part, sp_id, "4층"));
    EXPECT_EQ(find_subpart(*part, sp_id)->name, "4층");

    EXPECT_TRUE(remove_subpart(*part, sp_id));
    EXPECT_FALSE(remove_subpart(*part, sp_id));
    EXPECT_TRUE(remove_part(project, part_id));
    EXPECT_TRUE(project.parts.empty());
}

TEST(ProjectEdit, InspectionsRequireNameAndStartDate) {
    SubPart sp;
    EXPECT_FALSE(add_inspection(sp, {"", "2024-01-01", std::nullopt}).has_value());
    EXPECT_FALSE(add_inspection(sp, {"정기점검", " ", std::nullopt}).has_value());

    auto key = add_inspection(sp, {"정기점검", "2024-01-01", std::string("  ")});
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(key->substr(0, 5), "insp_");
    const Inspection& insp = sp.inspections.at(*key);
    EXPECT_EQ(insp.name, "정기점검");
    EXPECT_FALSE(insp.end_date.has_value());
    EXPECT_TRUE(insp.defects.is_object());

    EXPECT_TRUE(update_inspection(sp, *key, {"정밀점검", "2024-02-01", std::string("2024-02-10")}));
    EXPECT_EQ(sp.inspections.at(*key).end_date, "2024-02-10");
    EXPECT_FALSE(update_inspection(sp, "missing", {"a", "2024-01-01", std::nullopt}));

    EXPECT_TRUE(remove_inspection(sp, *key));
    EXPECT_TRUE(sp.inspections.empty());
}

TEST(ProjectEdit, DuplicateCopiesDefects) {
    SubPart sp;
    auto src = add_inspection(sp, {"1차", "2024-01-01", std::nullopt});
    ASSERT_TRUE(src.has_value());
    set_defects(sp, *src, {{"a1", {{"type", "CircleMark"}}}});

    auto dup = duplicate_inspection(sp, *src, {"2차", "2024-06-01", std::nullopt});
    ASSERT_TRUE(dup.has_value());
    EXPECT_NE(*dup, *src);
    EXPECT_EQ(sp.inspections.at(*dup).defects, sp.inspections.at(*src).defects);
    EXPECT_EQ(sp.inspections.at(*dup).name, "2차");

    get_defects(sp, *dup).erase("a1");
    EXPECT_TRUE(sp.inspections.at(*src).defects.contains("a1"));
    EXPECT_FALSE(duplicate_inspection(sp, "missing", {"x", "2024-01-01", std::nullopt}).has_value());
}

TEST(Inspections, EnsureAndNormalize) {
    SubPart sp;
    sp.inspections["A"].defects = nlohmann::json::array();
    normalize_subpart_inspections(sp);
    EXPECT_TRUE(sp.inspections["A"].defects.is_object());

    get_defects(sp, "B")["x"] = 1;
    EXPECT_EQ(list_inspections(sp), (std::vector<std::string>{"A", "B"}));

    set_defects(sp, "B", "not an object");
    EXPECT_TRUE(sp.inspections["B"].defects.empty());
}

TEST(Inspections, CopyFailsWhenTargetExists) {
    SubPart sp;
    set_defects(sp, "A", {{"k", 1}});
    EXPECT_TRUE(copy_inspection(sp, "A", "B"));
    EXPECT_EQ(sp.inspections["B"].defects["k"], 1);
    EXPECT_FALSE(copy_inspection(sp, "A", "B"));
}

TEST(Inspections, LatestByStartDateThenKey) {
    SubPart sp;
    EXPECT_FALSE(latest_inspection_key(sp).has_value());
    sp.inspections["b"].start_date = "2024-03-01";
    sp.inspections["a"].start_date = "2024-05-01";
    sp.inspections["c"].start_date = "2024-05-01";
    sp.inspections["d"];
    EXPECT_EQ(latest_inspection_key(sp), "c");
}

TEST(Inspections, TitleFallsBackToKey) {
    SubPart sp;
    sp.inspections["DEFAULT"];
    sp.inspections["k2"].name = "정기점검";
    EXPECT_EQ(inspection_title(sp, "DEFAULT"), "DEFAULT");
    EXPECT_EQ(inspection_title(sp, "k2"), "정기점검");
    EXPECT_EQ(inspection_title(sp, "nope"), "nope");
}
