#include <inspection_loaders/project_files.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace inspection_loaders;
namespace fs = std::filesystem;

namespace {

class ProjectFilesTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() / ("inspection_files_" + inspection_model::new_id("t"));
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path dir;
};

} // namespace

TEST(ProjectJson, CurrentFormatIsRead) {
    const nlohmann::json j = {
        {"id", "proj_1"},
        {"building", {{"name", "한빛아파트"}, {"address", "서울"}, {"photos", {"a.jpg", 3}}}},
        {"parts", {{
            {"id", "part_1"}, {"name", "101동"},
            {"subparts", {{
                {"id", "sp_1"}, {"name", "3층"}, {"image_path", "plan.png"},
                {"inspections", {
                    {"insp_1", {{"name", "1차"}, {"start_date", "2024-01-01"}, {"end_date", nullptr},
                                {"defects", {{"a1", {{"type", "CircleMark"}}}}}}},
                }},
            }}},
        }}},
    };
    auto project = project_from_json(j);
    ASSERT_TRUE(project.has_value());
    EXPECT_EQ(project->building.name, "한빛아파트");
    EXPECT_EQ(project->building.photos, std::vector<std::string>{"a.jpg"});
    ASSERT_EQ(project->parts.size(), 1u);
    const auto& sp = project->parts[0].subparts.at(0);
    const auto& insp = sp.inspections.at("insp_1");
    EXPECT_EQ(insp.name, "1차");
    EXPECT_FALSE(insp.end_date.has_value());
    EXPECT_TRUE(insp.defects.contains("a1"));
}

TEST(ProjectJson, SubpartDefectsMigrateToDefaultInspection) {
    const nlohmann::json j = {{"parts", {{
        {"id", "p"}, {"name", "101동"},
        {"subparts", {{{"id", "s"}, {"name", "3층"}, {"defects", {{"a1", {{"x", 1}}}}}}}},
    }}}};
    auto project = project_from_json(j);
    ASSERT_TRUE(project.has_value());
    const auto& sp = project->parts[0].subparts[0];
    ASSERT_EQ(sp.inspections.size(), 1u);
    EXPECT_TRUE(sp.inspections.at("DEFAULT").defects.contains("a1"));
}

TEST(ProjectJson, SingleLevelPartBecomesSubpart) {
    const nlohmann::json j = {{"parts", {{
        {"id", "p7"}, {"name", "주차장"}, {"image_path", "b1.png"}, {"defects", {{"a1", {{"x", 1}}}}},
    }}}};
    auto project = project_from_json(j);
    ASSERT_TRUE(project.has_value());
    ASSERT_EQ(project->parts[0].subparts.size(), 1u);
    const auto& sp = project->parts[0].subparts[0];
    EXPECT_EQ(sp.id.rfind("subpart_", 0), 0u);
    EXPECT_EQ(sp.id.size(), std::string("subpart_").size() + 10);
    EXPECT_EQ(sp.name, "주차장");
    EXPECT_EQ(sp.image_path, "b1.png");
    EXPECT_TRUE(sp.inspections.at("DEFAULT").defects.contains("a1"));
}

TEST(ProjectJson, SubpartWithoutDefectsGetsNoDefaultInspection) {
    const nlohmann::json j = {{"parts", {{
        {"id", "p"},
        {"subparts", {
            {{"id", "s1"}, {"name", "3층"}},
            {{"id", "s2"}, {"defects", nullptr}},
            {{"id", "s3"}, {"inspections", nlohmann::json::object()}, {"defects", {{"a1", {{"x", 1}}}}}},
        }},
    }}}};
    auto project = project_from_json(j);
    ASSERT_TRUE(project.has_value());
    const auto& subparts = project->parts[0].subparts;
    ASSERT_EQ(subparts.size(), 3u);
    EXPECT_TRUE(subparts[0].inspections.empty());
    EXPECT_TRUE(subparts[1].inspections.empty());
    ASSERT_EQ(subparts[2].inspections.size(), 1u);
    EXPECT_TRUE(subparts[2].inspections.at("DEFAULT").defects.contains("a1"));
}

TEST(ProjectJson, MissingIdsAreGenerated) {
    const nlohmann::json j = {{"parts", {
        {{"name", "101동"}, {"subparts", {{{"name", "3층"}}, {{"id", ""}}}}},
    }}};
    auto project = project_from_json(j);
    ASSERT_TRUE(project.has_value());
    EXPECT_EQ(project->id.rfind("proj_", 0), 0u);
    const auto& part = project->parts.at(0);
    EXPECT_EQ(part.id.rfind("part_", 0), 0u);
    ASSERT_EQ(part.subparts.size(), 2u);
    EXPECT_EQ(part.subparts[0].id.rfind("subpart_", 0), 0u);
    EXPECT_EQ(part.subparts[1].id.rfind("subpart_", 0), 0u);
    EXPECT_NE(part.subparts[0].id, part.subparts[1].id);

    const nlohmann::json kept = {{"id", "proj_keep"}, {"parts", nlohmann::json::array()}};
    EXPECT_EQ(project_from_json(kept)->id, "proj_keep");
}

TEST(ProjectJson, BareDefectSetUnderInspectionKey) {
    const nlohmann::json j = {{"parts", {{
        {"id", "p"}, {"subparts", {{{"id", "s"}, {"inspections", {{"old", {{"a1", {{"x", 1}}}}}}}}}},
    }}}};
    auto project = project_from_json(j);
    ASSERT_TRUE(project.has_value());
    const auto& insp = project->parts[0].subparts[0].inspections.at("old");
    EXPECT_TRUE(insp.defects.contains("a1"));
    EXPECT_TRUE(insp.name.empty());
}

TEST(ProjectJson, WriterEmitsNullEndDate) {
    inspection_model::Project project;
    project.id = "proj_x";
    auto& sp = project.parts.emplace_back().subparts.emplace_back();
    sp.inspections["k"].start_date = "2024-01-01";
    const auto j = project_to_json(project);
    EXPECT_TRUE(j["parts"][0]["subparts"][0]["inspections"]["k"]["end_date"].is_null());
    EXPECT_TRUE(j["parts"][0]["subparts"][0]["inspections"]["k"]["defects"].is_object());
}

TEST(ProjectJson, MalformedStreamIsRejected) {
    std::istringstream in("{ not json");
    EXPECT_FALSE(load_project(in).has_value());
    std::istringstream arr("[1, 2]");
    EXPECT_FALSE(load_project(arr).has_value());
}

TEST_F(ProjectFilesTest, SaveThenLoad) {
    inspection_model::Project project = inspection_model::Project::create_empty();
    project.building.name = "한빛아파트";
    auto& part = project.parts.emplace_back();
    part.id = "part_1";
    part.name = "101동";
    auto& sp = part.subparts.emplace_back();
    sp.id = "sp_1";
    sp.name = "3층";
    sp.image_path = "plan.png";
    sp.inspections["k"] = {"1차", "2024-01-01", std::string("2024-01-05"), {{"a1", {{"x", 1}}}}};

    const std::string path = (dir / "nested" / "project.json").string();
    ASSERT_TRUE(save_project(project, path));

    auto loaded = load_project(path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(project_to_json(*loaded), project_to_json(project));
}

TEST_F(ProjectFilesTest, MissingFiles) {
    EXPECT_FALSE(load_project((dir / "absent.json").string()).has_value());
    auto index = load_index((dir / "absent_index.json").string());
    ASSERT_TRUE(index.has_value());
    EXPECT_TRUE(index->empty());
}

TEST_F(ProjectFilesTest, IndexRoundTripAndBadIndex) {
    const std::string path = (dir / "projects_index.json").string();
    ASSERT_TRUE(save_index({{"proj_a", "data/proj_a.json"}}, path));
    auto index = load_index(path);
    ASSERT_TRUE(index.has_value());
    EXPECT_EQ(index->at("proj_a"), "data/proj_a.json");

    std::ofstream(path) << "[]";
    EXPECT_FALSE(load_index(path).has_value());
}

TEST_F(ProjectFilesTest, InvalidUtf8IsReplacedOnSave) {
    inspection_model::Project project = inspection_model::Project::create_empty();
    auto& sp = project.parts.emplace_back().subparts.emplace_back();
    sp.id = "sp_1";
    sp.inspections["k"].defects = {{"a1", {{"remark", std::string("균열 \xEB\xB0")}}}};

    const std::string path = (dir / "project.json").string();
    ASSERT_TRUE(save_project(project, path));

    auto loaded = load_project(path);
    ASSERT_TRUE(loaded.has_value());
    const std::string remark = loaded->parts[0].subparts[0].inspections.at("k").defects["a1"]["remark"];
    EXPECT_EQ(remark.rfind("균열 ", 0), 0u);
    EXPECT_NE(remark.find("\xEF\xBF\xBD"), std::string::npos);
}

TEST_F(ProjectFilesTest, FailedSaveKeepsPreviousFile) {
    inspection_model::Project project = inspection_model::Project::create_empty();
    project.building.name = "첫 저장";
    const std::string path = (dir / "project.json").string();
    ASSERT_TRUE(save_project(project, path));

    // A directory where the staging file would go makes the write fail.
    fs::create_directories(dir / "project.json.tmp");
    project.building.name = "두번째 저장";
    EXPECT_FALSE(save_project(project, path));

    auto loaded = load_project(path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->building.name, "첫 저장");
    EXPECT_FALSE(save_index({{"proj_a", "a.json"}}, (dir / "project.json").string() + ".tmp"));
}
