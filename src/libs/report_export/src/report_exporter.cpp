#include <report_export/report_exporter.hpp>
#include <report_export/defect_rows.hpp>
#include <inspection_model/inspections.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <utility>

namespace report_export {

namespace fs = std::filesystem;

ReportExporter::ReportExporter(const inspection_model::Project& project,
    const inspection_model::Part& part, const inspection_model::SubPart& subpart,
    std::string output_dir, std::string template_dir)
    : project_(project)
    , part_(part)
    , subpart_(subpart)
    , output_dir_(std::move(output_dir))
    , template_dir_(std::move(template_dir)) {}

std::string ReportExporter::base_filename() const {
    const std::string building = project_.building.name.empty() ? "프로젝트" : project_.building.name;
    const std::string part = part_.name.empty() ? "대분류" : part_.name;
    const std::string sub = subpart_.name.empty() ? "소분류" : subpart_.name;
    return building + "-" + part + "-" + sub;
}

std::optional<std::string> ReportExporter::find_template(const char* stem) const {
    std::error_code ec;
    fs::directory_iterator it(template_dir_, ec);
    if (ec) return std::nullopt;
    for (const auto& entry : it) {
        if (entry.is_regular_file(ec) && entry.path().stem() == stem) return entry.path().string();
    }
    return std::nullopt;
}

std::optional<std::string> ReportExporter::render(const char* stem, const std::string& suffix,
    const Replacements& values) const
{
    const auto tmpl = find_template(stem);
    if (!tmpl) {
        spdlog::warn("report_export template_missing dir={} stem={}", template_dir_, stem);
        return std::nullopt;
    }

    std::error_code ec;
    fs::create_directories(output_dir_, ec);
    if (ec) {
        spdlog::error("report_export mkdir_failed dir={} err={}", output_dir_, ec.message());
        return std::nullopt;
    }

    const fs::path out = fs::path(output_dir_)
        / (base_filename() + "-" + suffix + fs::path(*tmpl).extension().string());
    if (!render_template(*tmpl, out.string(), values)) return std::nullopt;
    spdlog::info("report_export ok path={}", out.string());
    return out.string();
}

std::optional<std::string> ReportExporter::export_visual_inspection() const {
    nlohmann::json defects = nlohmann::json::object();
    std::string insp_name;
    if (auto key = inspection_model::latest_inspection_key(subpart_)) {
        const auto& insp = subpart_.inspections.at(*key);
        defects = insp.defects;
        insp_name = insp.name.empty() ? *key : insp.name;
    }

    const auto table = rows_to_table_json(extract_defect_rows(defects));
    return render(visual_inspection_template_stem, "visual_inspection", {
        {"__TITLE__", "3.1.7 육안조사 결함 현황"},
        {"__SUB_HEADER__", "[" + part_.name + " " + subpart_.name + "] (" + insp_name + ")"},
        {"__TABLE_JSON__", table.dump(2)},
    });
}

std::optional<std::string> ReportExporter::export_defect_drawing() const {
    return render(defect_drawing_template_stem, "defect_drawing", {
        {"__TITLE__", "하자도면"},
        {"__SUB_HEADER__", "[" + part_.name + " " + subpart_.name + "]"},
        {"__IMAGE_PATH__", subpart_.image_path},
    });
}

} // namespace report_export
