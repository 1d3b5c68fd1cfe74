#pragma once

#include <report_export/template_render.hpp>
#include <inspection_model/project.hpp>
#include <optional>
#include <string>

namespace report_export {

inline constexpr const char* visual_inspection_template_stem = "visual_inspection_template";
inline constexpr const char* defect_drawing_template_stem = "defect_drawing_template";

// Fills the report templates found in `template_dir` for one sub-part and writes
// the results to `output_dir`. Returned paths name the written files.
class ReportExporter {
public:
    ReportExporter(const inspection_model::Project& project, const inspection_model::Part& part,
        const inspection_model::SubPart& subpart, std::string output_dir, std::string template_dir);

    // Defect table of the most recent inspection.
    std::optional<std::string> export_visual_inspection() const;
    // Floor-plan drawing page.
    std::optional<std::string> export_defect_drawing() const;

    // "<building>-<part>-<subpart>", with placeholders for unnamed levels.
    std::string base_filename() const;

private:
    std::optional<std::string> find_template(const char* stem) const;
    std::optional<std::string> render(const char* stem, const std::string& suffix,
        const Replacements& values) const;

    const inspection_model::Project& project_;
    const inspection_model::Part& part_;
    const inspection_model::SubPart& subpart_;
    std::string output_dir_;
    std::string template_dir_;
};

} // namespace report_export
