#include <report_export/defect_rows.hpp>
#include <mark_loaders/mark_records.hpp>
#include <cstdlib>

namespace report_export {

namespace {

double parse_number(const std::string& text, double fallback) {
    if (text.empty()) return fallback;
    char* end = nullptr;
    const double v = std::strtod(text.c_str(), &end);
    return end == text.c_str() ? fallback : v;
}

double number_of(const nlohmann::json& j, const char* key, double fallback) {
    if (!j.contains(key)) return fallback;
    const auto& v = j[key];
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) return parse_number(v.get<std::string>(), fallback);
    return fallback;
}

std::string text_of(const nlohmann::json& j, const char* key) {
    return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : std::string{};
}

DefectRow row_from_defect_info(const nlohmann::json& record) {
    const mark_model::DefectInfo info = mark_loaders::defect_info_from_json(record["defect_info"]);
    DefectRow row;
    row.location = info.location;
    row.member = info.member;
    row.defect_type = info.defect_type;
    row.width_mm = parse_number(info.size.width_mm, 0.0);
    row.length_m = parse_number(info.size.length_m, 0.0);
    const int count = static_cast<int>(parse_number(info.size.count_ea, 1.0));
    row.count = count > 0 ? count : 1;
    row.progress = info.progress ? "O" : "X";
    row.note = info.remark;
    return row;
}

DefectRow row_from_flat_record(const nlohmann::json& record) {
    DefectRow row;
    row.location = text_of(record, "location");
    row.member = text_of(record, "member");
    row.defect_type = text_of(record, "type");
    row.width_mm = number_of(record, "width_mm", 0.0);
    row.length_m = number_of(record, "length_m", 0.0);
    const int count = static_cast<int>(number_of(record, "count", 1.0));
    row.count = count > 0 ? count : 1;
    const std::string progress = text_of(record, "progress");
    row.progress = progress == "O" ? "O" : "X";
    row.note = text_of(record, "cause");
    return row;
}

} // namespace

std::vector<DefectRow> extract_defect_rows(const nlohmann::json& defects) {
    std::vector<DefectRow> rows;
    if (!defects.is_object()) return rows;

    int number = 1;
    for (auto it = defects.begin(); it != defects.end(); ++it) {
        const auto& record = it.value();
        if (!record.is_object()) continue;
        DefectRow row = record.contains("defect_info") && record["defect_info"].is_object()
            ? row_from_defect_info(record)
            : row_from_flat_record(record);
        row.number = number++;
        rows.push_back(std::move(row));
    }
    return rows;
}

nlohmann::json rows_to_table_json(const std::vector<DefectRow>& rows) {
    nlohmann::json table;
    table["columns"] = {"번호", "부위", "부재", "유형 및 형상", "폭(mm)", "길이(m)", "개소(EA)",
        "진행(O/X)", "비고"};
    nlohmann::json out = nlohmann::json::array();
    for (const auto& r : rows) {
        out.push_back({
            {"번호", r.number},
            {"부위", r.location},
            {"부재", r.member},
            {"유형 및 형상", r.defect_type},
            {"폭(mm)", r.width_mm},
            {"길이(m)", r.length_m},
            {"개소(EA)", r.count},
            {"진행(O/X)", r.progress},
            {"비고", r.note},
        });
    }
    table["rows"] = std::move(out);
    return table;
}

} // namespace report_export
