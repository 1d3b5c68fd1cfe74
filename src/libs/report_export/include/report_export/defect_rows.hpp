#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace report_export {

struct DefectRow {
    int number = 0;
    std::string location;
    std::string member;
    std::string defect_type;
    double width_mm = 0;
    double length_m = 0;
    int count = 1;
    std::string progress = "X"; // "O" or "X"
    std::string note;
};

// One row per record of a stored defect set, numbered from 1 in key order.
// Records carry their fields under "defect_info"; flat records are read too.
std::vector<DefectRow> extract_defect_rows(const nlohmann::json& defects);

// {"columns": [...], "rows": [{column: value}, ...]}
nlohmann::json rows_to_table_json(const std::vector<DefectRow>& rows);

} // namespace report_export
