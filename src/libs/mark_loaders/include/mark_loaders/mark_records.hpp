#pragma once

#include <mark_model/text_measure.hpp>
#include <mark_model/types.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string_view>
#include <utility>

namespace mark_loaders {

// Registry names written into the "type" field of a mark record.
const char* record_type_name(mark_model::MarkKind kind);
std::optional<mark_model::MarkKind> kind_from_type_name(std::string_view name);

nlohmann::json defect_info_to_json(const mark_model::DefectInfo& info);
// Missing fields read as empty; numeric size fields are kept as their text.
mark_model::DefectInfo defect_info_from_json(const nlohmann::json& j);

nlohmann::json mark_to_record(const mark_model::Mark& mark);

// Rebuilds the mark body, ids and defect record. The leader line and label are
// reattached by the caller (see record_line). Unknown types and malformed
// fields yield std::nullopt.
std::optional<mark_model::Mark> mark_from_record(const nlohmann::json& record,
    const mark_model::TextMeasure& measure = mark_model::default_text_measure());

// Persisted leader line endpoints {p1, p2}, p1 being the anchor.
std::optional<std::pair<mark_model::Point, mark_model::Point>> record_line(const nlohmann::json& record);

nlohmann::json memo_to_record(const mark_model::Mark& memo);
std::optional<mark_model::Mark> memo_from_record(const nlohmann::json& record);

} // namespace mark_loaders
