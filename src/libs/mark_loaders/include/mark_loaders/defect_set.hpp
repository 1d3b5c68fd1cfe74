#pragma once

#include <nlohmann/json.hpp>

namespace mark_loaders {

// The editor hands out defect sets as {"items": [record, ...]} while project
// files keep them as {internal_id: record}. These convert between the two.

nlohmann::json items_to_defect_map(const nlohmann::json& defects);

// Accepts either stored form and returns {"items": [...]}.
nlohmann::json defect_map_to_items(const nlohmann::json& stored);

} // namespace mark_loaders
