#pragma once

#include <inspection_model/project.hpp>
#include <optional>
#include <string>
#include <vector>

namespace inspection_model {

// Guarantees every inspection carries an object-valued defect set.
void normalize_subpart_inspections(SubPart& sp);

Inspection& ensure_inspection(SubPart& sp, const std::string& key);
// Keys in ascending order.
std::vector<std::string> list_inspections(const SubPart& sp);

nlohmann::json& get_defects(SubPart& sp, const std::string& key);
void set_defects(SubPart& sp, const std::string& key, nlohmann::json defects);

// Deep copy under a new key. Fails when `dst` already exists.
bool copy_inspection(SubPart& sp, const std::string& src, const std::string& dst);

// Most recent inspection by start date, ties broken by key.
std::optional<std::string> latest_inspection_key(const SubPart& sp);

// Name shown in lists: the inspection name, or its key when unnamed.
std::string inspection_title(const SubPart& sp, const std::string& key);

} // namespace inspection_model
