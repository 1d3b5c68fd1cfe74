#pragma once

#include <inspection_model/project.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace inspection_model {

struct InspectionFields {
    std::string name;
    std::string start_date;
    std::optional<std::string> end_date;
};

// Name and start date are mandatory.
bool is_valid(const InspectionFields& fields);

Part* find_part(Project& project, const std::string& id);
SubPart* find_subpart(Part& part, const std::string& id);

// Blank names are rejected (nullptr / false).
Part* add_part(Project& project, std::string_view name);
bool rename_part(Project& project, const std::string& id, std::string_view name);
bool remove_part(Project& project, const std::string& id);

SubPart* add_subpart(Part& part, std::string_view name, std::string image_path);
bool rename_subpart(Part& part, const std::string& id, std::string_view name);
bool remove_subpart(Part& part, const std::string& id);

// Returns the new inspection key.
std::optional<std::string> add_inspection(SubPart& sp, const InspectionFields& fields);
// New inspection with `fields` and a copy of `src`'s defects.
std::optional<std::string> duplicate_inspection(SubPart& sp, const std::string& src,
    const InspectionFields& fields);
bool update_inspection(SubPart& sp, const std::string& key, const InspectionFields& fields);
bool remove_inspection(SubPart& sp, const std::string& key);

} // namespace inspection_model
