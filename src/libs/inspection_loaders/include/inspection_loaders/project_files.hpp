#pragma once

#include <inspection_model/project.hpp>
#include <nlohmann/json.hpp>
#include <istream>
#include <optional>
#include <string>

namespace inspection_loaders {

// Parses a project document. Files written before inspections existed are
// migrated in memory: their defect sets land in a "DEFAULT" inspection.
std::optional<inspection_model::Project> project_from_json(const nlohmann::json& j);
nlohmann::json project_to_json(const inspection_model::Project& project);

std::optional<inspection_model::Project> load_project(std::istream& in);
std::optional<inspection_model::Project> load_project(const std::string& path);
// Pretty-printed, parent directories created on demand.
bool save_project(const inspection_model::Project& project, const std::string& path);

// Missing index file reads as an empty index.
std::optional<inspection_model::ProjectIndex> load_index(const std::string& path);
bool save_index(const inspection_model::ProjectIndex& index, const std::string& path);

} // namespace inspection_loaders
