#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace inspection_model {

// Key of the inspection synthesized when migrating files that predate inspections.
inline constexpr std::string_view default_inspection_key = "DEFAULT";

struct BuildingInfo {
    std::string name;
    std::string address;
    std::string location;
    std::string memo;
    std::vector<std::string> photos;
};

struct Inspection {
    std::string name;
    std::string start_date;
    std::optional<std::string> end_date;
    // {internal_id: mark record}
    nlohmann::json defects = nlohmann::json::object();
};

struct SubPart {
    std::string id;
    std::string name;
    std::string image_path;
    std::map<std::string, Inspection> inspections;
};

struct Part {
    std::string id;
    std::string name;
    std::vector<SubPart> subparts;
};

struct Project {
    std::string id;
    BuildingInfo building;
    std::vector<Part> parts;

    static Project create_empty();
};

// project id -> project file path
using ProjectIndex = std::map<std::string, std::string>;

// prefix + "_" + 10 random hex digits, e.g. "part_3f09a1c2be".
std::string new_id(std::string_view prefix);

} // namespace inspection_model
