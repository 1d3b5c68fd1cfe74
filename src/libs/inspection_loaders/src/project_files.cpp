#include <inspection_loaders/project_files.hpp>
#include <inspection_model/inspections.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <string_view>

namespace inspection_loaders {

using inspection_model::BuildingInfo;
using inspection_model::Inspection;
using inspection_model::Part;
using inspection_model::Project;
using inspection_model::SubPart;

namespace {

std::shared_ptr<spdlog::logger> loader_log() {
    auto logger = spdlog::get("editor");
    return logger ? logger : spdlog::default_logger();
}

std::string str_or(const nlohmann::json& j, const char* key, std::string fallback = {}) {
    return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : fallback;
}

// Missing or blank ids are replaced with fresh ones.
std::string id_or_new(const nlohmann::json& j, std::string_view prefix) {
    std::string id = str_or(j, "id");
    return id.empty() ? inspection_model::new_id(prefix) : id;
}

nlohmann::json object_or_empty(const nlohmann::json& j, const char* key) {
    return j.contains(key) && j[key].is_object() ? j[key] : nlohmann::json::object();
}

Inspection parse_inspection(const nlohmann::json& v) {
    Inspection insp;
    // Early files stored the defect set directly under the inspection key.
    if (!v.is_object() || !v.contains("defects")) {
        insp.defects = v.is_object() ? v : nlohmann::json::object();
        return insp;
    }
    insp.name = str_or(v, "name");
    insp.start_date = str_or(v, "start_date");
    if (v.contains("end_date") && v["end_date"].is_string())
        insp.end_date = v["end_date"].get<std::string>();
    insp.defects = object_or_empty(v, "defects");
    return insp;
}

SubPart parse_subpart(const nlohmann::json& s) {
    SubPart sp;
    sp.id = id_or_new(s, "subpart");
    sp.name = str_or(s, "name");
    sp.image_path = str_or(s, "image_path");
    if (s.contains("inspections") && s["inspections"].is_object()) {
        const auto& inspections = s["inspections"];
        for (auto it = inspections.begin(); it != inspections.end(); ++it)
            sp.inspections[it.key()] = parse_inspection(it.value());
    }
    if (sp.inspections.empty() && s.contains("defects") && !s["defects"].is_null()) {
        loader_log()->info("project_migrate legacy_subpart id={}", sp.id);
        Inspection& insp = sp.inspections[std::string(inspection_model::default_inspection_key)];
        insp.defects = object_or_empty(s, "defects");
    }
    inspection_model::normalize_subpart_inspections(sp);
    return sp;
}

Part parse_part(const nlohmann::json& p) {
    Part part;
    part.id = id_or_new(p, "part");
    part.name = str_or(p, "name");
    if (p.contains("subparts") && p["subparts"].is_array()) {
        for (const auto& s : p["subparts"]) {
            if (s.is_object()) part.subparts.push_back(parse_subpart(s));
        }
        return part;
    }

    // Single-level part: the part itself carried the drawing.
    loader_log()->info("project_migrate legacy_part id={}", part.id);
    SubPart sp;
    sp.id = inspection_model::new_id("subpart");
    sp.name = part.name;
    sp.image_path = str_or(p, "image_path");
    sp.inspections[std::string(inspection_model::default_inspection_key)].defects =
        object_or_empty(p, "defects");
    part.subparts.push_back(std::move(sp));
    return part;
}

BuildingInfo parse_building(const nlohmann::json& b) {
    BuildingInfo info;
    if (!b.is_object()) return info;
    info.name = str_or(b, "name");
    info.address = str_or(b, "address");
    info.location = str_or(b, "location");
    info.memo = str_or(b, "memo");
    if (b.contains("photos") && b["photos"].is_array()) {
        for (const auto& ph : b["photos"])
            if (ph.is_string()) info.photos.push_back(ph.get<std::string>());
    }
    return info;
}

nlohmann::json inspection_to_json(const Inspection& insp) {
    nlohmann::json j;
    j["name"] = insp.name;
    j["start_date"] = insp.start_date;
    j["end_date"] = insp.end_date ? nlohmann::json(*insp.end_date) : nlohmann::json(nullptr);
    j["defects"] = insp.defects.is_object() ? insp.defects : nlohmann::json::object();
    return j;
}

// Invalid UTF-8 in stored text is replaced rather than thrown on.
std::string dump_pretty(const nlohmann::json& j) {
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

// Writes beside `path` first and renames over it, so a failed write leaves
// the previous file in place.
bool write_text_file(const std::string& path, const std::string& text, std::string_view what) {
    namespace fs = std::filesystem;
    std::error_code ec;
    const fs::path target(path);
    if (target.has_parent_path()) fs::create_directories(target.parent_path(), ec);
    if (ec) {
        loader_log()->error("{} mkdir_failed path={} err={}", what, path, ec.message());
        return false;
    }

    fs::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f) {
            loader_log()->error("{} open_failed path={}", what, tmp.string());
            return false;
        }
        f << text;
        f.flush();
        if (!f) {
            loader_log()->error("{} write_failed path={}", what, tmp.string());
            f.close();
            fs::remove(tmp, ec);
            return false;
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        loader_log()->error("{} rename_failed path={} err={}", what, path, ec.message());
        std::error_code cleanup;
        fs::remove(tmp, cleanup);
        return false;
    }
    return true;
}

} // namespace

std::optional<Project> project_from_json(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    Project project;
    project.id = id_or_new(j, "proj");
    if (j.contains("building")) project.building = parse_building(j["building"]);
    if (j.contains("parts") && j["parts"].is_array()) {
        for (const auto& p : j["parts"]) {
            if (p.is_object()) project.parts.push_back(parse_part(p));
        }
    }
    return project;
}

nlohmann::json project_to_json(const Project& project) {
    nlohmann::json j;
    j["id"] = project.id;
    j["building"] = {
        {"name", project.building.name},
        {"address", project.building.address},
        {"location", project.building.location},
        {"memo", project.building.memo},
        {"photos", project.building.photos},
    };
    nlohmann::json parts = nlohmann::json::array();
    for (const auto& part : project.parts) {
        nlohmann::json subparts = nlohmann::json::array();
        for (const auto& sp : part.subparts) {
            nlohmann::json inspections = nlohmann::json::object();
            for (const auto& [key, insp] : sp.inspections)
                inspections[key] = inspection_to_json(insp);
            subparts.push_back({
                {"id", sp.id},
                {"name", sp.name},
                {"image_path", sp.image_path},
                {"inspections", std::move(inspections)},
            });
        }
        parts.push_back({{"id", part.id}, {"name", part.name}, {"subparts", std::move(subparts)}});
    }
    j["parts"] = std::move(parts);
    return j;
}

std::optional<Project> load_project(std::istream& in) {
    try {
        return project_from_json(nlohmann::json::parse(in));
    } catch (const nlohmann::json::exception& e) {
        loader_log()->error("project_load parse_error what={}", e.what());
        return std::nullopt;
    }
}

std::optional<Project> load_project(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        loader_log()->error("project_load open_failed path={}", path);
        return std::nullopt;
    }
    auto project = load_project(f);
    if (project) loader_log()->info("project_load ok path={} parts={}", path, project->parts.size());
    return project;
}

bool save_project(const Project& project, const std::string& path) {
    if (!write_text_file(path, dump_pretty(project_to_json(project)), "project_save")) return false;
    loader_log()->info("project_save ok path={}", path);
    return true;
}

std::optional<inspection_model::ProjectIndex> load_index(const std::string& path) {
    inspection_model::ProjectIndex index;
    std::ifstream f(path);
    if (!f) return index;
    try {
        const nlohmann::json j = nlohmann::json::parse(f);
        if (!j.is_object()) return std::nullopt;
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (it.value().is_string()) index[it.key()] = it.value().get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        loader_log()->error("index_load parse_error path={} what={}", path, e.what());
        return std::nullopt;
    }
    return index;
}

bool save_index(const inspection_model::ProjectIndex& index, const std::string& path) {
    return write_text_file(path, dump_pretty(nlohmann::json(index)), "index_save");
}

} // namespace inspection_loaders
