#include <inspection_model/project_edit.hpp>
#include <algorithm>
#include <utility>

namespace inspection_model {

namespace {

std::string trimmed(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(first, last - first + 1));
}

std::string fresh_inspection_key(const SubPart& sp) {
    std::string key = new_id("insp");
    while (sp.inspections.count(key)) key = new_id("insp");
    return key;
}

Inspection from_fields(const InspectionFields& fields) {
    Inspection insp;
    insp.name = trimmed(fields.name);
    insp.start_date = trimmed(fields.start_date);
    if (fields.end_date && !trimmed(*fields.end_date).empty())
        insp.end_date = trimmed(*fields.end_date);
    return insp;
}

} // namespace

bool is_valid(const InspectionFields& fields) {
    return !trimmed(fields.name).empty() && !trimmed(fields.start_date).empty();
}

Part* find_part(Project& project, const std::string& id) {
    auto it = std::find_if(project.parts.begin(), project.parts.end(),
        [&](const Part& p) { return p.id == id; });
    return it == project.parts.end() ? nullptr : &*it;
}

SubPart* find_subpart(Part& part, const std::string& id) {
    auto it = std::find_if(part.subparts.begin(), part.subparts.end(),
        [&](const SubPart& sp) { return sp.id == id; });
    return it == part.subparts.end() ? nullptr : &*it;
}

Part* add_part(Project& project, std::string_view name) {
    std::string clean = trimmed(name);
    if (clean.empty()) return nullptr;
    Part part;
    part.id = new_id("part");
    part.name = std::move(clean);
    project.parts.push_back(std::move(part));
    return &project.parts.back();
}

bool rename_part(Project& project, const std::string& id, std::string_view name) {
    std::string clean = trimmed(name);
    Part* part = find_part(project, id);
    if (!part || clean.empty()) return false;
    part->name = std::move(clean);
    return true;
}

bool remove_part(Project& project, const std::string& id) {
    const auto before = project.parts.size();
    std::erase_if(project.parts, [&](const Part& p) { return p.id == id; });
    return project.parts.size() != before;
}

SubPart* add_subpart(Part& part, std::string_view name, std::string image_path) {
    std::string clean = trimmed(name);
    if (clean.empty() || image_path.empty()) return nullptr;
    SubPart sp;
    sp.id = new_id("subpart");
    sp.name = std::move(clean);
    sp.image_path = std::move(image_path);
    part.subparts.push_back(std::move(sp));
    return &part.subparts.back();
}

bool rename_subpart(Part& part, const std::string& id, std::string_view name) {
    std::string clean = trimmed(name);
    SubPart* sp = find_subpart(part, id);
    if (!sp || clean.empty()) return false;
    sp->name = std::move(clean);
    return true;
}

bool remove_subpart(Part& part, const std::string& id) {
    const auto before = part.subparts.size();
    std::erase_if(part.subparts, [&](const SubPart& sp) { return sp.id == id; });
    return part.subparts.size() != before;
}

std::optional<std::string> add_inspection(SubPart& sp, const InspectionFields& fields) {
    if (!is_valid(fields)) return std::nullopt;
    const std::string key = fresh_inspection_key(sp);
    sp.inspections[key] = from_fields(fields);
    return key;
}

std::optional<std::string> duplicate_inspection(SubPart& sp, const std::string& src,
    const InspectionFields& fields)
{
    if (!is_valid(fields)) return std::nullopt;
    auto it = sp.inspections.find(src);
    if (it == sp.inspections.end()) return std::nullopt;

    Inspection copy = from_fields(fields);
    copy.defects = it->second.defects;
    const std::string key = fresh_inspection_key(sp);
    sp.inspections[key] = std::move(copy);
    return key;
}

bool update_inspection(SubPart& sp, const std::string& key, const InspectionFields& fields) {
    if (!is_valid(fields)) return false;
    auto it = sp.inspections.find(key);
    if (it == sp.inspections.end()) return false;
    Inspection updated = from_fields(fields);
    it->second.name = std::move(updated.name);
    it->second.start_date = std::move(updated.start_date);
    it->second.end_date = std::move(updated.end_date);
    return true;
}

bool remove_inspection(SubPart& sp, const std::string& key) {
    return sp.inspections.erase(key) > 0;
}

} // namespace inspection_model
