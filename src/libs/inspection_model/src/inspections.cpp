#include <inspection_model/inspections.hpp>
#include <algorithm>
#include <tuple>
#include <utility>

namespace inspection_model {

void normalize_subpart_inspections(SubPart& sp) {
    for (auto& [key, insp] : sp.inspections) {
        if (!insp.defects.is_object()) insp.defects = nlohmann::json::object();
    }
}

Inspection& ensure_inspection(SubPart& sp, const std::string& key) {
    auto [it, inserted] = sp.inspections.try_emplace(key);
    normalize_subpart_inspections(sp);
    return it->second;
}

std::vector<std::string> list_inspections(const SubPart& sp) {
    std::vector<std::string> keys;
    keys.reserve(sp.inspections.size());
    for (const auto& [key, insp] : sp.inspections) keys.push_back(key);
    return keys;
}

nlohmann::json& get_defects(SubPart& sp, const std::string& key) {
    return ensure_inspection(sp, key).defects;
}

void set_defects(SubPart& sp, const std::string& key, nlohmann::json defects) {
    Inspection& insp = ensure_inspection(sp, key);
    insp.defects = defects.is_object() ? std::move(defects) : nlohmann::json::object();
}

bool copy_inspection(SubPart& sp, const std::string& src, const std::string& dst) {
    ensure_inspection(sp, src);
    if (sp.inspections.count(dst)) return false;
    sp.inspections[dst] = sp.inspections[src];
    return true;
}

std::optional<std::string> latest_inspection_key(const SubPart& sp) {
    if (sp.inspections.empty()) return std::nullopt;
    auto latest = std::max_element(sp.inspections.begin(), sp.inspections.end(),
        [](const auto& a, const auto& b) {
            return std::tie(a.second.start_date, a.first) < std::tie(b.second.start_date, b.first);
        });
    return latest->first;
}

std::string inspection_title(const SubPart& sp, const std::string& key) {
    auto it = sp.inspections.find(key);
    if (it == sp.inspections.end() || it->second.name.empty()) return key;
    return it->second.name;
}

} // namespace inspection_model
