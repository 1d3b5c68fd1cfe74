#include <mark_loaders/defect_set.hpp>
#include <string>
#include <utility>

namespace mark_loaders {

nlohmann::json items_to_defect_map(const nlohmann::json& defects) {
    nlohmann::json out = nlohmann::json::object();
    if (!defects.is_object() || !defects.contains("items") || !defects["items"].is_array())
        return out;

    std::size_t index = 0;
    for (const auto& record : defects["items"]) {
        ++index;
        if (!record.is_object()) continue;
        std::string key;
        if (record.contains("internal_id") && record["internal_id"].is_string())
            key = record["internal_id"].get<std::string>();
        if (key.empty() || out.contains(key))
            key = "item_" + std::to_string(index);
        out[key] = record;
    }
    return out;
}

nlohmann::json defect_map_to_items(const nlohmann::json& stored) {
    nlohmann::json items = nlohmann::json::array();
    if (!stored.is_object()) return {{"items", items}};

    if (stored.contains("items") && stored["items"].is_array()) {
        for (const auto& record : stored["items"]) items.push_back(record);
        return {{"items", items}};
    }

    for (auto it = stored.begin(); it != stored.end(); ++it) {
        if (!it.value().is_object()) continue;
        nlohmann::json copy = it.value();
        if (!copy.contains("internal_id") || !copy["internal_id"].is_string()
            || copy["internal_id"].get<std::string>().empty())
        {
            copy["internal_id"] = it.key();
        }
        items.push_back(std::move(copy));
    }
    return {{"items", items}};
}

} // namespace mark_loaders
