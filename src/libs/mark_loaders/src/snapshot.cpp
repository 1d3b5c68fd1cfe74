#include <mark_loaders/snapshot.hpp>
#include <utility>

namespace mark_loaders {

nlohmann::json make_snapshot(const std::string& image_path,
    nlohmann::json items, nlohmann::json memos)
{
    if (!items.is_array()) items = nlohmann::json::array();
    if (!memos.is_array()) memos = nlohmann::json::array();
    return {
        {"image", image_path},
        {"items", std::move(items)},
        {"memos", std::move(memos)},
        {"__version__", snapshot_version},
    };
}

std::string snapshot_image(const nlohmann::json& snapshot) {
    if (snapshot.is_object() && snapshot.contains("image") && snapshot["image"].is_string())
        return snapshot["image"].get<std::string>();
    return {};
}

nlohmann::json snapshot_items(const nlohmann::json& snapshot) {
    if (snapshot.is_object() && snapshot.contains("items") && snapshot["items"].is_array())
        return snapshot["items"];
    return nlohmann::json::array();
}

nlohmann::json snapshot_memos(const nlohmann::json& snapshot) {
    if (snapshot.is_object() && snapshot.contains("memos") && snapshot["memos"].is_array())
        return snapshot["memos"];
    return nlohmann::json::array();
}

int read_snapshot_version(const nlohmann::json& snapshot) {
    if (snapshot.is_object() && snapshot.contains("__version__") && snapshot["__version__"].is_number_integer())
        return snapshot["__version__"].get<int>();
    return 0;
}

} // namespace mark_loaders
