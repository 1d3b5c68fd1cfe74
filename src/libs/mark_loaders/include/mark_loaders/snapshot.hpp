#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace mark_loaders {

constexpr int snapshot_version = 1;

// {"image": path, "items": [...], "memos": [...], "__version__": 1}
nlohmann::json make_snapshot(const std::string& image_path,
    nlohmann::json items, nlohmann::json memos);

std::string snapshot_image(const nlohmann::json& snapshot);
// Array members; anything else reads as empty.
nlohmann::json snapshot_items(const nlohmann::json& snapshot);
nlohmann::json snapshot_memos(const nlohmann::json& snapshot);
// Snapshots without a version tag predate versioning and read as 0.
int read_snapshot_version(const nlohmann::json& snapshot);

} // namespace mark_loaders
