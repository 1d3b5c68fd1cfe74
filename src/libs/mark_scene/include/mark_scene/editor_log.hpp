#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace mark_scene {

// File logger at <project root>/logs/editor_latest.log, truncated per run.
// Falls back to the default logger when the file cannot be opened.
std::shared_ptr<spdlog::logger> editor_logger();

} // namespace mark_scene
