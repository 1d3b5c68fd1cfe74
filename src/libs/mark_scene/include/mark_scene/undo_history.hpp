#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <functional>
#include <vector>

namespace mark_scene {

// Linear snapshot history. The bottom entry is the baseline and is never undone.
class UndoHistory {
public:
    using Capture = std::function<nlohmann::json()>;
    using Restore = std::function<void(const nlohmann::json&)>;

    UndoHistory(Capture capture, Restore restore);

    // Drops both stacks and makes `baseline` the only entry.
    void reset(nlohmann::json baseline);

    void begin_edit();
    // Pushes the captured state when it differs from the top. Returns true on push.
    bool end_edit();
    // Closes the session without capturing.
    void abort_edit();

    bool undo();
    bool redo();

    bool can_undo() const { return undo_.size() >= 2; }
    bool can_redo() const { return !redo_.empty(); }
    bool is_editing() const { return editing_; }
    bool is_replaying() const { return replaying_; }
    std::size_t undo_depth() const { return undo_.size(); }
    std::size_t redo_depth() const { return redo_.size(); }

private:
    void replay(const nlohmann::json& snapshot);

    Capture capture_;
    Restore restore_;
    std::vector<nlohmann::json> undo_;
    std::vector<nlohmann::json> redo_;
    bool editing_ = false;
    bool replaying_ = false;
};

} // namespace mark_scene
