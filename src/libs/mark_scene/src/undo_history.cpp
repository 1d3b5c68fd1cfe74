#include <mark_scene/undo_history.hpp>
#include <utility>

namespace mark_scene {

UndoHistory::UndoHistory(Capture capture, Restore restore)
    : capture_(std::move(capture))
    , restore_(std::move(restore))
{
}

void UndoHistory::reset(nlohmann::json baseline) {
    undo_.clear();
    redo_.clear();
    undo_.push_back(std::move(baseline));
    editing_ = false;
}

void UndoHistory::begin_edit() {
    if (replaying_) return;
    editing_ = true;
}

bool UndoHistory::end_edit() {
    if (replaying_ || !editing_) return false;
    editing_ = false;

    nlohmann::json snapshot = capture_();
    if (!undo_.empty() && undo_.back() == snapshot) return false;
    undo_.push_back(std::move(snapshot));
    redo_.clear();
    return true;
}

void UndoHistory::abort_edit() {
    if (replaying_) return;
    editing_ = false;
}

bool UndoHistory::undo() {
    if (undo_.size() < 2) return false;
    redo_.push_back(std::move(undo_.back()));
    undo_.pop_back();
    replay(undo_.back());
    return true;
}

bool UndoHistory::redo() {
    if (redo_.empty()) return false;
    undo_.push_back(std::move(redo_.back()));
    redo_.pop_back();
    replay(undo_.back());
    return true;
}

void UndoHistory::replay(const nlohmann::json& snapshot) {
    replaying_ = true;
    editing_ = false;
    restore_(snapshot);
    replaying_ = false;
}

} // namespace mark_scene
