#pragma once

#include <chrono>
#include <optional>

namespace mark_scene {

using Clock = std::chrono::steady_clock;

// Single-shot deadline polled from the event loop. Starting an active timer
// moves its deadline.
class DeadlineTimer {
public:
    void start(Clock::time_point now, Clock::duration delay) { deadline_ = now + delay; }
    void stop() { deadline_.reset(); }
    bool is_active() const { return deadline_.has_value(); }

    // True once when the deadline has passed; the timer stops itself.
    bool fire_if_due(Clock::time_point now) {
        if (!deadline_ || now < *deadline_) return false;
        deadline_.reset();
        return true;
    }

private:
    std::optional<Clock::time_point> deadline_;
};

} // namespace mark_scene
