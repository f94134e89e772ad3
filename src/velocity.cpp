#include "velocity.hpp"

#include <algorithm>
#include <cmath>

namespace anxious {

const char* direction_name(Direction d) {
    switch (d) {
        case Direction::Up:
            return "up";
        case Direction::Down:
            return "down";
        default:
            return "none";
    }
}

double VelocityTracker::observe(Direction direction, Timestamp now, double ticks) {
    const auto& last = state_.last_event_time;
    bool idle = !last || now < *last || now - *last > DECAY_WINDOW;
    bool reversed = state_.last_direction != Direction::None && direction != state_.last_direction;

    restarted_ = idle || reversed;
    if (restarted_) {
        state_.smoothed_velocity = 0.0;
    } else {
        auto dt = std::max<Timestamp>(now - *last, MIN_INTERVAL);
        double dt_ms = std::chrono::duration<double, std::milli>(dt).count();
        double sample = std::fabs(ticks) / dt_ms;
        double v = SMOOTHING * sample + (1.0 - SMOOTHING) * state_.smoothed_velocity;
        state_.smoothed_velocity = std::isfinite(v) ? v : 0.0;
    }

    state_.last_event_time = now;
    state_.last_direction = direction;
    return state_.smoothed_velocity;
}

void VelocityTracker::reset() {
    state_ = VelocityState{};
    restarted_ = false;
}

}  // namespace anxious
