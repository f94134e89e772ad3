#pragma once

#include <chrono>
#include <optional>

namespace anxious {

// Monotonic event time (CLOCK_MONOTONIC, as stamped by the kernel).
using Timestamp = std::chrono::microseconds;

// Up is a positive wheel value (REL_WHEEL up, REL_HWHEEL right).
enum class Direction { None, Up, Down };

const char* direction_name(Direction d);

// Tuning constants, pending empirical tuning.
constexpr std::chrono::milliseconds DECAY_WINDOW{250};
constexpr std::chrono::milliseconds MIN_INTERVAL{1};
constexpr double SMOOTHING = 0.4;

// One wheel detent in high-resolution units (REL_WHEEL_HI_RES convention).
constexpr int HI_RES_PER_NOTCH = 120;

struct VelocityState {
    std::optional<Timestamp> last_event_time;
    Direction last_direction = Direction::None;
    double smoothed_velocity = 0.0;
};

// Smoothed estimate of how fast same-direction ticks arrive, in
// high-resolution wheel units per millisecond.
class VelocityTracker {
public:
    // Feeds one tick worth `ticks` units and returns the updated velocity.
    // A first tick, an idle gap longer than DECAY_WINDOW, a timestamp that
    // goes backwards or a direction reversal all restart from zero.
    double observe(Direction direction, Timestamp now, double ticks = 1.0);

    // Forget timing so the next tick starts a new gesture.
    void reset();

    // True when the last observe() restarted the gesture.
    bool restarted() const { return restarted_; }

    const VelocityState& state() const { return state_; }

private:
    VelocityState state_;
    bool restarted_ = false;
};

}  // namespace anxious
