#include "transform.hpp"

#include <cmath>
#include <limits>

namespace anxious {

TransformStage::TransformStage(const Config& config, int units_per_notch)
    : curve_(config), tick_scale_(static_cast<double>(HI_RES_PER_NOTCH) / units_per_notch) {}

int TransformStage::transform(int raw_delta, Timestamp now) {
    Direction direction = raw_delta > 0 ? Direction::Up : Direction::Down;
    Direction previous = tracker_.state().last_direction;
    if (previous != Direction::None && previous != direction) carry_ = 0.0;

    double velocity = tracker_.observe(direction, now, std::fabs(static_cast<double>(raw_delta)) * tick_scale_);
    double multiplier = curve_.evaluate(velocity);
    double scaled = raw_delta * multiplier + carry_;

    constexpr double limit = std::numeric_limits<int>::max();
    double truncated = std::trunc(scaled);
    if (truncated > limit) truncated = limit;
    if (truncated < -limit) truncated = -limit;

    int output = static_cast<int>(truncated);
    carry_ = scaled - truncated;
    // Saturation above only happens for absurd deltas; keep the carry bounded.
    if (std::fabs(carry_) >= 1.0) carry_ = 0.0;

    last_ = Decision{raw_delta, output, velocity, multiplier, carry_, tracker_.restarted()};
    return output;
}

void TransformStage::reset() {
    tracker_.reset();
    carry_ = 0.0;
}

}  // namespace anxious
