#pragma once

#include "curve.hpp"
#include "velocity.hpp"

namespace anxious {

// What the last transform() decided, for debug logging.
struct Decision {
    int raw = 0;
    int output = 0;
    double velocity = 0.0;
    double multiplier = 0.0;
    double carry = 0.0;
    bool restarted = false;
};

// Turns one scroll event into an accelerated integer delta. Fractional
// output is carried into the next call instead of being dropped; the carry
// is discarded when the scroll direction reverses.
class TransformStage {
public:
    // units_per_notch: HI_RES_PER_NOTCH for *_HI_RES axes, 1 for legacy ones.
    TransformStage(const Config& config, int units_per_notch);

    // raw_delta must be nonzero. Returns 0 when the scaled motion has not
    // yet reached a whole unit.
    int transform(int raw_delta, Timestamp now);

    // Drops velocity and carry (used after the kernel dropped events).
    void reset();

    const Decision& last() const { return last_; }
    const VelocityTracker& tracker() const { return tracker_; }
    double carry() const { return carry_; }

private:
    CurveEvaluator curve_;
    VelocityTracker tracker_;
    double tick_scale_;
    double carry_ = 0.0;
    Decision last_;
};

}  // namespace anxious
