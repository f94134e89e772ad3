#include "curve.hpp"

#include <algorithm>
#include <cmath>

namespace anxious {

CurveEvaluator::CurveEvaluator(const Config& config)
    : base_(config.base_sensitivity),
      max_(config.max_sensitivity),
      ramp_rate_(config.ramp_rate),
      c_(config.max_sensitivity / config.base_sensitivity - 1.0) {}

double CurveEvaluator::evaluate(double velocity) const {
    // Also catches NaN.
    if (!(velocity > 0.0)) return base_;
    double arg = std::max(-ramp_rate_ * velocity, -MAX_EXPONENT);
    double sens = max_ / (1.0 + c_ * std::exp(arg));
    return std::clamp(sens, base_, max_);
}

}  // namespace anxious
