#pragma once

#include "config.hpp"

namespace anxious {

// Exponent arguments below this are treated as exp() == 0.
constexpr double MAX_EXPONENT = 80.0;

// Logistic sensitivity curve:
//   f(v) = max / (1 + C * e^(-ramp_rate * v)),  C = max / base - 1
// so f(0) == base and f(v) approaches max as v grows.
class CurveEvaluator {
public:
    explicit CurveEvaluator(const Config& config);

    double evaluate(double velocity) const;

    double base() const { return base_; }
    double max() const { return max_; }

private:
    double base_;
    double max_;
    double ramp_rate_;
    double c_;
};

}  // namespace anxious
