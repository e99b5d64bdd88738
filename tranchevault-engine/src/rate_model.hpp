#ifndef TRANCHEVAULT_RATE_MODEL_HPP
#define TRANCHEVAULT_RATE_MODEL_HPP

#include "fixed_point.hpp"

namespace tranchevault {

// RateModel: piecewise-linear curve mapping a normalized risk factor x to a rate
//   rate(x) = offset + slope1 * min(x, kink) + slope2 * max(0, x - kink)
// Inputs above max are rejected.
class RateModel {
public:
    RateModel();
    RateModel(const Amount& offset, const Amount& slope1, const Amount& slope2,
              const Amount& kink, const Amount& max);

    // Build from the rates observed at 0, at the kink and at max
    static RateModel from_target_rates(const Amount& min_rate, const Amount& target_rate,
                                       const Amount& max_rate, const Amount& kink,
                                       const Amount& max);

    // Throws InputValidationError(PARAMETER_OUT_OF_RANGE) when x > max
    Amount evaluate(const Amount& x) const;

    const Amount& offset() const { return offset_; }
    const Amount& slope1() const { return slope1_; }
    const Amount& slope2() const { return slope2_; }
    const Amount& kink() const { return kink_; }
    const Amount& max() const { return max_; }

    bool operator==(const RateModel& other) const;
    bool operator!=(const RateModel& other) const { return !(*this == other); }

private:
    Amount offset_;
    Amount slope1_;
    Amount slope2_;
    Amount kink_;
    Amount max_;
};

} // namespace tranchevault

#endif // TRANCHEVAULT_RATE_MODEL_HPP
