#include "rate_model.hpp"
#include "vault_error.hpp"

namespace tranchevault {

using fixed_point::div;
using fixed_point::mul;
using fixed_point::to_decimal;

RateModel::RateModel()
    : offset_(0), slope1_(0), slope2_(0), kink_(0), max_(0) {}

RateModel::RateModel(const Amount& offset, const Amount& slope1, const Amount& slope2,
                     const Amount& kink, const Amount& max)
    : offset_(offset), slope1_(slope1), slope2_(slope2), kink_(kink), max_(max) {
    if (kink_ > max_) {
        throw InputValidationError(ErrorCode::PARAMETER_OUT_OF_RANGE,
            "Rate model kink " + to_decimal(kink_) + " exceeds max " + to_decimal(max_));
    }
}

RateModel RateModel::from_target_rates(const Amount& min_rate, const Amount& target_rate,
                                       const Amount& max_rate, const Amount& kink,
                                       const Amount& max) {
    if (min_rate > target_rate || target_rate > max_rate) {
        throw InputValidationError(ErrorCode::PARAMETER_OUT_OF_RANGE,
            "Rate model rates must satisfy min <= target <= max");
    }
    if (kink > max) {
        throw InputValidationError(ErrorCode::PARAMETER_OUT_OF_RANGE,
            "Rate model kink " + to_decimal(kink) + " exceeds max " + to_decimal(max));
    }

    // A degenerate segment has no slope
    Amount slope1 = kink == 0 ? Amount(0) : div(target_rate - min_rate, kink);
    Amount slope2 = max == kink ? Amount(0) : div(max_rate - target_rate, max - kink);

    return RateModel(min_rate, slope1, slope2, kink, max);
}

Amount RateModel::evaluate(const Amount& x) const {
    if (x > max_) {
        throw InputValidationError(ErrorCode::PARAMETER_OUT_OF_RANGE,
            "Rate model input " + to_decimal(x) + " exceeds max " + to_decimal(max_));
    }

    if (x <= kink_) {
        return offset_ + mul(slope1_, x);
    }
    return offset_ + mul(slope1_, kink_) + mul(slope2_, x - kink_);
}

bool RateModel::operator==(const RateModel& other) const {
    return offset_ == other.offset_ &&
           slope1_ == other.slope1_ &&
           slope2_ == other.slope2_ &&
           kink_ == other.kink_ &&
           max_ == other.max_;
}

} // namespace tranchevault
