#include "collateral.hpp"
#include "vault_error.hpp"
#include <numeric>
#include <tuple>

namespace tranchevault {

// ============================================================================
// CollateralRef
// ============================================================================

bool CollateralRef::operator==(const CollateralRef& other) const {
    return collateral_class == other.collateral_class && token_id == other.token_id;
}

bool CollateralRef::operator<(const CollateralRef& other) const {
    return std::tie(collateral_class, token_id) < std::tie(other.collateral_class, other.token_id);
}

// ============================================================================
// CollateralRiskParameters
// ============================================================================

CollateralRiskParameters::CollateralRiskParameters()
    : enabled(false), weights{{0, 0, 0}} {}

CollateralRiskParameters::CollateralRiskParameters(bool enabled_, const RateModel& ltv_model,
                                                   const RateModel& duration_model_,
                                                   const std::array<uint32_t, 3>& weights_)
    : enabled(enabled_), loan_to_value_model(ltv_model),
      duration_model(duration_model_), weights(weights_) {}

void CollateralRiskParameters::validate() const {
    uint64_t total = std::accumulate(weights.begin(), weights.end(), uint64_t(0));
    if (total != WEIGHT_TOTAL) {
        throw InputValidationError(ErrorCode::PARAMETER_OUT_OF_RANGE,
            "Rate component weights sum to " + std::to_string(total) + ", expected 100");
    }
}

bool CollateralRiskParameters::operator==(const CollateralRiskParameters& other) const {
    return enabled == other.enabled &&
           loan_to_value_model == other.loan_to_value_model &&
           duration_model == other.duration_model &&
           weights == other.weights;
}

// ============================================================================
// StaticCollateralOracle
// ============================================================================

void StaticCollateralOracle::set_collateral_value(const std::string& collateral_class,
                                                  const Amount& value) {
    if (collateral_class.empty()) {
        throw InputValidationError(ErrorCode::PARAMETER_OUT_OF_RANGE,
            "Collateral class must not be empty");
    }
    values_[collateral_class] = value;
}

void StaticCollateralOracle::remove_collateral_value(const std::string& collateral_class) {
    values_.erase(collateral_class);
}

Amount StaticCollateralOracle::collateral_value(const CollateralRef& collateral) const {
    auto it = values_.find(collateral.collateral_class);
    if (it == values_.end()) {
        throw EconomicPreconditionError(ErrorCode::UNSUPPORTED_COLLATERAL,
            "No collateral value for " + collateral.collateral_class);
    }
    return it->second;
}

} // namespace tranchevault
