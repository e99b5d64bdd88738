#ifndef TRANCHEVAULT_COLLATERAL_HPP
#define TRANCHEVAULT_COLLATERAL_HPP

#include <array>
#include <cstdint>
#include <map>
#include <string>
#include "fixed_point.hpp"
#include "rate_model.hpp"

namespace tranchevault {

// Identifies one piece of non-fungible collateral: its class (collection)
// and the token within that class
struct CollateralRef {
    std::string collateral_class;
    std::string token_id;

    bool operator==(const CollateralRef& other) const;
    bool operator<(const CollateralRef& other) const;
};

// Index into CollateralRiskParameters::weights
enum class RateComponent : uint8_t {
    Utilization = 0,
    LoanToValue = 1,
    Duration = 2
};

// Per collateral class pricing parameters. Weights are integer percentages
// for (utilization, loan-to-value, duration) and must sum to 100.
struct CollateralRiskParameters {
    static constexpr uint32_t WEIGHT_TOTAL = 100;

    bool enabled;
    RateModel loan_to_value_model;
    RateModel duration_model;
    std::array<uint32_t, 3> weights;

    CollateralRiskParameters();
    CollateralRiskParameters(bool enabled, const RateModel& ltv_model,
                             const RateModel& duration_model,
                             const std::array<uint32_t, 3>& weights);

    // Throws InputValidationError(PARAMETER_OUT_OF_RANGE) on a bad weight sum
    void validate() const;

    uint32_t weight(RateComponent component) const {
        return weights[static_cast<size_t>(component)];
    }

    bool operator==(const CollateralRiskParameters& other) const;
};

// Source of collateral valuations
class ICollateralOracle {
public:
    virtual ~ICollateralOracle() = default;

    // Value of one unit of the collateral class; throws
    // EconomicPreconditionError(UNSUPPORTED_COLLATERAL) for unknown classes
    virtual Amount collateral_value(const CollateralRef& collateral) const = 0;
};

// Fixed per-class valuations set by an administrator
class StaticCollateralOracle : public ICollateralOracle {
public:
    void set_collateral_value(const std::string& collateral_class, const Amount& value);
    void remove_collateral_value(const std::string& collateral_class);

    Amount collateral_value(const CollateralRef& collateral) const override;

    size_t size() const { return values_.size(); }

private:
    std::map<std::string, Amount> values_;
};

} // namespace tranchevault

#endif // TRANCHEVAULT_COLLATERAL_HPP
