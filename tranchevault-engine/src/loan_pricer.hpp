#ifndef TRANCHEVAULT_LOAN_PRICER_HPP
#define TRANCHEVAULT_LOAN_PRICER_HPP

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include "collateral.hpp"
#include "fixed_point.hpp"
#include "rate_model.hpp"

namespace tranchevault {

// Loan terms to be priced
struct PricingRequest {
    CollateralRef collateral;
    Amount principal;
    Amount repayment;
    uint64_t duration_remaining;  // Seconds until maturity
    Amount utilization;           // Pool utilization, fixed-point fraction

    PricingRequest() : duration_remaining(0) {}
};

// Result of pricing a loan
struct PriceQuote {
    Amount purchase_price;
    Amount discount_rate;                 // Per second, fixed-point
    Amount loan_to_value;
    std::array<Amount, 3> component_rates;  // Indexed by RateComponent
};

// Source of purchase prices consulted by the vault on every purchase
class ILoanPriceOracle {
public:
    virtual ~ILoanPriceOracle() = default;

    virtual PriceQuote quote(const PricingRequest& request) const = 0;
};

// LoanPricer: risk-based discount rate and present-value purchase price.
//
// The discount rate is the weighted average of three RateModel outputs
// (pool utilization, loan-to-value, remaining duration), floored at a global
// minimum. The purchase price discounts the repayment with simple interest
// over the remaining duration. Pricing is pure: it only reads parameters.
class LoanPricer : public ILoanPriceOracle {
public:
    explicit LoanPricer(std::shared_ptr<const ICollateralOracle> oracle);

    // Parameter administration
    void set_utilization_model(const RateModel& model);
    void set_collateral_parameters(const std::string& collateral_class,
                                   const CollateralRiskParameters& parameters);
    void remove_collateral_parameters(const std::string& collateral_class);
    void set_minimum_discount_rate(const Amount& rate);
    void set_minimum_loan_duration(uint64_t seconds);

    const RateModel& utilization_model() const { return utilization_model_; }
    const CollateralRiskParameters* find_collateral_parameters(const std::string& collateral_class) const;
    const std::map<std::string, CollateralRiskParameters>& collateral_parameters() const {
        return collateral_parameters_;
    }
    const Amount& minimum_discount_rate() const { return minimum_discount_rate_; }
    uint64_t minimum_loan_duration() const { return minimum_loan_duration_; }
    const ICollateralOracle& collateral_oracle() const { return *oracle_; }

    // Full pricing breakdown. Throws:
    //   EconomicPreconditionError(INSUFFICIENT_TIME_REMAINING) below the minimum duration
    //   EconomicPreconditionError(UNSUPPORTED_COLLATERAL) for disabled/unknown collateral
    //   InputValidationError(PARAMETER_OUT_OF_RANGE) when a component exceeds its model max
    PriceQuote quote(const PricingRequest& request) const override;

    // Purchase price only
    Amount price_loan(const PricingRequest& request) const;

private:
    std::shared_ptr<const ICollateralOracle> oracle_;
    RateModel utilization_model_;
    std::map<std::string, CollateralRiskParameters> collateral_parameters_;
    Amount minimum_discount_rate_;
    uint64_t minimum_loan_duration_;
};

} // namespace tranchevault

#endif // TRANCHEVAULT_LOAN_PRICER_HPP
