#include "loan_pricer.hpp"
#include "vault_error.hpp"
#include <algorithm>
#include <stdexcept>

namespace tranchevault {

using fixed_point::div;
using fixed_point::from_integer;
using fixed_point::one;

LoanPricer::LoanPricer(std::shared_ptr<const ICollateralOracle> oracle)
    : oracle_(std::move(oracle)), minimum_discount_rate_(0), minimum_loan_duration_(0) {
    if (!oracle_) {
        throw std::invalid_argument("LoanPricer requires a collateral oracle");
    }
}

void LoanPricer::set_utilization_model(const RateModel& model) {
    utilization_model_ = model;
}

void LoanPricer::set_collateral_parameters(const std::string& collateral_class,
                                           const CollateralRiskParameters& parameters) {
    if (collateral_class.empty()) {
        throw InputValidationError(ErrorCode::PARAMETER_OUT_OF_RANGE,
            "Collateral class must not be empty");
    }
    parameters.validate();
    collateral_parameters_[collateral_class] = parameters;
}

void LoanPricer::remove_collateral_parameters(const std::string& collateral_class) {
    collateral_parameters_.erase(collateral_class);
}

void LoanPricer::set_minimum_discount_rate(const Amount& rate) {
    minimum_discount_rate_ = rate;
}

void LoanPricer::set_minimum_loan_duration(uint64_t seconds) {
    minimum_loan_duration_ = seconds;
}

const CollateralRiskParameters* LoanPricer::find_collateral_parameters(
    const std::string& collateral_class) const {
    auto it = collateral_parameters_.find(collateral_class);
    return it == collateral_parameters_.end() ? nullptr : &it->second;
}

PriceQuote LoanPricer::quote(const PricingRequest& request) const {
    if (request.duration_remaining == 0 || request.duration_remaining < minimum_loan_duration_) {
        throw EconomicPreconditionError(ErrorCode::INSUFFICIENT_TIME_REMAINING,
            std::to_string(request.duration_remaining) + "s remaining, minimum is " +
            std::to_string(minimum_loan_duration_) + "s");
    }

    const CollateralRiskParameters* parameters =
        find_collateral_parameters(request.collateral.collateral_class);
    if (parameters == nullptr || !parameters->enabled) {
        throw EconomicPreconditionError(ErrorCode::UNSUPPORTED_COLLATERAL,
            "Collateral class " + request.collateral.collateral_class + " is not enabled");
    }

    Amount collateral_value = oracle_->collateral_value(request.collateral);
    if (collateral_value == 0) {
        throw EconomicPreconditionError(ErrorCode::UNSUPPORTED_COLLATERAL,
            "Collateral class " + request.collateral.collateral_class + " has no value");
    }

    PriceQuote result;
    result.loan_to_value = div(request.principal, collateral_value);

    result.component_rates[static_cast<size_t>(RateComponent::Utilization)] =
        utilization_model_.evaluate(request.utilization);
    result.component_rates[static_cast<size_t>(RateComponent::LoanToValue)] =
        parameters->loan_to_value_model.evaluate(result.loan_to_value);
    result.component_rates[static_cast<size_t>(RateComponent::Duration)] =
        parameters->duration_model.evaluate(from_integer(request.duration_remaining));

    // Weighted average of the components (weights are integer percent)
    Amount weighted(0);
    for (size_t i = 0; i < result.component_rates.size(); ++i) {
        weighted += result.component_rates[i] * Amount(parameters->weights[i]);
    }
    weighted /= Amount(CollateralRiskParameters::WEIGHT_TOTAL);

    result.discount_rate = std::max(weighted, minimum_discount_rate_);

    // repayment / (1 + rate * t)
    result.purchase_price = div(request.repayment,
        one() + result.discount_rate * Amount(request.duration_remaining));

    return result;
}

Amount LoanPricer::price_loan(const PricingRequest& request) const {
    return quote(request).purchase_price;
}

} // namespace tranchevault
