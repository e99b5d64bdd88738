#include "loan_lifecycle.hpp"
#include "redemption_queue.hpp"
#include "vault_error.hpp"

namespace tranchevault {

using fixed_point::mul;
using fixed_point::mul_div;
using fixed_point::to_decimal;

namespace {

Loan& require_active_loan(VaultState& state, const LoanKey& key) {
    Loan& loan = state.require_loan(key);
    if (!loan.active) {
        throw StatePreconditionError(ErrorCode::UNKNOWN_LOAN,
            "Loan " + key.to_string() + " is " + loan_status_to_string(loan.status()));
    }
    return loan;
}

void unschedule_returns(VaultState& state, const Loan& loan) {
    uint64_t bucket = state.parameters.timing.bucket_of(loan.maturity_timestamp);
    for (TrancheId id : TRANCHE_PRIORITY) {
        state.tranche(id).unschedule_return(bucket, loan.tranche_return(id));
    }
}

} // anonymous namespace

// ============================================================================
// Purchase
// ============================================================================

PurchaseResult purchase_loan(VaultState& state, const ILoanPriceOracle& pricer, const LoanKey& key,
                             const LoanTerms& terms, const Amount& offered_price, uint64_t now) {
    if (state.parameters.paused) {
        throw StatePreconditionError(ErrorCode::PAUSED, "Purchases are paused");
    }
    if (state.find_loan(key) != nullptr) {
        throw InputValidationError(ErrorCode::DUPLICATE_LOAN, "Loan " + key.to_string() + " is already held");
    }
    if (terms.maturity <= now) {
        throw EconomicPreconditionError(ErrorCode::INSUFFICIENT_TIME_REMAINING,
            "Loan " + key.to_string() + " has matured");
    }

    PricingRequest request;
    request.collateral = terms.collateral;
    request.principal = terms.principal;
    request.repayment = terms.repayment;
    request.duration_remaining = terms.maturity - now;
    request.utilization = state.utilization();

    PriceQuote quote = pricer.quote(request);
    const Amount& price = quote.purchase_price;

    Amount difference = price > offered_price ? Amount(price - offered_price) : Amount(offered_price - price);
    if (difference > state.parameters.price_tolerance) {
        throw EconomicPreconditionError(ErrorCode::PRICE_MISMATCH,
            "Offered " + to_decimal(offered_price) + ", computed " + to_decimal(price));
    }
    if (terms.repayment <= price) {
        throw EconomicPreconditionError(ErrorCode::REPAYMENT_TOO_LOW,
            "Repayment " + to_decimal(terms.repayment) + " does not exceed price " + to_decimal(price));
    }

    Tranche& senior = state.tranche(TrancheId::Senior);
    Tranche& junior = state.tranche(TrancheId::Junior);
    Amount total_deposit_value = senior.deposit_value + junior.deposit_value;

    if (state.available_cash() < price || total_deposit_value == 0) {
        throw EconomicPreconditionError(ErrorCode::INSUFFICIENT_LIQUIDITY,
            "Available cash " + to_decimal(state.available_cash()) + " below price " + to_decimal(price));
    }

    // Simple interest at the senior rate on the senior share of the price
    Amount full_senior_return = mul(price, state.parameters.senior_tranche_rate) *
                                Amount(request.duration_remaining);
    Amount senior_return = mul_div(full_senior_return, senior.deposit_value, total_deposit_value);

    Amount spread = terms.repayment - price;
    if (senior_return >= spread) {
        throw EconomicPreconditionError(ErrorCode::SENIOR_RETURN_EXCEEDS_SPREAD,
            "Senior return " + to_decimal(senior_return) + " leaves no junior spread of " + to_decimal(spread));
    }
    Amount junior_return = spread - senior_return;

    PurchaseResult result;
    result.purchase_price = price;
    result.discount_rate = quote.discount_rate;
    result.senior_return = senior_return;
    result.junior_return = junior_return;
    result.maturity_bucket = state.parameters.timing.bucket_of(terms.maturity);

    senior.schedule_return(result.maturity_bucket, senior_return);
    junior.schedule_return(result.maturity_bucket, junior_return);

    state.balances.total_cash_balance -= price;
    state.balances.total_loan_balance += price;

    Loan loan;
    loan.collateral = terms.collateral;
    loan.borrower = terms.borrower;
    loan.purchase_price = price;
    loan.repayment_amount = terms.repayment;
    loan.maturity_timestamp = terms.maturity;
    loan.tranche_return(TrancheId::Senior) = senior_return;
    loan.tranche_return(TrancheId::Junior) = junior_return;
    loan.active = true;
    loan.liquidated = false;

    state.loans.emplace(key, loan);
    state.track_pending_loan(key, result.maturity_bucket);

    return result;
}

// ============================================================================
// Repayment
// ============================================================================

LoanSettlement repay_loan(VaultState& state, const LoanKey& key) {
    Loan& loan = require_active_loan(state, key);

    unschedule_returns(state, loan);

    LoanSettlement settlement;
    settlement.amount = loan.repayment_amount;
    for (TrancheId id : TRANCHE_PRIORITY) {
        settlement.tranches[id] = loan.tranche_return(id);
        state.tranche(id).deposit_value += loan.tranche_return(id);
    }

    state.balances.total_cash_balance += loan.repayment_amount;
    state.balances.total_loan_balance -= loan.purchase_price;

    state.untrack_pending_loan(key, state.parameters.timing.bucket_of(loan.maturity_timestamp));
    state.loans.erase(key);

    process_redemptions(state, settlement.amount);

    return settlement;
}

// ============================================================================
// Default and liquidation
// ============================================================================

LoanSettlement default_loan(VaultState& state, const LoanKey& key) {
    Loan& loan = require_active_loan(state, key);

    unschedule_returns(state, loan);

    LoanSettlement settlement;
    settlement.amount = loan.purchase_price;
    settlement.tranches = apply_loss(state, loan.purchase_price);

    state.balances.total_loan_balance -= loan.purchase_price;

    // Recovery entitlements: senior is owed its loss plus its coupon
    for (TrancheId id : TRANCHE_PRIORITY) {
        loan.tranche_return(id) += settlement.tranches[id];
    }
    loan.active = false;
    loan.liquidated = true;

    state.untrack_pending_loan(key, state.parameters.timing.bucket_of(loan.maturity_timestamp));

    return settlement;
}

LoanSettlement receive_liquidation_proceeds(VaultState& state, const LoanKey& key, const Amount& proceeds) {
    Loan& loan = state.require_loan(key);
    if (!loan.liquidated) {
        throw StatePreconditionError(ErrorCode::LOAN_NOT_LIQUIDATED,
            "Loan " + key.to_string() + " has not been liquidated");
    }

    LoanSettlement settlement;
    settlement.amount = proceeds;
    settlement.tranches = apply_recovery(state, proceeds, loan.tranche_return(TrancheId::Senior));

    state.balances.total_cash_balance += proceeds;
    state.loans.erase(key);

    process_redemptions(state, proceeds);

    return settlement;
}

void mark_collateral_withdrawn(VaultState& state, const LoanKey& key) {
    Loan& loan = state.require_loan(key);
    if (!loan.liquidated) {
        throw StatePreconditionError(ErrorCode::LOAN_NOT_LIQUIDATED,
            "Loan " + key.to_string() + " has not been liquidated");
    }
    if (loan.collateral_withdrawn) {
        throw StatePreconditionError(ErrorCode::COLLATERAL_ALREADY_WITHDRAWN,
            "Collateral of loan " + key.to_string() + " was already withdrawn");
    }
    loan.collateral_withdrawn = true;
}

} // namespace tranchevault
