#ifndef TRANCHEVAULT_LOAN_LIFECYCLE_HPP
#define TRANCHEVAULT_LOAN_LIFECYCLE_HPP

#include <cstdint>
#include "fixed_point.hpp"
#include "loan.hpp"
#include "loan_pricer.hpp"
#include "tranche_ledger.hpp"
#include "vault_state.hpp"

namespace tranchevault {

// Loan lifecycle transitions and their effect on the tranche ledger:
//
//   (none) --purchase_loan--> ACTIVE --repay_loan--> (resolved)
//                               |
//                               +--default_loan--> LIQUIDATED --receive_liquidation_proceeds--> (resolved)
//
// Resolved loans are removed; any further transition on them fails UNKNOWN_LOAN.
// Callers are responsible for corroborating repayment/default with the loan's
// platform before invoking a transition.

struct PurchaseResult {
    Amount purchase_price;
    Amount discount_rate;
    Amount senior_return;
    Amount junior_return;
    uint64_t maturity_bucket;

    PurchaseResult() : maturity_bucket(0) {}
};

// Outcome of a repayment (amount = repayment, per-tranche realized returns),
// a default (amount = purchase price, per-tranche losses) or a recovery
// (amount = proceeds, per-tranche recoveries)
struct LoanSettlement {
    Amount amount;
    TrancheAllocation tranches;
};

// Price, validate and record a loan purchase. Check order:
//   PAUSED, DUPLICATE_LOAN, pricer failures, PRICE_MISMATCH, REPAYMENT_TOO_LOW,
//   INSUFFICIENT_LIQUIDITY, SENIOR_RETURN_EXCEEDS_SPREAD
PurchaseResult purchase_loan(VaultState& state, const ILoanPriceOracle& pricer, const LoanKey& key,
                             const LoanTerms& terms, const Amount& offered_price, uint64_t now);

// Realize the scheduled returns of a repaid loan and drain the queue
LoanSettlement repay_loan(VaultState& state, const LoanKey& key);

// Void scheduled returns and book the purchase price as a junior-first loss.
// The loan's tranche returns become recovery entitlements.
LoanSettlement default_loan(VaultState& state, const LoanKey& key);

// Distribute collateral liquidation proceeds senior-first and drain the queue
LoanSettlement receive_liquidation_proceeds(VaultState& state, const LoanKey& key, const Amount& proceeds);

// Record that a liquidated loan's collateral has left the vault
void mark_collateral_withdrawn(VaultState& state, const LoanKey& key);

} // namespace tranchevault

#endif // TRANCHEVAULT_LOAN_LIFECYCLE_HPP
