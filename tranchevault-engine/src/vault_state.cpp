#include "vault_state.hpp"
#include "vault_error.hpp"
#include <array>
#include <map>

namespace tranchevault {

using fixed_point::div;
using fixed_point::from_decimal;
using fixed_point::normalize_rate;
using fixed_point::one;
using fixed_point::saturating_sub;
using fixed_point::to_decimal;

// ============================================================================
// VaultParameters
// ============================================================================

VaultParameters::VaultParameters()
    : senior_tranche_rate(normalize_rate(from_decimal("0.05"))),
      reserve_ratio(0),
      price_tolerance(0),
      paused(false) {}

void VaultParameters::set_senior_tranche_rate(const Amount& rate) {
    if (rate == 0 || rate >= one()) {
        throw InputValidationError(ErrorCode::PARAMETER_OUT_OF_RANGE,
            "Senior tranche rate " + to_decimal(rate) + " must be in (0, 1)");
    }
    senior_tranche_rate = rate;
}

void VaultParameters::set_reserve_ratio(const Amount& ratio) {
    if (ratio >= one()) {
        throw InputValidationError(ErrorCode::PARAMETER_OUT_OF_RANGE,
            "Reserve ratio " + to_decimal(ratio) + " must be below 1");
    }
    reserve_ratio = ratio;
}

void VaultParameters::validate() const {
    VaultParameters probe;
    probe.set_senior_tranche_rate(senior_tranche_rate);
    probe.set_reserve_ratio(reserve_ratio);
    timing.validate();
}

bool VaultParameters::operator==(const VaultParameters& other) const {
    return senior_tranche_rate == other.senior_tranche_rate &&
           reserve_ratio == other.reserve_ratio &&
           price_tolerance == other.price_tolerance &&
           paused == other.paused &&
           timing == other.timing;
}

// ============================================================================
// VaultState
// ============================================================================

const Loan* VaultState::find_loan(const LoanKey& key) const {
    auto it = loans.find(key);
    return it == loans.end() ? nullptr : &it->second;
}

Loan& VaultState::require_loan(const LoanKey& key) {
    auto it = loans.find(key);
    if (it == loans.end()) {
        throw StatePreconditionError(ErrorCode::UNKNOWN_LOAN, "Loan " + key.to_string() + " is not held");
    }
    return it->second;
}

Amount VaultState::utilization() const {
    Amount pool_value = saturating_sub(balances.total_cash_balance, balances.total_withdrawal_balance) +
                        balances.total_loan_balance;
    if (pool_value == 0) {
        return Amount(0);
    }
    return div(balances.total_loan_balance, pool_value);
}

Amount VaultState::available_cash() const {
    return saturating_sub(balances.total_cash_balance,
                          balances.total_reserves_balance + balances.total_withdrawal_balance);
}

Amount VaultState::total_deposit_value() const {
    Amount total(0);
    for (const auto& tranche : tranches) {
        total += tranche.deposit_value;
    }
    return total;
}

void VaultState::track_pending_loan(const LoanKey& key, uint64_t maturity_bucket) {
    pending_loans[maturity_bucket].insert(key);
}

void VaultState::untrack_pending_loan(const LoanKey& key, uint64_t maturity_bucket) {
    auto it = pending_loans.find(maturity_bucket);
    if (it == pending_loans.end()) {
        return;
    }
    it->second.erase(key);
    if (it->second.empty()) {
        pending_loans.erase(it);
    }
}

void VaultState::check_invariants() const {
    const Amount lhs = total_deposit_value() + balances.total_withdrawal_balance;
    const Amount rhs = balances.total_cash_balance + balances.total_loan_balance;
    if (lhs != rhs) {
        throw InvariantViolation("deposit value + withdrawals (" + to_decimal(lhs) +
                                 ") != cash + loans (" + to_decimal(rhs) + ")");
    }

    if (balances.total_reserves_balance + balances.total_withdrawal_balance > balances.total_cash_balance) {
        throw InvariantViolation("reserves + withdrawals exceed cash");
    }

    for (TrancheId id : TRANCHE_PRIORITY) {
        const Tranche& t = tranche(id);
        if (t.redemption_queue_processed > t.redemption_queue_total) {
            throw InvariantViolation(tranche_to_string(id) + " processed redemptions exceed queue total");
        }

        Amount share_sum(0);
        for (const auto& [account, balance] : t.share_balances) {
            share_sum += balance;
        }
        if (share_sum != t.total_shares) {
            throw InvariantViolation(tranche_to_string(id) + " share balances do not sum to total shares");
        }

        for (const auto& [account, redemption] : t.redemptions) {
            if (redemption.withdrawn_amount > redemption.pending_amount) {
                throw InvariantViolation(account + " withdrew more than its redemption in " +
                                         tranche_to_string(id));
            }
        }
    }

    Amount loan_total(0);
    std::array<std::map<uint64_t, Amount>, NUM_TRANCHES> scheduled;
    for (const auto& [key, loan] : loans) {
        if (!loan.active) {
            continue;
        }
        loan_total += loan.purchase_price;

        const uint64_t bucket = parameters.timing.bucket_of(loan.maturity_timestamp);
        for (TrancheId id : TRANCHE_PRIORITY) {
            if (loan.tranche_return(id) > 0) {
                scheduled[tranche_index(id)][bucket] += loan.tranche_return(id);
            }
        }

        auto it = pending_loans.find(bucket);
        if (it == pending_loans.end() || it->second.count(key) == 0) {
            throw InvariantViolation("active loan " + key.to_string() + " is missing from its maturity bucket");
        }
    }
    if (loan_total != balances.total_loan_balance) {
        throw InvariantViolation("active loan purchase prices do not sum to the loan balance");
    }

    // Repayment and default unschedule exactly what each active loan scheduled
    for (TrancheId id : TRANCHE_PRIORITY) {
        std::map<uint64_t, Amount> pending;
        for (const auto& [bucket, amount] : tranche(id).pending_returns) {
            if (amount > 0) {
                pending.emplace(bucket, amount);
            }
        }
        if (pending != scheduled[tranche_index(id)]) {
            throw InvariantViolation(tranche_to_string(id) +
                                     " scheduled returns do not match the active loans' returns");
        }
    }
}

bool VaultState::operator==(const VaultState& other) const {
    return tranches == other.tranches &&
           balances == other.balances &&
           parameters == other.parameters &&
           loans == other.loans &&
           pending_loans == other.pending_loans;
}

} // namespace tranchevault
