/**
 * @file vault_state.hpp
 * @brief Aggregate ledger state of the vault
 *
 * VaultState is the single aggregate root of the ledger. Every ledger
 * operation (tranche_ledger, redemption_queue, loan_lifecycle) takes it by
 * reference; the service layer serializes access and commits whole copies.
 */

#ifndef TRANCHEVAULT_VAULT_STATE_HPP
#define TRANCHEVAULT_VAULT_STATE_HPP

#include <array>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include "fixed_point.hpp"
#include "loan.hpp"
#include "tranche.hpp"

namespace tranchevault {

/**
 * @brief Raised when a ledger invariant does not hold
 */
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& message)
        : std::logic_error("Ledger invariant violated: " + message) {}
};

/**
 * @brief Global cash and loan balances
 *
 * total_cash_balance includes the reserve and the cash earmarked for
 * withdrawals; the remainder is distributable to new purchases.
 */
struct BalanceState {
    Amount total_cash_balance;
    Amount total_loan_balance;
    Amount total_reserves_balance;
    Amount total_withdrawal_balance;

    bool operator==(const BalanceState& other) const {
        return total_cash_balance == other.total_cash_balance &&
               total_loan_balance == other.total_loan_balance &&
               total_reserves_balance == other.total_reserves_balance &&
               total_withdrawal_balance == other.total_withdrawal_balance;
    }
};

/**
 * @brief Administered vault parameters
 */
struct VaultParameters {
    Amount senior_tranche_rate;   ///< Per-second fixed-point rate, 0 < rate < 1.0
    Amount reserve_ratio;         ///< Fraction of pool value held back, < 1.0
    Amount price_tolerance;       ///< Accepted |offered - computed| purchase price difference
    bool paused;                  ///< Blocks deposit, purchase, redeem and withdraw
    TimeBucketConfig timing;

    VaultParameters();

    // Bounds-checked setters, throw InputValidationError(PARAMETER_OUT_OF_RANGE)
    void set_senior_tranche_rate(const Amount& rate);
    void set_reserve_ratio(const Amount& ratio);

    void validate() const;

    bool operator==(const VaultParameters& other) const;
};

/**
 * @brief Complete ledger state
 */
struct VaultState {
    std::array<Tranche, NUM_TRANCHES> tranches;
    BalanceState balances;
    VaultParameters parameters;
    std::map<LoanKey, Loan> loans;
    std::map<uint64_t, std::set<LoanKey>> pending_loans;  ///< Active loans by maturity bucket

    Tranche& tranche(TrancheId id) { return tranches[tranche_index(id)]; }
    const Tranche& tranche(TrancheId id) const { return tranches[tranche_index(id)]; }

    /**
     * @brief Look up a held loan
     * @return nullptr when the vault does not hold the loan
     */
    const Loan* find_loan(const LoanKey& key) const;

    /**
     * @brief Look up a held loan
     * @throws StatePreconditionError(UNKNOWN_LOAN) when absent
     */
    Loan& require_loan(const LoanKey& key);

    /**
     * @brief Loan balance over pool value (cash net of withdrawals plus loans)
     * @return Fixed-point fraction, 0 for an empty pool
     */
    Amount utilization() const;

    /**
     * @brief Cash not held in reserve or earmarked for withdrawals
     */
    Amount available_cash() const;

    /**
     * @brief Sum of tranche deposit values
     */
    Amount total_deposit_value() const;

    void track_pending_loan(const LoanKey& key, uint64_t maturity_bucket);
    void untrack_pending_loan(const LoanKey& key, uint64_t maturity_bucket);

    /**
     * @brief Verify balance and queue invariants
     * @throws InvariantViolation describing the first violated invariant
     */
    void check_invariants() const;

    bool operator==(const VaultState& other) const;
};

} // namespace tranchevault

#endif // TRANCHEVAULT_VAULT_STATE_HPP
