#ifndef TRANCHEVAULT_LOAN_HPP
#define TRANCHEVAULT_LOAN_HPP

#include <array>
#include <cstdint>
#include <string>
#include "collateral.hpp"
#include "fixed_point.hpp"
#include "tranche.hpp"

namespace tranchevault {

// A loan is identified by the note token representing its lender side and
// the platform's loan id
struct LoanKey {
    std::string note_token;
    uint64_t loan_id;

    LoanKey() : loan_id(0) {}
    LoanKey(const std::string& token, uint64_t id) : note_token(token), loan_id(id) {}

    bool operator==(const LoanKey& other) const;
    bool operator!=(const LoanKey& other) const { return !(*this == other); }
    bool operator<(const LoanKey& other) const;

    std::string to_string() const;
};

// Loan terms as reported by a note adapter
struct LoanTerms {
    Amount principal;
    Amount repayment;
    uint64_t maturity;   // Unix timestamp
    uint64_t duration;   // Total loan duration in seconds
    CollateralRef collateral;
    AccountId borrower;

    LoanTerms() : maturity(0), duration(0) {}
};

// Loan status while the vault holds it. Fully resolved loans are removed.
enum class LoanStatus {
    ACTIVE,      ///< Purchased, awaiting repayment or expiry
    LIQUIDATED   ///< Defaulted, awaiting collateral liquidation proceeds
};

inline std::string loan_status_to_string(LoanStatus status) {
    switch (status) {
        case LoanStatus::ACTIVE: return "ACTIVE";
        case LoanStatus::LIQUIDATED: return "LIQUIDATED";
        default: return "UNKNOWN";
    }
}

// Loan held by the vault.
// trancheReturns holds the scheduled returns while active and the recovery
// entitlements once liquidated.
struct Loan {
    CollateralRef collateral;
    AccountId borrower;
    Amount purchase_price;
    Amount repayment_amount;
    uint64_t maturity_timestamp;
    std::array<Amount, NUM_TRANCHES> tranche_returns;
    bool active;
    bool liquidated;
    bool collateral_withdrawn;

    Loan() : maturity_timestamp(0), active(false), liquidated(false), collateral_withdrawn(false) {}

    LoanStatus status() const {
        return liquidated ? LoanStatus::LIQUIDATED : LoanStatus::ACTIVE;
    }

    const Amount& tranche_return(TrancheId id) const { return tranche_returns[tranche_index(id)]; }
    Amount& tranche_return(TrancheId id) { return tranche_returns[tranche_index(id)]; }

    bool operator==(const Loan& other) const;
};

} // namespace tranchevault

#endif // TRANCHEVAULT_LOAN_HPP
