#ifndef TRANCHEVAULT_TRANCHE_LEDGER_HPP
#define TRANCHEVAULT_TRANCHE_LEDGER_HPP

#include <array>
#include <cstdint>
#include "fixed_point.hpp"
#include "vault_state.hpp"

namespace tranchevault {

// Per-tranche split of an amount: a loss, a recovery, deposit amounts or fractions
struct TrancheAllocation {
    std::array<Amount, NUM_TRANCHES> amounts;

    const Amount& operator[](TrancheId id) const { return amounts[tranche_index(id)]; }
    Amount& operator[](TrancheId id) { return amounts[tranche_index(id)]; }
};

// Share price of a tranche including prorated pending returns
Amount share_price(const VaultState& state, TrancheId tranche, uint64_t now);

// Share price at realized value only; fixes the amount owed on redemption
Amount redemption_share_price(const VaultState& state, TrancheId tranche);

// Realized value plus prorated pending returns
Amount estimated_value(const VaultState& state, TrancheId tranche, uint64_t now);

// Deposit cash into a tranche at the current share price and mint shares.
// Drains the redemption queue with the deposit as fresh proceeds.
// Returns the minted share count.
// Throws StatePreconditionError(PAUSED | TRANCHE_INSOLVENT),
//        InputValidationError(INVALID_AMOUNT) for a zero amount.
Amount deposit(VaultState& state, TrancheId tranche, const AccountId& account,
               const Amount& amount, uint64_t now);

// Split an amount by per-tranche fractions summing to exactly 1.0; the
// junior tranche takes the truncation remainder.
// Throws InputValidationError(PARAMETER_OUT_OF_RANGE) for any other fractions.
TrancheAllocation split_by_fractions(const Amount& amount, const TrancheAllocation& fractions);

// Junior-first loss: junior absorbs up to its deposit value, senior the rest.
// Debits deposit values only.
TrancheAllocation apply_loss(VaultState& state, const Amount& loss);

// Senior-first recovery: senior receives up to its entitlement, junior the rest.
// Credits deposit values only.
TrancheAllocation apply_recovery(VaultState& state, const Amount& proceeds,
                                 const Amount& senior_entitlement);

} // namespace tranchevault

#endif // TRANCHEVAULT_TRANCHE_LEDGER_HPP
