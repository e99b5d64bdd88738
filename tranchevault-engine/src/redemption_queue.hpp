#ifndef TRANCHEVAULT_REDEMPTION_QUEUE_HPP
#define TRANCHEVAULT_REDEMPTION_QUEUE_HPP

#include "fixed_point.hpp"
#include "vault_state.hpp"

namespace tranchevault {

// FIFO redemption queue per tranche.
//
// A redemption burns shares immediately and appends the amount owed (priced
// at realized value) to the tranche's queue. The queue is drained from the
// reserve plus any fresh proceeds, senior before junior; drained cash moves
// from the tranche's deposit value into the withdrawal balance, where each
// depositor can withdraw the part of the processed queue their position covers.

// Burn shares and queue their realized value for withdrawal; returns the
// amount owed. Throws StatePreconditionError(PAUSED | INSUFFICIENT_SHARES |
// REDEMPTION_IN_PROGRESS | TRANCHE_INSOLVENT), InputValidationError(INVALID_AMOUNT).
Amount request_redemption(VaultState& state, TrancheId tranche, const AccountId& account,
                          const Amount& shares);

// Part of the depositor's redemption that has been processed and not withdrawn
Amount redemption_available(const VaultState& state, TrancheId tranche, const AccountId& account);

// Withdraw processed redemption cash. Throws InputValidationError(INVALID_AMOUNT)
// when nothing is available or amount exceeds availability,
// StatePreconditionError(PAUSED) when paused.
void withdraw(VaultState& state, TrancheId tranche, const AccountId& account, const Amount& amount);

// Withdraw everything currently available; returns the amount withdrawn
Amount withdraw_max(VaultState& state, TrancheId tranche, const AccountId& account);

// Drain queued redemptions with reserves plus fresh proceeds, then re-size
// the reserve from what is left
void process_redemptions(VaultState& state, const Amount& proceeds);

} // namespace tranchevault

#endif // TRANCHEVAULT_REDEMPTION_QUEUE_HPP
