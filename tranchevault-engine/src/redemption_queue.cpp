#include "redemption_queue.hpp"
#include "vault_error.hpp"
#include <algorithm>

namespace tranchevault {

using fixed_point::mul;
using fixed_point::saturating_sub;
using fixed_point::to_decimal;

namespace {

void require_not_paused(const VaultState& state, const char* operation) {
    if (state.parameters.paused) {
        throw StatePreconditionError(ErrorCode::PAUSED, std::string(operation) + " is paused");
    }
}

} // anonymous namespace

Amount request_redemption(VaultState& state, TrancheId tranche, const AccountId& account,
                          const Amount& shares) {
    require_not_paused(state, "Redemption");
    if (shares == 0) {
        throw InputValidationError(ErrorCode::INVALID_AMOUNT, "Redemption share count must be positive");
    }

    Tranche& t = state.tranche(tranche);
    if (t.share_balance(account) < shares) {
        throw StatePreconditionError(ErrorCode::INSUFFICIENT_SHARES,
            account + " holds " + to_decimal(t.share_balance(account)) + " " +
            tranche_to_string(tranche) + " shares");
    }
    if (t.find_redemption(account) != nullptr) {
        throw StatePreconditionError(ErrorCode::REDEMPTION_IN_PROGRESS,
            account + " already has a pending " + tranche_to_string(tranche) + " redemption");
    }

    Amount price = t.redemption_share_price();
    if (price == 0) {
        throw StatePreconditionError(ErrorCode::TRANCHE_INSOLVENT,
            tranche_to_string(tranche) + " tranche is insolvent");
    }

    Amount amount = mul(shares, price);
    if (amount == 0) {
        throw InputValidationError(ErrorCode::INVALID_AMOUNT, "Redemption is worth nothing");
    }

    t.burn_shares(account, shares);
    t.redemption_queue_total += amount;
    t.redemptions[account] = DepositorRedemption(amount, Amount(0), t.redemption_queue_total);

    process_redemptions(state, Amount(0));

    return amount;
}

Amount redemption_available(const VaultState& state, TrancheId tranche, const AccountId& account) {
    const Tranche& t = state.tranche(tranche);
    const DepositorRedemption* redemption = t.find_redemption(account);
    if (redemption == nullptr) {
        return Amount(0);
    }

    // The depositor's money occupies (target - pending, target] of the queue
    Amount queue_start = redemption->queue_target_position - redemption->pending_amount;
    Amount processed = std::min(t.redemption_queue_processed, redemption->queue_target_position);
    Amount released = saturating_sub(processed, queue_start);

    return saturating_sub(released, redemption->withdrawn_amount);
}

void withdraw(VaultState& state, TrancheId tranche, const AccountId& account, const Amount& amount) {
    require_not_paused(state, "Withdrawal");

    Amount available = redemption_available(state, tranche, account);
    if (available == 0 || amount > available) {
        throw InputValidationError(ErrorCode::INVALID_AMOUNT,
            "Requested " + to_decimal(amount) + ", available " + to_decimal(available));
    }
    if (amount == 0) {
        throw InputValidationError(ErrorCode::INVALID_AMOUNT, "Withdrawal amount must be positive");
    }

    Tranche& t = state.tranche(tranche);
    auto it = t.redemptions.find(account);
    it->second.withdrawn_amount += amount;
    if (it->second.withdrawn_amount == it->second.pending_amount) {
        t.redemptions.erase(it);
    }

    state.balances.total_withdrawal_balance -= amount;
    state.balances.total_cash_balance -= amount;
}

Amount withdraw_max(VaultState& state, TrancheId tranche, const AccountId& account) {
    Amount available = redemption_available(state, tranche, account);
    withdraw(state, tranche, account, available);
    return available;
}

void process_redemptions(VaultState& state, const Amount& proceeds) {
    BalanceState& balances = state.balances;
    Amount pool = proceeds + balances.total_reserves_balance;

    for (TrancheId id : TRANCHE_PRIORITY) {
        Tranche& t = state.tranche(id);
        // Capped at deposit value: an insolvent tranche's redemptions wait
        Amount amount = std::min({t.pending_redemptions(), pool, t.deposit_value});
        if (amount == 0) {
            continue;
        }
        t.redemption_queue_processed += amount;
        t.deposit_value -= amount;
        balances.total_withdrawal_balance += amount;
        pool -= amount;
    }

    Amount pool_value = balances.total_cash_balance - balances.total_withdrawal_balance +
                        balances.total_loan_balance;
    balances.total_reserves_balance = std::min(pool, mul(state.parameters.reserve_ratio, pool_value));
}

} // namespace tranchevault
