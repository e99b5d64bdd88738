#include "tranche_ledger.hpp"
#include "redemption_queue.hpp"
#include "vault_error.hpp"
#include <algorithm>

namespace tranchevault {

using fixed_point::div;
using fixed_point::mul;
using fixed_point::one;
using fixed_point::to_decimal;

Amount share_price(const VaultState& state, TrancheId tranche, uint64_t now) {
    return state.tranche(tranche).share_price(now, state.parameters.timing);
}

Amount redemption_share_price(const VaultState& state, TrancheId tranche) {
    return state.tranche(tranche).redemption_share_price();
}

Amount estimated_value(const VaultState& state, TrancheId tranche, uint64_t now) {
    return state.tranche(tranche).estimated_value(now, state.parameters.timing);
}

Amount deposit(VaultState& state, TrancheId tranche, const AccountId& account,
               const Amount& amount, uint64_t now) {
    if (state.parameters.paused) {
        throw StatePreconditionError(ErrorCode::PAUSED, "Deposits are paused");
    }
    if (amount == 0) {
        throw InputValidationError(ErrorCode::INVALID_AMOUNT, "Deposit amount must be positive");
    }

    Tranche& t = state.tranche(tranche);
    Amount price = t.share_price(now, state.parameters.timing);
    // Queued redemptions impaired by losses would be paid out of the new deposit
    if ((t.total_shares > 0 && price == 0) || t.deposit_value < t.pending_redemptions()) {
        throw StatePreconditionError(ErrorCode::TRANCHE_INSOLVENT,
            tranche_to_string(tranche) + " tranche is insolvent");
    }

    Amount shares = div(amount, price);

    t.deposit_value += amount;
    t.mint_shares(account, shares);
    state.balances.total_cash_balance += amount;

    process_redemptions(state, amount);

    return shares;
}

TrancheAllocation split_by_fractions(const Amount& amount, const TrancheAllocation& fractions) {
    const Amount& senior = fractions[TrancheId::Senior];
    const Amount& junior = fractions[TrancheId::Junior];
    if (senior > one() || junior != one() - senior) {
        throw InputValidationError(ErrorCode::PARAMETER_OUT_OF_RANGE,
            "Invalid allocation " + to_decimal(senior) + "/" + to_decimal(junior) + ", must sum to 1");
    }

    TrancheAllocation split;
    split[TrancheId::Senior] = mul(amount, senior);
    split[TrancheId::Junior] = amount - split[TrancheId::Senior];
    return split;
}

TrancheAllocation apply_loss(VaultState& state, const Amount& loss) {
    Tranche& senior = state.tranche(TrancheId::Senior);
    Tranche& junior = state.tranche(TrancheId::Junior);

    TrancheAllocation allocation;
    allocation[TrancheId::Junior] = std::min(loss, junior.deposit_value);
    allocation[TrancheId::Senior] = loss - allocation[TrancheId::Junior];

    if (allocation[TrancheId::Senior] > senior.deposit_value) {
        throw InvariantViolation("loss of " + to_decimal(loss) + " exceeds total deposit value");
    }

    junior.deposit_value -= allocation[TrancheId::Junior];
    senior.deposit_value -= allocation[TrancheId::Senior];

    return allocation;
}

TrancheAllocation apply_recovery(VaultState& state, const Amount& proceeds,
                                 const Amount& senior_entitlement) {
    TrancheAllocation allocation;
    allocation[TrancheId::Senior] = std::min(proceeds, senior_entitlement);
    allocation[TrancheId::Junior] = proceeds - allocation[TrancheId::Senior];

    state.tranche(TrancheId::Senior).deposit_value += allocation[TrancheId::Senior];
    state.tranche(TrancheId::Junior).deposit_value += allocation[TrancheId::Junior];

    return allocation;
}

} // namespace tranchevault
