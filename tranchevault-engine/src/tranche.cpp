#include "tranche.hpp"
#include "vault_error.hpp"
#include <stdexcept>

namespace tranchevault {

using fixed_point::div;
using fixed_point::mul_div;
using fixed_point::one;
using fixed_point::saturating_sub;
using fixed_point::to_decimal;

// ============================================================================
// TimeBucketConfig
// ============================================================================

void TimeBucketConfig::validate() const {
    if (bucket_duration == 0) {
        throw InputValidationError(ErrorCode::PARAMETER_OUT_OF_RANGE,
            "Time bucket duration must be positive");
    }
    if (proration_buckets == 0) {
        throw InputValidationError(ErrorCode::PARAMETER_OUT_OF_RANGE,
            "Proration horizon must span at least one bucket");
    }
}

// ============================================================================
// Valuation
// ============================================================================

Amount Tranche::pending_redemptions() const {
    return redemption_queue_total - redemption_queue_processed;
}

Amount Tranche::realized_value() const {
    return saturating_sub(deposit_value, pending_redemptions());
}

Amount Tranche::prorated_returns(uint64_t now, const TimeBucketConfig& timing) const {
    const uint64_t current_bucket = timing.bucket_of(now);
    const uint64_t elapsed_into_bucket = now - current_bucket * timing.bucket_duration;
    const Amount total_duration(timing.proration_duration());

    Amount prorated(0);
    for (uint64_t i = 0; i < timing.proration_buckets; ++i) {
        auto it = pending_returns.find(current_bucket + i);
        if (it == pending_returns.end()) {
            continue;
        }
        // Nearer buckets are further into their accrual window
        uint64_t elapsed_into_window =
            elapsed_into_bucket + timing.bucket_duration * (timing.proration_buckets - 1 - i);
        prorated += mul_div(it->second, Amount(elapsed_into_window), total_duration);
    }
    return prorated;
}

Amount Tranche::estimated_value(uint64_t now, const TimeBucketConfig& timing) const {
    return realized_value() + prorated_returns(now, timing);
}

Amount Tranche::share_price(uint64_t now, const TimeBucketConfig& timing) const {
    if (total_shares == 0) {
        return one();
    }
    return div(estimated_value(now, timing), total_shares);
}

Amount Tranche::redemption_share_price() const {
    if (total_shares == 0) {
        return one();
    }
    return div(realized_value(), total_shares);
}

// ============================================================================
// Scheduled returns
// ============================================================================

void Tranche::schedule_return(uint64_t bucket, const Amount& amount) {
    if (amount == 0) {
        return;
    }
    pending_returns[bucket] += amount;
}

void Tranche::unschedule_return(uint64_t bucket, const Amount& amount) {
    if (amount == 0) {
        return;
    }
    auto it = pending_returns.find(bucket);
    if (it == pending_returns.end() || it->second < amount) {
        throw std::logic_error("Unscheduling " + to_decimal(amount) + " from bucket " +
                               std::to_string(bucket) + " exceeds its scheduled returns");
    }
    it->second -= amount;
    if (it->second == 0) {
        pending_returns.erase(it);
    }
}

Amount Tranche::scheduled_return(uint64_t bucket) const {
    auto it = pending_returns.find(bucket);
    return it == pending_returns.end() ? Amount(0) : it->second;
}

// ============================================================================
// Shares
// ============================================================================

Amount Tranche::share_balance(const AccountId& account) const {
    auto it = share_balances.find(account);
    return it == share_balances.end() ? Amount(0) : it->second;
}

void Tranche::mint_shares(const AccountId& account, const Amount& shares) {
    if (shares == 0) {
        return;
    }
    share_balances[account] += shares;
    total_shares += shares;
}

void Tranche::burn_shares(const AccountId& account, const Amount& shares) {
    auto it = share_balances.find(account);
    Amount balance = it == share_balances.end() ? Amount(0) : it->second;
    if (balance < shares) {
        throw StatePreconditionError(ErrorCode::INSUFFICIENT_SHARES,
            account + " holds " + to_decimal(balance) + " shares, " + to_decimal(shares) + " requested");
    }
    if (shares == 0) {
        return;
    }
    it->second -= shares;
    if (it->second == 0) {
        share_balances.erase(it);
    }
    total_shares -= shares;
}

const DepositorRedemption* Tranche::find_redemption(const AccountId& account) const {
    auto it = redemptions.find(account);
    return it == redemptions.end() ? nullptr : &it->second;
}

bool Tranche::operator==(const Tranche& other) const {
    return deposit_value == other.deposit_value &&
           redemption_queue_total == other.redemption_queue_total &&
           redemption_queue_processed == other.redemption_queue_processed &&
           total_shares == other.total_shares &&
           pending_returns == other.pending_returns &&
           share_balances == other.share_balances &&
           redemptions == other.redemptions;
}

} // namespace tranchevault
