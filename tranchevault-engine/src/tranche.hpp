#ifndef TRANCHEVAULT_TRANCHE_HPP
#define TRANCHEVAULT_TRANCHE_HPP

#include <array>
#include <cstdint>
#include <map>
#include <string>
#include "fixed_point.hpp"

namespace tranchevault {

using AccountId = std::string;

enum class TrancheId : uint8_t {
    Senior = 0,
    Junior = 1
};

constexpr size_t NUM_TRANCHES = 2;

// Waterfall order: senior is drained and recovered first
constexpr std::array<TrancheId, NUM_TRANCHES> TRANCHE_PRIORITY = {{TrancheId::Senior, TrancheId::Junior}};

inline size_t tranche_index(TrancheId id) {
    return static_cast<size_t>(id);
}

inline std::string tranche_to_string(TrancheId id) {
    switch (id) {
        case TrancheId::Senior: return "senior";
        case TrancheId::Junior: return "junior";
        default: return "unknown";
    }
}

// Fixed-width partition of time used to schedule and prorate returns.
// Returns scheduled in bucket b accrue over the proration horizon
// (proration_buckets * bucket_duration) ending with bucket b.
struct TimeBucketConfig {
    uint64_t bucket_duration;     // Seconds per bucket (default: 7 days)
    uint64_t proration_buckets;   // Proration horizon in buckets (default: 6)

    TimeBucketConfig()
        : bucket_duration(7 * 86400), proration_buckets(6) {}

    TimeBucketConfig(uint64_t duration, uint64_t buckets)
        : bucket_duration(duration), proration_buckets(buckets) {}

    uint64_t bucket_of(uint64_t timestamp) const { return timestamp / bucket_duration; }
    uint64_t proration_duration() const { return bucket_duration * proration_buckets; }

    // Throws InputValidationError(PARAMETER_OUT_OF_RANGE) on a zero width or horizon
    void validate() const;

    bool operator==(const TimeBucketConfig& other) const {
        return bucket_duration == other.bucket_duration &&
               proration_buckets == other.proration_buckets;
    }
};

// A depositor's outstanding redemption in one tranche. The depositor's money
// occupies queue positions (target - pending, target].
struct DepositorRedemption {
    Amount pending_amount;
    Amount withdrawn_amount;
    Amount queue_target_position;

    DepositorRedemption() = default;
    DepositorRedemption(const Amount& pending, const Amount& withdrawn, const Amount& target)
        : pending_amount(pending), withdrawn_amount(withdrawn), queue_target_position(target) {}

    bool operator==(const DepositorRedemption& other) const {
        return pending_amount == other.pending_amount &&
               withdrawn_amount == other.withdrawn_amount &&
               queue_target_position == other.queue_target_position;
    }
};

// Tranche: ledger state of one risk slice of the pool
struct Tranche {
    Amount deposit_value;               // Realized value, including undrained redemptions
    Amount redemption_queue_total;      // Cumulative amount ever queued
    Amount redemption_queue_processed;  // Cumulative amount released to withdrawals
    Amount total_shares;
    std::map<uint64_t, Amount> pending_returns;          // Maturity bucket -> scheduled return
    std::map<AccountId, Amount> share_balances;
    std::map<AccountId, DepositorRedemption> redemptions;

    Amount pending_redemptions() const;

    // Deposit value net of queued redemptions (saturating at zero)
    Amount realized_value() const;

    // Realized value plus scheduled returns prorated to `now`
    Amount estimated_value(uint64_t now, const TimeBucketConfig& timing) const;

    // Sum of prorated contributions from the next proration_buckets buckets
    Amount prorated_returns(uint64_t now, const TimeBucketConfig& timing) const;

    // estimated_value / total_shares, 1.0 when no shares exist
    Amount share_price(uint64_t now, const TimeBucketConfig& timing) const;

    // realized_value / total_shares, 1.0 when no shares exist
    Amount redemption_share_price() const;

    // Scheduled returns
    void schedule_return(uint64_t bucket, const Amount& amount);
    void unschedule_return(uint64_t bucket, const Amount& amount);
    Amount scheduled_return(uint64_t bucket) const;

    // Shares
    Amount share_balance(const AccountId& account) const;
    void mint_shares(const AccountId& account, const Amount& shares);
    void burn_shares(const AccountId& account, const Amount& shares);

    const DepositorRedemption* find_redemption(const AccountId& account) const;

    bool operator==(const Tranche& other) const;
};

} // namespace tranchevault

#endif // TRANCHEVAULT_TRANCHE_HPP
