#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers.hpp>
#include <stdexcept>
#include "tranche.hpp"
#include "test_support.hpp"

using namespace tranchevault;
using namespace tranchevault::testing;
using fixed_point::one;

TEST_CASE("TimeBucketConfig", "[tranche]") {
    TimeBucketConfig timing;
    REQUIRE(timing.bucket_duration == WEEK);
    REQUIRE(timing.proration_buckets == 6);
    REQUIRE(timing.proration_duration() == 6 * WEEK);
    REQUIRE(timing.bucket_of(T0) == 2800);
    REQUIRE(timing.bucket_of(T0 - 1) == 2799);

    REQUIRE_THROWS_MATCHES(TimeBucketConfig(0, 6).validate(), VaultError,
                           HasErrorCode(ErrorCode::PARAMETER_OUT_OF_RANGE));
    REQUIRE_THROWS_AS(TimeBucketConfig(WEEK, 0).validate(), InputValidationError);
}

TEST_CASE("Prorated returns", "[tranche]") {
    TimeBucketConfig timing;
    Tranche tranche;
    tranche.schedule_return(10, dec("6"));

    SECTION("Nothing accrues before the proration horizon") {
        REQUIRE(tranche.prorated_returns(4 * WEEK + 100, timing) == Amount(0));
        REQUIRE(tranche.prorated_returns(5 * WEEK, timing) == Amount(0));
    }

    SECTION("Accrues linearly across the horizon") {
        REQUIRE(tranche.prorated_returns(5 * WEEK + WEEK / 2, timing) == dec("0.5"));
        REQUIRE(tranche.prorated_returns(7 * WEEK + 3 * DAY, timing) == dec("2.428571428571428571"));
        REQUIRE(tranche.prorated_returns(10 * WEEK, timing) == dec("5"));
        REQUIRE(tranche.prorated_returns(11 * WEEK - 1, timing) == dec("5.99999834656084656"));
    }

    SECTION("Returns of a past bucket no longer count") {
        REQUIRE(tranche.prorated_returns(11 * WEEK, timing) == Amount(0));
    }

    SECTION("Monotonic non-decreasing within the horizon") {
        Amount previous(0);
        for (uint64_t now = 5 * WEEK; now < 11 * WEEK; now += DAY / 2) {
            Amount current = tranche.prorated_returns(now, timing);
            REQUIRE(current >= previous);
            REQUIRE(current <= dec("6"));
            previous = current;
        }
    }

    SECTION("Buckets accrue independently") {
        tranche.schedule_return(8, dec("6"));
        // Bucket 8 is two buckets nearer than bucket 10
        REQUIRE(tranche.prorated_returns(8 * WEEK, timing) == dec("5") + dec("3"));
    }
}

TEST_CASE("Scheduled returns", "[tranche]") {
    Tranche tranche;

    SECTION("Zero returns are not stored") {
        tranche.schedule_return(3, Amount(0));
        REQUIRE(tranche.pending_returns.empty());
    }

    SECTION("Returns accumulate per bucket") {
        tranche.schedule_return(3, dec("1"));
        tranche.schedule_return(3, dec("0.5"));
        REQUIRE(tranche.scheduled_return(3) == dec("1.5"));
        REQUIRE(tranche.scheduled_return(4) == Amount(0));
    }

    SECTION("Emptied buckets are evicted") {
        tranche.schedule_return(3, dec("1"));
        tranche.unschedule_return(3, dec("0.25"));
        REQUIRE(tranche.scheduled_return(3) == dec("0.75"));
        tranche.unschedule_return(3, dec("0.75"));
        REQUIRE(tranche.pending_returns.empty());
    }

    SECTION("Unscheduling more than scheduled is a logic error") {
        tranche.schedule_return(3, dec("1"));
        REQUIRE_THROWS_AS(tranche.unschedule_return(3, dec("2")), std::logic_error);
        REQUIRE_THROWS_AS(tranche.unschedule_return(4, dec("1")), std::logic_error);
    }
}

TEST_CASE("Tranche share accounting", "[tranche]") {
    TimeBucketConfig timing;
    Tranche tranche;

    SECTION("Share prices default to one") {
        REQUIRE(tranche.share_price(T0, timing) == one());
        REQUIRE(tranche.redemption_share_price() == one());
    }

    SECTION("Mint and burn") {
        tranche.mint_shares("alice", dec("3"));
        tranche.mint_shares("bob", dec("2"));
        REQUIRE(tranche.total_shares == dec("5"));
        REQUIRE(tranche.share_balance("alice") == dec("3"));

        tranche.burn_shares("alice", dec("3"));
        REQUIRE(tranche.share_balances.count("alice") == 0);
        REQUIRE(tranche.total_shares == dec("2"));

        REQUIRE_THROWS_MATCHES(tranche.burn_shares("bob", dec("2.5")), VaultError,
                               HasErrorCode(ErrorCode::INSUFFICIENT_SHARES));
        REQUIRE_THROWS_MATCHES(tranche.burn_shares("carol", dec("1")), VaultError,
                               HasErrorCode(ErrorCode::INSUFFICIENT_SHARES));
    }

    SECTION("Realized value excludes queued redemptions") {
        tranche.deposit_value = dec("10");
        tranche.mint_shares("alice", dec("8"));
        tranche.redemption_queue_total = dec("4");
        tranche.redemption_queue_processed = dec("1");

        REQUIRE(tranche.pending_redemptions() == dec("3"));
        REQUIRE(tranche.realized_value() == dec("7"));
        REQUIRE(tranche.redemption_share_price() == dec("0.875"));
    }

    SECTION("Realized value saturates at zero") {
        tranche.deposit_value = dec("1");
        tranche.redemption_queue_total = dec("2");
        REQUIRE(tranche.realized_value() == Amount(0));
    }

    SECTION("Share price includes prorated returns") {
        tranche.deposit_value = dec("10");
        tranche.mint_shares("alice", dec("10"));
        tranche.schedule_return(timing.bucket_of(T0), dec("1.2"));

        // Current bucket at its start: 5/6 accrued
        REQUIRE(tranche.estimated_value(T0, timing) == dec("11"));
        REQUIRE(tranche.share_price(T0, timing) == dec("1.1"));
        REQUIRE(tranche.redemption_share_price() == one());
    }
}
