#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers.hpp>
#include "loan_lifecycle.hpp"
#include "redemption_queue.hpp"
#include "tranche_ledger.hpp"
#include "test_support.hpp"

using namespace tranchevault;
using namespace tranchevault::testing;

namespace {

const TrancheId SENIOR = TrancheId::Senior;
const TrancheId JUNIOR = TrancheId::Junior;

VaultState create_state(const std::string& reserve_ratio) {
    VaultState state;
    state.parameters.set_reserve_ratio(dec(reserve_ratio));
    return state;
}

TrancheAllocation fractions(const std::string& senior, const std::string& junior) {
    TrancheAllocation split;
    split[SENIOR] = dec(senior);
    split[JUNIOR] = dec(junior);
    return split;
}

} // anonymous namespace

// ============================================================================
// Deposits and reserves
// ============================================================================

TEST_CASE("Deposits mint shares at the current price", "[redemption_queue]") {
    VaultState state;

    REQUIRE(deposit(state, SENIOR, "alice", dec("10"), T0) == dec("10"));
    REQUIRE(state.tranche(SENIOR).deposit_value == dec("10"));
    REQUIRE(state.balances.total_cash_balance == dec("10"));

    state.tranche(SENIOR).deposit_value = dec("20");
    state.balances.total_cash_balance = dec("20");
    REQUIRE(deposit(state, SENIOR, "bob", dec("4"), T0) == dec("2"));
    REQUIRE(state.tranche(SENIOR).share_balance("bob") == dec("2"));
    REQUIRE_NOTHROW(state.check_invariants());

    SECTION("Zero deposits are rejected") {
        REQUIRE_THROWS_MATCHES(deposit(state, JUNIOR, "alice", Amount(0), T0), VaultError,
                               HasErrorCode(ErrorCode::INVALID_AMOUNT));
    }

    SECTION("Paused vault rejects deposits") {
        state.parameters.paused = true;
        VaultState before = state;
        REQUIRE_THROWS_MATCHES(deposit(state, JUNIOR, "alice", dec("1"), T0), VaultError,
                               HasErrorCode(ErrorCode::PAUSED));
        REQUIRE(state == before);
    }

    SECTION("Insolvent tranche rejects deposits") {
        state.tranche(SENIOR).deposit_value = Amount(0);
        state.balances.total_cash_balance = Amount(0);
        REQUIRE_THROWS_MATCHES(deposit(state, SENIOR, "carol", dec("1"), T0), VaultError,
                               HasErrorCode(ErrorCode::TRANCHE_INSOLVENT));
    }
}

TEST_CASE("Deposit amounts split by allocation", "[redemption_queue]") {
    SECTION("Three quarters senior") {
        TrancheAllocation split = split_by_fractions(dec("2.1"), fractions("0.75", "0.25"));
        REQUIRE(split[SENIOR] == dec("1.575"));
        REQUIRE(split[JUNIOR] == dec("0.525"));
    }

    SECTION("Junior takes the truncation remainder") {
        TrancheAllocation split = split_by_fractions(Amount(1), fractions("0.5", "0.5"));
        REQUIRE(split[SENIOR] == Amount(0));
        REQUIRE(split[JUNIOR] == Amount(1));
    }

    SECTION("Single tranche") {
        REQUIRE(split_by_fractions(dec("3"), fractions("1", "0"))[JUNIOR] == Amount(0));
        REQUIRE(split_by_fractions(dec("3"), fractions("0", "1"))[JUNIOR] == dec("3"));
    }

    SECTION("Fractions must sum to one") {
        REQUIRE_THROWS_MATCHES(split_by_fractions(dec("2"), fractions("0", "0")), VaultError,
                               HasErrorCode(ErrorCode::PARAMETER_OUT_OF_RANGE));
        REQUIRE_THROWS_MATCHES(split_by_fractions(dec("2"), fractions("0.5", "0.51")), VaultError,
                               HasErrorCode(ErrorCode::PARAMETER_OUT_OF_RANGE));
        REQUIRE_THROWS_MATCHES(split_by_fractions(dec("2"), fractions("2", "0")), VaultError,
                               HasErrorCode(ErrorCode::PARAMETER_OUT_OF_RANGE));
    }
}

TEST_CASE("Reserves are sized from the pool value", "[redemption_queue]") {
    VaultState state = create_state("0.1");

    deposit(state, SENIOR, "alice", dec("1.23"), T0);
    REQUIRE(state.balances.total_reserves_balance == dec("0.123"));
    REQUIRE(state.available_cash() == dec("1.107"));

    SECTION("Reserves pay out queued redemptions first") {
        REQUIRE(request_redemption(state, SENIOR, "alice", dec("1.01")) == dec("1.01"));

        const Tranche& senior = state.tranche(SENIOR);
        REQUIRE(senior.redemption_queue_total == dec("1.01"));
        REQUIRE(senior.redemption_queue_processed == dec("0.123"));
        REQUIRE(senior.deposit_value == dec("1.107"));
        REQUIRE(state.balances.total_withdrawal_balance == dec("0.123"));
        REQUIRE(state.balances.total_reserves_balance == Amount(0));
        REQUIRE(redemption_available(state, SENIOR, "alice") == dec("0.123"));
        REQUIRE_NOTHROW(state.check_invariants());
    }
}

// ============================================================================
// Redemption requests
// ============================================================================

TEST_CASE("Redemption request validation", "[redemption_queue]") {
    VaultState state;
    deposit(state, SENIOR, "alice", dec("10"), T0);

    SECTION("Zero shares") {
        REQUIRE_THROWS_MATCHES(request_redemption(state, SENIOR, "alice", Amount(0)), VaultError,
                               HasErrorCode(ErrorCode::INVALID_AMOUNT));
    }

    SECTION("More shares than held") {
        REQUIRE_THROWS_MATCHES(request_redemption(state, SENIOR, "alice", dec("11")), VaultError,
                               HasErrorCode(ErrorCode::INSUFFICIENT_SHARES));
        REQUIRE_THROWS_MATCHES(request_redemption(state, JUNIOR, "alice", dec("1")), VaultError,
                               HasErrorCode(ErrorCode::INSUFFICIENT_SHARES));
    }

    SECTION("One outstanding redemption per depositor and tranche") {
        FixedPriceOracle oracle(dec("10"));
        purchase_loan(state, oracle, LoanKey("note", 1), make_terms("10", "10.5", T0 + 30 * DAY),
                      dec("10"), T0);

        request_redemption(state, SENIOR, "alice", dec("4"));
        REQUIRE(redemption_available(state, SENIOR, "alice") == Amount(0));
        REQUIRE_THROWS_MATCHES(request_redemption(state, SENIOR, "alice", dec("1")), VaultError,
                               HasErrorCode(ErrorCode::REDEMPTION_IN_PROGRESS));
    }

    SECTION("Paused vault rejects redemptions") {
        state.parameters.paused = true;
        REQUIRE_THROWS_MATCHES(request_redemption(state, SENIOR, "alice", dec("1")), VaultError,
                               HasErrorCode(ErrorCode::PAUSED));
    }

    SECTION("Insolvent tranche rejects redemptions") {
        state.tranche(SENIOR).deposit_value = Amount(0);
        state.balances.total_cash_balance = Amount(0);
        REQUIRE_THROWS_MATCHES(request_redemption(state, SENIOR, "alice", dec("1")), VaultError,
                               HasErrorCode(ErrorCode::TRANCHE_INSOLVENT));
    }

    SECTION("Redemption worth nothing") {
        // Share price of 10^-18: half a share truncates to zero
        state.tranche(SENIOR).deposit_value = dec("0.00000000000000001");
        state.balances.total_cash_balance = dec("0.00000000000000001");
        REQUIRE_THROWS_MATCHES(request_redemption(state, SENIOR, "alice", dec("0.5")), VaultError,
                               HasErrorCode(ErrorCode::INVALID_AMOUNT));
    }
}

TEST_CASE("Queued redemptions wait for reserves or fresh proceeds", "[redemption_queue]") {
    VaultState state;
    deposit(state, JUNIOR, "alice", dec("5"), T0);

    // Without reserves or fresh proceeds nothing is drained
    REQUIRE(request_redemption(state, JUNIOR, "alice", dec("2")) == dec("2"));
    REQUIRE(redemption_available(state, JUNIOR, "alice") == Amount(0));
    REQUIRE(state.tranche(JUNIOR).pending_redemptions() == dec("2"));

    REQUIRE_THROWS_MATCHES(withdraw(state, JUNIOR, "alice", dec("1")), VaultError,
                           HasErrorCode(ErrorCode::INVALID_AMOUNT));

    // A later deposit is fresh proceeds for the queue
    deposit(state, JUNIOR, "bob", dec("3"), T0);
    REQUIRE(redemption_available(state, JUNIOR, "alice") == dec("2"));
    REQUIRE(withdraw_max(state, JUNIOR, "alice") == dec("2"));
    REQUIRE(state.tranche(JUNIOR).find_redemption("alice") == nullptr);
    REQUIRE(state.balances.total_cash_balance == dec("6"));
    REQUIRE_NOTHROW(state.check_invariants());
}

// ============================================================================
// FIFO processing
// ============================================================================

TEST_CASE("Redemption queue is first in, first out", "[redemption_queue]") {
    VaultState state = create_state("0.1");
    FixedPriceOracle oracle(dec("15"));

    deposit(state, SENIOR, "alice", dec("10"), T0);
    REQUIRE(state.balances.total_reserves_balance == dec("1"));
    deposit(state, SENIOR, "bob", dec("10"), T0);
    REQUIRE(state.balances.total_reserves_balance == dec("2"));

    LoanKey key("note", 1);
    purchase_loan(state, oracle, key, make_terms("15", "16", T0 + 30 * DAY), dec("15"), T0);
    REQUIRE(state.balances.total_cash_balance == dec("5"));

    // Alice queues first and is paid from the reserve
    REQUIRE(request_redemption(state, SENIOR, "alice", dec("5")) == dec("5"));
    REQUIRE(redemption_available(state, SENIOR, "alice") == dec("2"));
    REQUIRE(state.balances.total_reserves_balance == Amount(0));

    REQUIRE(request_redemption(state, SENIOR, "bob", dec("5")) == dec("5"));
    REQUIRE(redemption_available(state, SENIOR, "bob") == Amount(0));
    REQUIRE_NOTHROW(state.check_invariants());

    // Fresh junior cash drains the senior queue: alice is completed before bob gets anything
    deposit(state, JUNIOR, "carol", dec("4"), T0);
    REQUIRE(state.tranche(SENIOR).redemption_queue_processed == dec("6"));
    REQUIRE(redemption_available(state, SENIOR, "alice") == dec("5"));
    REQUIRE(redemption_available(state, SENIOR, "bob") == dec("1"));

    SECTION("Partial withdrawals leave the remainder available") {
        withdraw(state, SENIOR, "bob", dec("0.4"));
        REQUIRE(redemption_available(state, SENIOR, "bob") == dec("0.6"));
        REQUIRE_THROWS_MATCHES(withdraw(state, SENIOR, "bob", dec("0.7")), VaultError,
                               HasErrorCode(ErrorCode::INVALID_AMOUNT));
        REQUIRE_NOTHROW(state.check_invariants());
    }

    SECTION("Repayment completes the queue") {
        withdraw(state, SENIOR, "alice", dec("5"));
        REQUIRE(state.tranche(SENIOR).find_redemption("alice") == nullptr);
        REQUIRE(state.balances.total_cash_balance == dec("4"));
        REQUIRE(state.balances.total_withdrawal_balance == dec("1"));

        repay_loan(state, key);
        REQUIRE(state.tranche(SENIOR).redemption_queue_processed == dec("10"));
        REQUIRE(redemption_available(state, SENIOR, "bob") == dec("5"));
        REQUIRE(state.balances.total_reserves_balance == dec("1.5"));
        REQUIRE(state.tranche(SENIOR).deposit_value == dec("10.06164383560912"));
        REQUIRE(state.tranche(JUNIOR).deposit_value == dec("4.93835616439088"));

        REQUIRE(withdraw_max(state, SENIOR, "bob") == dec("5"));
        REQUIRE(state.balances.total_cash_balance == dec("15"));
        REQUIRE(state.balances.total_withdrawal_balance == Amount(0));
        REQUIRE_NOTHROW(state.check_invariants());
    }

    SECTION("Withdrawals are blocked while paused") {
        state.parameters.paused = true;
        REQUIRE_THROWS_MATCHES(withdraw(state, SENIOR, "alice", dec("1")), VaultError,
                               HasErrorCode(ErrorCode::PAUSED));
    }
}

TEST_CASE("Senior redemptions drain before junior", "[redemption_queue]") {
    VaultState state;
    FixedPriceOracle oracle(dec("6"));

    deposit(state, SENIOR, "alice", dec("3"), T0);
    deposit(state, JUNIOR, "bob", dec("3"), T0);
    purchase_loan(state, oracle, LoanKey("note", 1), make_terms("6", "6.6", T0 + 30 * DAY), dec("6"), T0);

    request_redemption(state, JUNIOR, "bob", dec("2"));
    request_redemption(state, SENIOR, "alice", dec("2"));

    deposit(state, JUNIOR, "carol", dec("3"), T0);
    REQUIRE(redemption_available(state, SENIOR, "alice") == dec("2"));
    REQUIRE(redemption_available(state, JUNIOR, "bob") == dec("1"));
    REQUIRE_NOTHROW(state.check_invariants());
}
