#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <filesystem>
#include <sstream>
#include "io/state_json.hpp"
#include "loan_lifecycle.hpp"
#include "redemption_queue.hpp"
#include "tranche_ledger.hpp"
#include "test_support.hpp"

using namespace tranchevault;
using namespace tranchevault::testing;
using json = nlohmann::json;

namespace {

// Ledger with shares, an outstanding redemption, scheduled returns, an active
// and a liquidated loan
VaultState create_busy_state() {
    VaultState state;
    state.parameters.set_reserve_ratio(dec("0.05"));
    state.parameters.price_tolerance = dec("0.001");

    FixedPriceOracle oracle(dec("4"));
    deposit(state, TrancheId::Senior, "alice", dec("10"), T0);
    deposit(state, TrancheId::Junior, "bob", dec("5"), T0);
    purchase_loan(state, oracle, LoanKey("note", 1), make_terms("4", "4.4", T0 + 30 * DAY), dec("4"), T0);
    purchase_loan(state, oracle, LoanKey("note", 2), make_terms("4", "4.3", T0 + 60 * DAY), dec("4"), T0);
    default_loan(state, LoanKey("note", 2));
    request_redemption(state, TrancheId::Senior, "alice", dec("3"));
    return state;
}

} // anonymous namespace

TEST_CASE("Snapshot round trip", "[state_json]") {
    VaultState state = create_busy_state();

    json j = io::vault_state_to_json(state);
    REQUIRE(j["tranches"].size() == 2);
    REQUIRE(j["tranches"][0]["id"].get<std::string>() == "senior");
    REQUIRE(j["loans"].size() == 2);
    REQUIRE(j["balances"]["total_loan_balance"].get<std::string>() == "4");
    REQUIRE(j["parameters"]["reserve_ratio"].get<std::string>() == "0.05");

    VaultState restored = io::vault_state_from_json(j);
    REQUIRE(restored == state);
    REQUIRE(restored.pending_loans.size() == 1);
    REQUIRE(restored.pending_loans.begin()->second.count(LoanKey("note", 1)) == 1);
}

TEST_CASE("Snapshot streams and files", "[state_json]") {
    VaultState state = create_busy_state();

    SECTION("Stream") {
        std::stringstream buffer;
        io::write_vault_state_json(buffer, state, false);
        REQUIRE(io::read_vault_state_json(buffer) == state);
    }

    SECTION("File") {
        std::string path = (std::filesystem::temp_directory_path() / "tranchevault_snapshot_test.json").string();
        io::write_vault_state_json(path, state);
        REQUIRE(io::read_vault_state_json(path) == state);
        std::remove(path.c_str());
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(io::read_vault_state_json(std::string("/nonexistent/snapshot.json")), std::runtime_error);
    }
}

TEST_CASE("Malformed snapshots are rejected", "[state_json]") {
    json j = io::vault_state_to_json(create_busy_state());

    SECTION("Not JSON") {
        std::stringstream buffer("{ not json");
        REQUIRE_THROWS_AS(io::read_vault_state_json(buffer), io::SnapshotFormatError);
    }

    SECTION("Missing field") {
        j["balances"].erase("total_cash_balance");
        REQUIRE_THROWS_AS(io::vault_state_from_json(j), io::SnapshotFormatError);
    }

    SECTION("Malformed amount") {
        j["tranches"][1]["deposit_value"] = "5,0";
        REQUIRE_THROWS_AS(io::vault_state_from_json(j), io::SnapshotFormatError);
    }

    SECTION("Amount beyond 256 bits") {
        j["tranches"][0]["deposit_value"] = std::string(80, '9');
        REQUIRE_THROWS_AS(io::vault_state_from_json(j), io::SnapshotFormatError);
    }

    SECTION("Wrong tranche count") {
        j["tranches"].push_back(j["tranches"][1]);
        REQUIRE_THROWS_AS(io::vault_state_from_json(j), io::SnapshotFormatError);
    }

    SECTION("Out-of-range parameter") {
        j["parameters"]["reserve_ratio"] = "1";
        REQUIRE_THROWS_AS(io::vault_state_from_json(j), io::SnapshotFormatError);
    }

    SECTION("Unbalanced ledger") {
        j["balances"]["total_cash_balance"] = "100";
        REQUIRE_THROWS_AS(io::vault_state_from_json(j), io::SnapshotFormatError);
    }

    SECTION("Mismatched scheduled returns") {
        // Junior schedule no longer covers the active loan's junior return
        REQUIRE(j["tranches"][1]["pending_returns"].size() == 1);
        j["tranches"][1]["pending_returns"][0]["amount"] = "0.1";
        REQUIRE_THROWS_AS(io::vault_state_from_json(j), io::SnapshotFormatError);
    }

    SECTION("Scheduled returns without a loan") {
        j["tranches"][0]["pending_returns"].push_back({{"bucket", 1}, {"amount", "0.5"}});
        REQUIRE_THROWS_AS(io::vault_state_from_json(j), io::SnapshotFormatError);
    }
}

TEST_CASE("Scheduled returns must match the active loans", "[state_json]") {
    VaultState state = create_busy_state();
    REQUIRE_NOTHROW(state.check_invariants());

    const uint64_t bucket = state.parameters.timing.bucket_of(T0 + 30 * DAY);
    Tranche& junior = state.tranche(TrancheId::Junior);
    REQUIRE(junior.scheduled_return(bucket) == state.find_loan(LoanKey("note", 1))->tranche_return(TrancheId::Junior));

    junior.pending_returns[bucket] = dec("0.1");
    REQUIRE_THROWS_AS(state.check_invariants(), InvariantViolation);
}
