#include "state_json.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace tranchevault {
namespace io {

using fixed_point::from_decimal;
using fixed_point::to_decimal;

namespace {

Amount read_amount(const json& j, const char* key) {
    return from_decimal(j.at(key).get<std::string>());
}

json tranche_to_json(TrancheId id, const Tranche& tranche) {
    json j;
    j["id"] = tranche_to_string(id);
    j["deposit_value"] = to_decimal(tranche.deposit_value);
    j["redemption_queue_total"] = to_decimal(tranche.redemption_queue_total);
    j["redemption_queue_processed"] = to_decimal(tranche.redemption_queue_processed);
    j["total_shares"] = to_decimal(tranche.total_shares);

    j["pending_returns"] = json::array();
    for (const auto& [bucket, amount] : tranche.pending_returns) {
        j["pending_returns"].push_back({{"bucket", bucket}, {"amount", to_decimal(amount)}});
    }

    j["share_balances"] = json::object();
    for (const auto& [account, balance] : tranche.share_balances) {
        j["share_balances"][account] = to_decimal(balance);
    }

    j["redemptions"] = json::object();
    for (const auto& [account, redemption] : tranche.redemptions) {
        j["redemptions"][account] = {
            {"pending", to_decimal(redemption.pending_amount)},
            {"withdrawn", to_decimal(redemption.withdrawn_amount)},
            {"target", to_decimal(redemption.queue_target_position)}
        };
    }
    return j;
}

Tranche tranche_from_json(const json& j) {
    Tranche tranche;
    tranche.deposit_value = read_amount(j, "deposit_value");
    tranche.redemption_queue_total = read_amount(j, "redemption_queue_total");
    tranche.redemption_queue_processed = read_amount(j, "redemption_queue_processed");
    tranche.total_shares = read_amount(j, "total_shares");

    for (const auto& entry : j.at("pending_returns")) {
        tranche.pending_returns[entry.at("bucket").get<uint64_t>()] = read_amount(entry, "amount");
    }
    for (auto it = j.at("share_balances").begin(); it != j.at("share_balances").end(); ++it) {
        tranche.share_balances[it.key()] = from_decimal(it.value().get<std::string>());
    }
    for (auto it = j.at("redemptions").begin(); it != j.at("redemptions").end(); ++it) {
        tranche.redemptions[it.key()] = DepositorRedemption(
            read_amount(it.value(), "pending"),
            read_amount(it.value(), "withdrawn"),
            read_amount(it.value(), "target"));
    }
    return tranche;
}

json loan_to_json(const LoanKey& key, const Loan& loan) {
    return {
        {"note_token", key.note_token},
        {"loan_id", key.loan_id},
        {"collateral_class", loan.collateral.collateral_class},
        {"collateral_token_id", loan.collateral.token_id},
        {"borrower", loan.borrower},
        {"purchase_price", to_decimal(loan.purchase_price)},
        {"repayment_amount", to_decimal(loan.repayment_amount)},
        {"maturity", loan.maturity_timestamp},
        {"tranche_returns", {to_decimal(loan.tranche_return(TrancheId::Senior)),
                             to_decimal(loan.tranche_return(TrancheId::Junior))}},
        {"active", loan.active},
        {"liquidated", loan.liquidated},
        {"collateral_withdrawn", loan.collateral_withdrawn}
    };
}

} // anonymous namespace

json vault_state_to_json(const VaultState& state) {
    json j;

    j["balances"] = {
        {"total_cash_balance", to_decimal(state.balances.total_cash_balance)},
        {"total_loan_balance", to_decimal(state.balances.total_loan_balance)},
        {"total_reserves_balance", to_decimal(state.balances.total_reserves_balance)},
        {"total_withdrawal_balance", to_decimal(state.balances.total_withdrawal_balance)}
    };

    j["parameters"] = {
        {"senior_tranche_rate", to_decimal(state.parameters.senior_tranche_rate)},
        {"reserve_ratio", to_decimal(state.parameters.reserve_ratio)},
        {"price_tolerance", to_decimal(state.parameters.price_tolerance)},
        {"paused", state.parameters.paused},
        {"time_bucket_duration", state.parameters.timing.bucket_duration},
        {"proration_buckets", state.parameters.timing.proration_buckets}
    };

    j["tranches"] = json::array();
    for (TrancheId id : TRANCHE_PRIORITY) {
        j["tranches"].push_back(tranche_to_json(id, state.tranche(id)));
    }

    j["loans"] = json::array();
    for (const auto& [key, loan] : state.loans) {
        j["loans"].push_back(loan_to_json(key, loan));
    }

    return j;
}

VaultState vault_state_from_json(const json& j) {
    VaultState state;

    try {
        const json& balances = j.at("balances");
        state.balances.total_cash_balance = read_amount(balances, "total_cash_balance");
        state.balances.total_loan_balance = read_amount(balances, "total_loan_balance");
        state.balances.total_reserves_balance = read_amount(balances, "total_reserves_balance");
        state.balances.total_withdrawal_balance = read_amount(balances, "total_withdrawal_balance");

        const json& parameters = j.at("parameters");
        state.parameters.senior_tranche_rate = read_amount(parameters, "senior_tranche_rate");
        state.parameters.reserve_ratio = read_amount(parameters, "reserve_ratio");
        state.parameters.price_tolerance = read_amount(parameters, "price_tolerance");
        state.parameters.paused = parameters.at("paused").get<bool>();
        state.parameters.timing.bucket_duration = parameters.at("time_bucket_duration").get<uint64_t>();
        state.parameters.timing.proration_buckets = parameters.at("proration_buckets").get<uint64_t>();

        const json& tranches = j.at("tranches");
        if (tranches.size() != NUM_TRANCHES) {
            throw SnapshotFormatError("expected 2 tranches, found " + std::to_string(tranches.size()));
        }
        for (TrancheId id : TRANCHE_PRIORITY) {
            state.tranche(id) = tranche_from_json(tranches.at(tranche_index(id)));
        }

        for (const auto& entry : j.at("loans")) {
            LoanKey key(entry.at("note_token").get<std::string>(), entry.at("loan_id").get<uint64_t>());

            Loan loan;
            loan.collateral.collateral_class = entry.at("collateral_class").get<std::string>();
            loan.collateral.token_id = entry.at("collateral_token_id").get<std::string>();
            loan.borrower = entry.at("borrower").get<std::string>();
            loan.purchase_price = read_amount(entry, "purchase_price");
            loan.repayment_amount = read_amount(entry, "repayment_amount");
            loan.maturity_timestamp = entry.at("maturity").get<uint64_t>();
            const json& returns = entry.at("tranche_returns");
            loan.tranche_return(TrancheId::Senior) = from_decimal(returns.at(0).get<std::string>());
            loan.tranche_return(TrancheId::Junior) = from_decimal(returns.at(1).get<std::string>());
            loan.active = entry.at("active").get<bool>();
            loan.liquidated = entry.at("liquidated").get<bool>();
            loan.collateral_withdrawn = entry.at("collateral_withdrawn").get<bool>();

            state.loans[key] = loan;
        }
    } catch (const json::exception& e) {
        throw SnapshotFormatError(e.what());
    } catch (const std::invalid_argument& e) {
        throw SnapshotFormatError(e.what());
    } catch (const std::overflow_error& e) {
        throw SnapshotFormatError(e.what());
    }

    try {
        state.parameters.validate();
    } catch (const std::exception& e) {
        throw SnapshotFormatError(e.what());
    }

    // The pending-loan index is derived from the active loans
    for (const auto& [key, loan] : state.loans) {
        if (loan.active) {
            state.track_pending_loan(key, state.parameters.timing.bucket_of(loan.maturity_timestamp));
        }
    }

    try {
        state.check_invariants();
    } catch (const InvariantViolation& e) {
        throw SnapshotFormatError(e.what());
    } catch (const std::overflow_error& e) {
        throw SnapshotFormatError(e.what());
    }

    return state;
}

void write_vault_state_json(std::ostream& os, const VaultState& state, bool pretty_print) {
    os << vault_state_to_json(state).dump(pretty_print ? 2 : -1) << "\n";
}

void write_vault_state_json(const std::string& filepath, const VaultState& state, bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_vault_state_json(file, state, pretty_print);
}

VaultState read_vault_state_json(std::istream& is) {
    json j;
    try {
        j = json::parse(is);
    } catch (const json::parse_error& e) {
        throw SnapshotFormatError(std::string("JSON parse error: ") + e.what());
    }
    return vault_state_from_json(j);
}

VaultState read_vault_state_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open snapshot file: " + filepath);
    }
    return read_vault_state_json(file);
}

} // namespace io
} // namespace tranchevault
