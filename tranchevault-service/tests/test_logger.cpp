/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/keeper.hpp"
#include "../src/logger.hpp"
#include "test_doubles.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <vector>

using namespace tranchevault;
using namespace tranchevault::service;
using json = nlohmann::json;

namespace {

// Route the logger to a fresh file and return its path
std::string log_to_file(const std::string& path, LogLevel level = LogLevel::DEBUG, bool json_output = true) {
    std::filesystem::remove(path);

    LoggerConfig config;
    config.min_level = level;
    config.enable_console = false;
    config.enable_file = true;
    config.log_file_path = path;
    config.enable_json = json_output;
    Logger::get_instance().configure(config);
    return path;
}

std::vector<std::string> read_lines(const std::string& path) {
    Logger::get_instance().flush();

    std::vector<std::string> lines;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

void restore_quiet_logger(const std::string& path) {
    LoggerConfig config;
    config.enable_console = false;
    Logger::get_instance().configure(config);
    std::filesystem::remove(path);
}

} // anonymous namespace

TEST_CASE("Logger Configuration", "[logger]") {
    Logger& logger = Logger::get_instance();

    SECTION("Default configuration") {
        LoggerConfig config;

        REQUIRE(config.min_level == LogLevel::INFO);
        REQUIRE(config.enable_console == true);
        REQUIRE(config.enable_file == false);
        REQUIRE(config.enable_json == true);
        REQUIRE(config.log_file_path == "tranchevault.log");
    }

    SECTION("Log level filtering") {
        const std::string path = log_to_file("test_logger_levels.log", LogLevel::WARN);
        TransactionContext ctx("deposit", "alice");

        logger.log_transaction_committed(ctx, {{"amount", "1"}});
        logger.log_upkeep("check", "none", LoanKey());
        logger.log_transaction_rejected(ctx, "Paused", "Deposits are paused");

        auto lines = read_lines(path);
        REQUIRE(lines.size() == 1);
        REQUIRE(json::parse(lines[0])["event"].get<std::string>() == "transaction_rejected");
        REQUIRE(logger.get_min_level() == LogLevel::WARN);

        restore_quiet_logger(path);
    }

    SECTION("Level names") {
        REQUIRE(level_to_string(LogLevel::ERROR) == "ERROR");
        REQUIRE(string_to_level("DEBUG") == LogLevel::DEBUG);
        REQUIRE(string_to_level("bogus") == LogLevel::INFO);
    }
}

TEST_CASE("Logger transaction events", "[logger]") {
    Logger& logger = Logger::get_instance();
    const std::string path = log_to_file("test_logger_transactions.log");

    TransactionContext ctx("sell_note", "lender");
    logger.log_transaction_committed(ctx, {{"loan", "note/1"}, {"purchase_price", "5.45"}});
    logger.log_transaction_rejected(ctx, "PriceMismatch", "Offered 5, computed \"5.45\"");

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 2);

    json committed = json::parse(lines[0]);
    REQUIRE(committed["event"].get<std::string>() == "transaction_committed");
    REQUIRE(committed["level"].get<std::string>() == "INFO");
    REQUIRE(committed["operation"].get<std::string>() == "sell_note");
    REQUIRE(committed["account"].get<std::string>() == "lender");
    REQUIRE(committed["purchase_price"].get<std::string>() == "5.45");
    REQUIRE(committed.contains("timestamp"));

    json rejected = json::parse(lines[1]);
    REQUIRE(rejected["level"].get<std::string>() == "WARN");
    REQUIRE(rejected["error_code"].get<std::string>() == "PriceMismatch");
    REQUIRE(rejected["error_message"].get<std::string>() == "Offered 5, computed \"5.45\"");

    restore_quiet_logger(path);
}

TEST_CASE("Logger loan, upkeep and parameter events", "[logger]") {
    Logger& logger = Logger::get_instance();
    const std::string path = log_to_file("test_logger_loans.log");

    TransactionContext ctx("on_loan_expired", "keeper");
    logger.log_loan_event(ctx, "defaulted", LoanKey("note", 7), {{"loss", "2"}});
    logger.log_upkeep("check", "expired", LoanKey("note", 7));
    logger.log_upkeep("check", "none", LoanKey());
    logger.log_parameter_update(TransactionContext("set_paused", "admin"), "paused", "true");
    logger.log_error(ctx, "Ledger invariant violated: cash");

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 5);

    json loan = json::parse(lines[0]);
    REQUIRE(loan["event"].get<std::string>() == "loan_event");
    REQUIRE(loan["loan_event"].get<std::string>() == "defaulted");
    REQUIRE(loan["note_token"].get<std::string>() == "note");
    REQUIRE(loan["loan_id"].get<std::string>() == "7");
    REQUIRE(loan["loss"].get<std::string>() == "2");

    json upkeep = json::parse(lines[1]);
    REQUIRE(upkeep["level"].get<std::string>() == "DEBUG");
    REQUIRE(upkeep["action"].get<std::string>() == "expired");
    REQUIRE(upkeep["loan"].get<std::string>() == LoanKey("note", 7).to_string());
    REQUIRE_FALSE(json::parse(lines[2]).contains("loan"));

    json parameter = json::parse(lines[3]);
    REQUIRE(parameter["event"].get<std::string>() == "parameter_update");
    REQUIRE(parameter["parameter"].get<std::string>() == "paused");
    REQUIRE(parameter["value"].get<std::string>() == "true");

    REQUIRE(json::parse(lines[4])["level"].get<std::string>() == "ERROR");

    restore_quiet_logger(path);
}

TEST_CASE("Logger plain text output", "[logger]") {
    Logger& logger = Logger::get_instance();
    const std::string path = log_to_file("test_logger_plain.log", LogLevel::INFO, false);

    logger.log_warning(TransactionContext("withdraw", "alice"), "Nothing to withdraw");

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("[WARN] Nothing to withdraw") != std::string::npos);
    REQUIRE(lines[0].find("account=alice") != std::string::npos);

    restore_quiet_logger(path);
}

TEST_CASE("Vault transactions are logged", "[logger]") {
    using namespace tranchevault::testing;

    VaultFixture f;
    const std::string path = log_to_file("test_logger_vault.log");

    f.vault->deposit("alice", TrancheId::Senior, dec("10"));
    REQUIRE_THROWS(f.vault->deposit("alice", TrancheId::Senior, Amount(0)));

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 2);

    json committed = json::parse(lines[0]);
    REQUIRE(committed["event"].get<std::string>() == "transaction_committed");
    REQUIRE(committed["operation"].get<std::string>() == "deposit");
    REQUIRE(committed["tranche"].get<std::string>() == "senior");
    REQUIRE(committed["amount"].get<std::string>() == "10");
    REQUIRE(committed["shares"].get<std::string>() == "10");

    json rejected = json::parse(lines[1]);
    REQUIRE(rejected["event"].get<std::string>() == "transaction_rejected");
    REQUIRE(rejected["error_code"].get<std::string>() == "InvalidAmount");

    restore_quiet_logger(path);
}

TEST_CASE("Keeper warns about note tokens without an adapter", "[logger]") {
    using namespace tranchevault::testing;

    VaultFixture f;
    f.fund_tranches();
    f.adapter->add_loan(1, make_terms("5", "5.5", MATURITY));
    f.adapter->add_loan(2, make_terms("1", "1.1", MATURITY + DAY));
    f.vault->sell_note("lender", NOTE_1, dec(PRICE_1));
    f.vault->sell_note("lender", LoanKey("note", 2), f.vault->quote(LoanKey("note", 2)).purchase_price);
    f.vault->set_note_adapter("admin", "note", nullptr);
    f.clock->set(MATURITY);

    const std::string path = log_to_file("test_logger_keeper.log", LogLevel::WARN);
    Keeper keeper(*f.vault);
    REQUIRE_FALSE(keeper.check_upkeep({"note"}).has_value());

    // One warning per token, however many of its loans are due
    auto lines = read_lines(path);
    REQUIRE(lines.size() == 1);
    json warning = json::parse(lines[0]);
    REQUIRE(warning["event"].get<std::string>() == "warning");
    REQUIRE(warning["operation"].get<std::string>() == "check_upkeep");
    REQUIRE(warning["warning"].get<std::string>().find("note token note") != std::string::npos);

    restore_quiet_logger(path);
}
