/**
 * @file logger.hpp
 * @brief Structured logging for the vault service with JSON output
 *
 * One process-wide logger. Every ledger transaction produces exactly one
 * committed or rejected line keyed by operation and calling account; loan
 * transitions, keeper scans and parameter changes get their own events.
 */

#ifndef TRANCHEVAULT_SERVICE_LOGGER_HPP
#define TRANCHEVAULT_SERVICE_LOGGER_HPP

#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "loan.hpp"

namespace tranchevault {
namespace service {

// Severity, lowest first
enum class LogLevel {
    DEBUG,   ///< Detailed debugging information (quotes, upkeep scans)
    INFO,    ///< Informational messages (committed transactions, loan events)
    WARN,    ///< Warning messages (rejected transactions)
    ERROR    ///< Ledger invariant failures
};

inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

// Unrecognized names fall back to INFO
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

/**
 * @brief Transaction context for logging
 */
struct TransactionContext {
    std::string operation;   ///< Service operation, e.g. "deposit", "sell_note"
    std::string account;     ///< Calling account

    TransactionContext() = default;

    TransactionContext(const std::string& op, const std::string& caller)
        : operation(op), account(caller) {}
};

/**
 * @brief Output routing, set from the "logging" config section
 */
struct LoggerConfig {
    LogLevel min_level;
    bool enable_console;             ///< stderr
    bool enable_file;
    std::string log_file_path;       ///< Appended to, never truncated
    bool enable_json;                ///< One JSON object per line, else plain text

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("tranchevault.log"),
          enable_json(true) {}
};

/**
 * @brief Vault event logger
 *
 * Usage:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   config.log_file_path = "vault.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   TransactionContext ctx("deposit", "alice");
 *   logger.log_transaction_committed(ctx, {{"tranche", "senior"}, {"amount", "10"}});
 *   @endcode
 */
class Logger {
public:
    static Logger& get_instance();

    // Reopens the log file when file output is enabled
    void configure(const LoggerConfig& config);

    /**
     * @brief Log a committed ledger transaction
     *
     * @param ctx Transaction context
     * @param fields Operation-specific fields (amounts as decimal strings)
     */
    void log_transaction_committed(
        const TransactionContext& ctx,
        const std::map<std::string, std::string>& fields
    );

    /**
     * @brief Log a rejected transaction; the committed state is unchanged
     *
     * @param ctx Transaction context
     * @param error_code Error code name, e.g. "PriceMismatch"
     * @param error_message Error message
     */
    void log_transaction_rejected(
        const TransactionContext& ctx,
        const std::string& error_code,
        const std::string& error_message
    );

    /**
     * @brief Log a loan lifecycle transition
     *
     * @param ctx Transaction context
     * @param loan_event "purchased", "repaid", "defaulted", "collateral_liquidated"
     *                   or "collateral_withdrawn"
     * @param key Loan identifier
     * @param fields Event-specific fields
     */
    void log_loan_event(
        const TransactionContext& ctx,
        const std::string& loan_event,
        const LoanKey& key,
        const std::map<std::string, std::string>& fields
    );

    /**
     * @brief Log a keeper upkeep check or action
     *
     * @param phase "check" or "perform"
     * @param action Upkeep action name, "none" when nothing is due
     * @param key Loan identifier (ignored when action is "none")
     */
    void log_upkeep(
        const std::string& phase,
        const std::string& action,
        const LoanKey& key
    );

    /**
     * @brief Log an administrative parameter change
     *
     * @param ctx Transaction context
     * @param parameter Parameter name
     * @param value New value, rendered as text
     */
    void log_parameter_update(
        const TransactionContext& ctx,
        const std::string& parameter,
        const std::string& value
    );

    // ERROR level; reserved for broken ledger invariants
    void log_error(
        const TransactionContext& ctx,
        const std::string& error_message
    );

    void log_warning(
        const TransactionContext& ctx,
        const std::string& warning_message
    );

    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::string get_timestamp() const;
    void write_output(const std::string& output);
};

} // namespace service
} // namespace tranchevault

#endif // TRANCHEVAULT_SERVICE_LOGGER_HPP
