/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace tranchevault {
namespace service {

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() = default;

Logger::~Logger() {
    flush();
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_transaction_committed(
    const TransactionContext& ctx,
    const std::map<std::string, std::string>& fields
) {
    std::map<std::string, std::string> event_fields = fields;
    event_fields["event"] = "transaction_committed";
    event_fields["operation"] = ctx.operation;
    event_fields["account"] = ctx.account;

    log(LogLevel::INFO, "Transaction committed", event_fields);
}

void Logger::log_transaction_rejected(
    const TransactionContext& ctx,
    const std::string& error_code,
    const std::string& error_message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "transaction_rejected";
    fields["operation"] = ctx.operation;
    fields["account"] = ctx.account;
    fields["error_code"] = error_code;
    fields["error_message"] = error_message;

    log(LogLevel::WARN, "Transaction rejected", fields);
}

void Logger::log_loan_event(
    const TransactionContext& ctx,
    const std::string& loan_event,
    const LoanKey& key,
    const std::map<std::string, std::string>& fields
) {
    std::map<std::string, std::string> event_fields = fields;
    event_fields["event"] = "loan_event";
    event_fields["loan_event"] = loan_event;
    event_fields["note_token"] = key.note_token;
    event_fields["loan_id"] = std::to_string(key.loan_id);
    event_fields["operation"] = ctx.operation;
    event_fields["account"] = ctx.account;

    log(LogLevel::INFO, "Loan " + loan_event, event_fields);
}

void Logger::log_upkeep(
    const std::string& phase,
    const std::string& action,
    const LoanKey& key
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "upkeep";
    fields["phase"] = phase;
    fields["action"] = action;
    if (action != "none") {
        fields["loan"] = key.to_string();
    }

    // Checks run on every keeper poll
    log(phase == "check" ? LogLevel::DEBUG : LogLevel::INFO, "Keeper upkeep", fields);
}

void Logger::log_parameter_update(
    const TransactionContext& ctx,
    const std::string& parameter,
    const std::string& value
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "parameter_update";
    fields["account"] = ctx.account;
    fields["parameter"] = parameter;
    fields["value"] = value;

    log(LogLevel::INFO, "Parameter updated", fields);
}

void Logger::log_error(
    const TransactionContext& ctx,
    const std::string& error_message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    fields["operation"] = ctx.operation;
    fields["account"] = ctx.account;
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Vault error", fields);
}

void Logger::log_warning(
    const TransactionContext& ctx,
    const std::string& warning_message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    fields["operation"] = ctx.operation;
    fields["account"] = ctx.account;
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < config_.min_level) {
        return;
    }

    if (config_.enable_json) {
        nlohmann::json line(fields);
        line["timestamp"] = get_timestamp();
        line["level"] = level_to_string(level);
        line["message"] = message;
        // Replace invalid UTF-8 in caller-supplied text instead of throwing
        write_output(line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        return;
    }

    std::ostringstream oss;
    oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;
    const char* separator = " {";
    for (const auto& [key, value] : fields) {
        oss << separator << key << "=" << value;
        separator = ", ";
    }
    if (!fields.empty()) {
        oss << "}";
    }
    write_output(oss.str());
}

std::string Logger::get_timestamp() const {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm utc;
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << "."
        << std::setfill('0') << std::setw(3) << millis << "Z";
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << '\n';
    }
    if (file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << '\n';
    }
}

} // namespace service
} // namespace tranchevault
