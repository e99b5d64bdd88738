#include "config_parser.hpp"
#include "vault_error.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace tranchevault {
namespace service {

using fixed_point::from_decimal;
using fixed_point::from_integer;
using fixed_point::normalize_rate;

namespace {

// Amounts are written as decimal strings; unsigned integers are accepted too.
// Floating-point literals are refused since they cannot be read exactly.
Amount read_decimal(const json& j, const std::string& key, const std::string& where) {
    if (!j.contains(key)) {
        throw ConfigParseError(where + " missing required field: " + key);
    }
    const json& value = j.at(key);
    std::string text;
    if (value.is_string()) {
        text = value.get<std::string>();
    } else if (value.is_number_unsigned()) {
        text = std::to_string(value.get<uint64_t>());
    } else {
        throw ConfigParseError(where + "." + key + " must be a decimal string");
    }

    try {
        return from_decimal(text);
    } catch (const std::invalid_argument& e) {
        throw ConfigParseError(where + "." + key + ": " + e.what());
    } catch (const std::overflow_error& e) {
        throw ConfigParseError(where + "." + key + " exceeds the 256-bit amount range: " + text);
    }
}

Amount read_annual_rate(const json& j, const std::string& key, const std::string& where) {
    return normalize_rate(read_decimal(j, key, where));
}

uint64_t read_seconds(const json& j, const std::string& key, const std::string& where) {
    if (!j.contains(key)) {
        throw ConfigParseError(where + " missing required field: " + key);
    }
    if (!j.at(key).is_number_unsigned()) {
        throw ConfigParseError(where + "." + key + " must be a non-negative integer");
    }
    return j.at(key).get<uint64_t>();
}

// {"min_rate", "target_rate", "max_rate", "kink", "max"}; rates are annual.
// Duration models give kink and max in seconds.
RateModel parse_rate_model(const json& j, const std::string& where, bool kink_in_seconds) {
    Amount min_rate = read_annual_rate(j, "min_rate", where);
    Amount target_rate = read_annual_rate(j, "target_rate", where);
    Amount max_rate = read_annual_rate(j, "max_rate", where);

    Amount kink = kink_in_seconds ? from_integer(read_seconds(j, "kink", where))
                                  : read_decimal(j, "kink", where);
    Amount max = kink_in_seconds ? from_integer(read_seconds(j, "max", where))
                                 : read_decimal(j, "max", where);

    try {
        return RateModel::from_target_rates(min_rate, target_rate, max_rate, kink, max);
    } catch (const VaultError& e) {
        throw ConfigParseError(where + ": " + e.what());
    }
}

CollateralConfig parse_collateral(const json& j, const std::string& collateral_class) {
    const std::string where = "collateral." + collateral_class;
    CollateralConfig entry;

    entry.parameters.enabled = j.contains("enabled") ? j["enabled"].get<bool>() : true;
    entry.value = read_decimal(j, "value", where);

    if (!j.contains("loan_to_value_model")) {
        throw ConfigParseError(where + " missing required field: loan_to_value_model");
    }
    entry.parameters.loan_to_value_model =
        parse_rate_model(j["loan_to_value_model"], where + ".loan_to_value_model", false);

    if (!j.contains("duration_model")) {
        throw ConfigParseError(where + " missing required field: duration_model");
    }
    entry.parameters.duration_model =
        parse_rate_model(j["duration_model"], where + ".duration_model", true);

    if (!j.contains("weights")) {
        throw ConfigParseError(where + " missing required field: weights");
    }
    const json& weights = j["weights"];
    if (!weights.is_array() || weights.size() != entry.parameters.weights.size()) {
        throw ConfigParseError(where + ".weights must list utilization, loan-to-value and duration weights");
    }
    for (size_t i = 0; i < weights.size(); ++i) {
        // get<uint32_t>() would wrap negative or oversized integers
        if (!weights[i].is_number_unsigned() || weights[i].get<uint64_t>() > 100) {
            throw ConfigParseError(where + ".weights[" + std::to_string(i) +
                                   "] must be an integer between 0 and 100");
        }
        entry.parameters.weights[i] = static_cast<uint32_t>(weights[i].get<uint64_t>());
    }

    return entry;
}

LoggerConfig parse_logging(const json& j) {
    LoggerConfig logging;
    if (j.contains("level")) {
        logging.min_level = string_to_level(j["level"].get<std::string>());
    }
    if (j.contains("console")) {
        logging.enable_console = j["console"].get<bool>();
    }
    if (j.contains("json")) {
        logging.enable_json = j["json"].get<bool>();
    }
    if (j.contains("file")) {
        logging.enable_file = true;
        logging.log_file_path = expand_environment_variables(j["file"].get<std::string>());
    }
    return logging;
}

} // anonymous namespace

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++; // Skip '{'
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces && pos < result.size() && result[pos] == '}') {
            pos++; // Skip '}'
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);

    if (p.is_absolute()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

VaultConfig parse_vault_config_from_string(const std::string& json_string) {
    VaultConfig config;

    try {
        json j = json::parse(json_string);

        // Vault parameters
        Amount senior_rate = read_annual_rate(j, "senior_tranche_rate", "config");
        if (senior_rate == 0) {
            throw ConfigParseError("senior_tranche_rate normalizes to zero per second");
        }
        config.parameters.senior_tranche_rate = senior_rate;

        if (j.contains("reserve_ratio")) {
            config.parameters.reserve_ratio = read_decimal(j, "reserve_ratio", "config");
        }
        if (j.contains("price_tolerance")) {
            config.parameters.price_tolerance = read_decimal(j, "price_tolerance", "config");
        }
        if (j.contains("paused")) {
            config.parameters.paused = j["paused"].get<bool>();
        }
        if (j.contains("time_bucket_duration")) {
            config.parameters.timing.bucket_duration = read_seconds(j, "time_bucket_duration", "config");
        }
        if (j.contains("proration_buckets")) {
            config.parameters.timing.proration_buckets = read_seconds(j, "proration_buckets", "config");
        }

        // Pricing
        if (j.contains("minimum_loan_duration")) {
            config.minimum_loan_duration = read_seconds(j, "minimum_loan_duration", "config");
        }
        if (j.contains("minimum_discount_rate")) {
            config.minimum_discount_rate = read_annual_rate(j, "minimum_discount_rate", "config");
        }

        if (!j.contains("utilization_model")) {
            throw ConfigParseError("Missing required field: utilization_model");
        }
        config.utilization_model = parse_rate_model(j["utilization_model"], "utilization_model", false);

        if (j.contains("collateral")) {
            for (auto it = j["collateral"].begin(); it != j["collateral"].end(); ++it) {
                config.collateral[it.key()] = parse_collateral(it.value(), it.key());
            }
        }

        if (j.contains("logging")) {
            config.logging = parse_logging(j["logging"]);
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    validate_vault_config(config);

    return config;
}

VaultConfig parse_vault_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    VaultConfig config = parse_vault_config_from_string(buffer.str());

    if (config.logging.enable_file) {
        config.logging.log_file_path = resolve_relative_path(config.logging.log_file_path, file_path);
    }

    return config;
}

} // namespace service
} // namespace tranchevault
