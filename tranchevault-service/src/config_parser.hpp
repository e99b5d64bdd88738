#ifndef TRANCHEVAULT_SERVICE_CONFIG_PARSER_HPP
#define TRANCHEVAULT_SERVICE_CONFIG_PARSER_HPP

#include "vault_config.hpp"
#include <stdexcept>
#include <string>

namespace tranchevault {
namespace service {

/**
 * @brief Exception thrown when config file parsing fails
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Parses a vault configuration from a JSON file
 *
 * A relative log file path is resolved against the config file's directory.
 *
 * @param file_path Path to the JSON configuration file
 * @return Parsed vault configuration
 * @throws ConfigParseError if file cannot be read, JSON is invalid or a rate model is malformed
 * @throws VaultConfigError if configuration is invalid
 */
VaultConfig parse_vault_config_from_file(const std::string& file_path);

/**
 * @brief Parses a vault configuration from a JSON string
 *
 * Rates (senior tranche rate, minimum discount rate, rate model rates) are
 * annual decimals and are normalized to per-second rates. Duration model
 * kink and max are seconds.
 *
 * @param json_string JSON configuration as string
 * @return Parsed vault configuration
 * @throws ConfigParseError if JSON is invalid or a rate model is malformed
 * @throws VaultConfigError if configuration is invalid
 */
VaultConfig parse_vault_config_from_string(const std::string& json_string);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME
 *
 * @param value String potentially containing variable references
 * @return String with variables expanded
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves file paths relative to config file directory
 *
 * @param path File path to resolve
 * @param config_file_path Path to the configuration file
 * @return Path unchanged when absolute, else joined to the config directory
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace service
} // namespace tranchevault

#endif // TRANCHEVAULT_SERVICE_CONFIG_PARSER_HPP
