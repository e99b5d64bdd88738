#ifndef TRANCHEVAULT_SERVICE_VAULT_CONFIG_HPP
#define TRANCHEVAULT_SERVICE_VAULT_CONFIG_HPP

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include "collateral.hpp"
#include "logger.hpp"
#include "rate_model.hpp"
#include "vault_state.hpp"

namespace tranchevault {
namespace service {

/**
 * @brief Exception thrown when a vault configuration is invalid
 */
class VaultConfigError : public std::runtime_error {
public:
    explicit VaultConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Pricing parameters and oracle valuation of one collateral class
 */
struct CollateralConfig {
    CollateralRiskParameters parameters;
    Amount value;   // Collateral oracle valuation per token

    CollateralConfig() = default;
    CollateralConfig(const CollateralRiskParameters& params, const Amount& value_)
        : parameters(params), value(value_) {}
};

/**
 * @brief Everything needed to stand up a vault service
 *
 * Rates are per-second fixed-point here; the parser converts the annual
 * decimals found in configuration files.
 */
struct VaultConfig {
    VaultParameters parameters;
    RateModel utilization_model;
    std::map<std::string, CollateralConfig> collateral;   // Keyed by collateral class
    Amount minimum_discount_rate;
    uint64_t minimum_loan_duration;                       // Seconds
    LoggerConfig logging;

    VaultConfig() : minimum_loan_duration(0) {}
};

/**
 * @brief Validates a vault configuration
 *
 * Checks performed:
 * - Vault parameters are within bounds (senior rate, reserve ratio, time buckets)
 * - The utilization model accepts every utilization up to 1.0
 * - Collateral classes are named and their weights sum to 100
 *
 * @throws VaultConfigError describing the first problem found
 */
void validate_vault_config(const VaultConfig& config);

} // namespace service
} // namespace tranchevault

#endif // TRANCHEVAULT_SERVICE_VAULT_CONFIG_HPP
