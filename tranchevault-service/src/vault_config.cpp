#include "vault_config.hpp"
#include "vault_error.hpp"

namespace tranchevault {
namespace service {

void validate_vault_config(const VaultConfig& config) {
    try {
        config.parameters.validate();
    } catch (const VaultError& e) {
        throw VaultConfigError(std::string("Invalid vault parameters: ") + e.what());
    }

    if (config.utilization_model.max() < fixed_point::one()) {
        throw VaultConfigError("Utilization model max " + fixed_point::to_decimal(config.utilization_model.max()) +
                               " must cover full utilization (1.0)");
    }

    for (const auto& [collateral_class, entry] : config.collateral) {
        if (collateral_class.empty()) {
            throw VaultConfigError("Collateral class cannot be empty");
        }
        try {
            entry.parameters.validate();
        } catch (const VaultError& e) {
            throw VaultConfigError("Collateral '" + collateral_class + "': " + e.what());
        }
    }
}

} // namespace service
} // namespace tranchevault
