#ifndef TRANCHEVAULT_IO_STATE_JSON_HPP
#define TRANCHEVAULT_IO_STATE_JSON_HPP

#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "../vault_state.hpp"

namespace tranchevault {
namespace io {

// Raised when a snapshot cannot be read back into a VaultState
class SnapshotFormatError : public std::runtime_error {
public:
    explicit SnapshotFormatError(const std::string& message)
        : std::runtime_error("Invalid vault snapshot: " + message) {}
};

// Ledger snapshot: tranches (with share balances, redemptions and scheduled
// returns), loans, the pending-loan index, balances and parameters.
// Amounts are fixed-point decimal strings so no precision is lost.
nlohmann::json vault_state_to_json(const VaultState& state);
VaultState vault_state_from_json(const nlohmann::json& j);

void write_vault_state_json(std::ostream& os, const VaultState& state, bool pretty_print = true);
void write_vault_state_json(const std::string& filepath, const VaultState& state,
                            bool pretty_print = true);

VaultState read_vault_state_json(std::istream& is);
VaultState read_vault_state_json(const std::string& filepath);

} // namespace io
} // namespace tranchevault

#endif // TRANCHEVAULT_IO_STATE_JSON_HPP
