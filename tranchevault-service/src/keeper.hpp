/**
 * @file keeper.hpp
 * @brief Automated servicing of loans reaching maturity
 */

#ifndef TRANCHEVAULT_SERVICE_KEEPER_HPP
#define TRANCHEVAULT_SERVICE_KEEPER_HPP

#include "vault_service.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tranchevault {
namespace service {

/**
 * @brief Servicing action a loan needs; values are the upkeep codes
 */
enum class UpkeepCode : uint8_t {
    REPAID = 0,
    LIQUIDATED = 1,
    EXPIRED = 2
};

inline std::string upkeep_code_to_string(UpkeepCode code) {
    switch (code) {
        case UpkeepCode::REPAID: return "repaid";
        case UpkeepCode::LIQUIDATED: return "liquidated";
        case UpkeepCode::EXPIRED: return "expired";
        default: return "unknown";
    }
}

struct UpkeepAction {
    UpkeepCode code;
    LoanKey key;

    UpkeepAction() : code(UpkeepCode::REPAID) {}
    UpkeepAction(UpkeepCode code_, const LoanKey& key_) : code(code_), key(key_) {}

    bool operator==(const UpkeepAction& other) const {
        return code == other.code && key == other.key;
    }
};

/**
 * @brief Finds and services loans maturing in the previous or current time bucket
 *
 * Usage Example:
 *   @code
 *   Keeper keeper(vault);
 *   while (auto action = keeper.check_upkeep({"note"})) {
 *       keeper.perform_upkeep("keeper", *action);
 *   }
 *   @endcode
 */
class Keeper {
public:
    explicit Keeper(VaultService& vault);

    /**
     * @brief First loan needing service among the given note tokens
     *
     * Loans are asked, in order, whether they were repaid, liquidated on their
     * platform or have expired. Note tokens without an adapter are skipped.
     *
     * @return Action to perform, or std::nullopt when nothing is due
     */
    std::optional<UpkeepAction> check_upkeep(const std::vector<std::string>& note_tokens) const;

    /**
     * @brief Dispatch an action to the matching vault operation
     *
     * @throws InputValidationError(PARAMETER_OUT_OF_RANGE) for an unknown code
     */
    void perform_upkeep(const AccountId& caller, const UpkeepAction& action);

private:
    VaultService& vault_;
    Logger* logger_;
};

} // namespace service
} // namespace tranchevault

#endif // TRANCHEVAULT_SERVICE_KEEPER_HPP
