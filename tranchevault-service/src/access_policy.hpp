/**
 * @file access_policy.hpp
 * @brief Capability checks for privileged vault operations
 */

#ifndef TRANCHEVAULT_SERVICE_ACCESS_POLICY_HPP
#define TRANCHEVAULT_SERVICE_ACCESS_POLICY_HPP

#include <map>
#include <set>
#include <string>
#include "tranche.hpp"

namespace tranchevault {
namespace service {

/**
 * @brief Privileges an account can hold
 */
enum class Capability {
    ADMIN,                  ///< Parameter administration, pause, note adapters
    COLLATERAL_LIQUIDATOR   ///< Withdraws and sells foreclosed collateral
};

inline std::string capability_to_string(Capability capability) {
    switch (capability) {
        case Capability::ADMIN: return "ADMIN";
        case Capability::COLLATERAL_LIQUIDATOR: return "COLLATERAL_LIQUIDATOR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Decides whether an account may exercise a capability
 */
class IAccessPolicy {
public:
    virtual ~IAccessPolicy() = default;

    virtual bool is_authorized(const AccountId& account, Capability capability) const = 0;
};

/**
 * @brief Role table: explicit grants per capability
 */
class RoleBasedAccessPolicy : public IAccessPolicy {
public:
    void grant(const AccountId& account, Capability capability);
    void revoke(const AccountId& account, Capability capability);

    bool is_authorized(const AccountId& account, Capability capability) const override;

private:
    std::map<Capability, std::set<AccountId>> grants_;
};

/**
 * @brief Throw AuthorizationError unless the account holds the capability
 */
void require_capability(const IAccessPolicy& policy, const AccountId& account, Capability capability);

} // namespace service
} // namespace tranchevault

#endif // TRANCHEVAULT_SERVICE_ACCESS_POLICY_HPP
