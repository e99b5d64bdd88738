#include "access_policy.hpp"
#include "vault_error.hpp"

namespace tranchevault {
namespace service {

void RoleBasedAccessPolicy::grant(const AccountId& account, Capability capability) {
    grants_[capability].insert(account);
}

void RoleBasedAccessPolicy::revoke(const AccountId& account, Capability capability) {
    auto it = grants_.find(capability);
    if (it == grants_.end()) {
        return;
    }
    it->second.erase(account);
}

bool RoleBasedAccessPolicy::is_authorized(const AccountId& account, Capability capability) const {
    auto it = grants_.find(capability);
    return it != grants_.end() && it->second.count(account) > 0;
}

void require_capability(const IAccessPolicy& policy, const AccountId& account, Capability capability) {
    if (!policy.is_authorized(account, capability)) {
        throw AuthorizationError(account + " lacks capability " + capability_to_string(capability));
    }
}

} // namespace service
} // namespace tranchevault
