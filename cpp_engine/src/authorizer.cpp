#include "engine/authorizer.hpp"

#include "engine/errors.hpp"
#include "utils/logger.hpp"

namespace tollgate::engine {

void require_role(const Authorizer &authorizer, Role role, const Address &caller) {
    if (!authorizer.has_role(role, caller)) {
        throw EngineError(ErrorCode::Unauthorized, display(caller) + " lacks role " + role_name(role));
    }
}

RoleRegistry::RoleRegistry(const Address &root_admin) {
    if (root_admin.is_zero()) {
        throw EngineError(ErrorCode::ZeroAddress, "root admin must not be the zero address");
    }
    members_[Role::Admin].insert(root_admin);
}

bool RoleRegistry::has_role(Role role, const Address &subject) const {
    auto it = members_.find(role);
    return it != members_.end() && it->second.count(subject) > 0;
}

void RoleRegistry::grant_role(const Address &caller, Role role, const Address &account) {
    require_role(*this, Role::Admin, caller);
    if (account.is_zero()) {
        throw EngineError(ErrorCode::ZeroAddress, "cannot grant a role to the zero address");
    }
    members_[role].insert(account);
    utils::info(std::string("role ") + role_name(role) + " granted to " + account.str());
}

void RoleRegistry::revoke_role(const Address &caller, Role role, const Address &account) {
    require_role(*this, Role::Admin, caller);
    members_[role].erase(account);
    utils::info(std::string("role ") + role_name(role) + " revoked from " + account.str());
}

}  // namespace tollgate::engine
