#pragma once

#include <map>
#include <set>

#include "engine/types.hpp"

namespace tollgate::engine {

class Authorizer {
  public:
    virtual ~Authorizer() = default;
    virtual bool has_role(Role role, const Address &subject) const = 0;
};

// Throws Unauthorized when the caller lacks the role.
void require_role(const Authorizer &authorizer, Role role, const Address &caller);

// In-memory role table. The root admin can grant and revoke every role,
// including Admin itself.
class RoleRegistry : public Authorizer {
  public:
    explicit RoleRegistry(const Address &root_admin);

    bool has_role(Role role, const Address &subject) const override;
    void grant_role(const Address &caller, Role role, const Address &account);
    void revoke_role(const Address &caller, Role role, const Address &account);

  private:
    std::map<Role, std::set<Address>> members_;
};

}  // namespace tollgate::engine
