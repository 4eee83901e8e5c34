#pragma once

#include "../common/types.hpp"
#include <map>
#include <string>

namespace access_guard {
namespace rbac {

// Static role table. Immutable after construction, so concurrent reads
// need no locking.
class PermissionRegistry {
public:
    PermissionRegistry();

    const common::PermissionSet& rolePermissions(common::Role role) const;
    const common::RoleDefinition& definition(common::Role role) const;

    common::Role resolve(const std::string& role_name) const;
    common::Permission resolvePermission(const std::string& permission_name) const;

    bool roleHas(common::Role role, common::Permission permission) const;

private:
    std::map<common::Role, common::RoleDefinition> roles_;
};

}}
