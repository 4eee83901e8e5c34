#include "access_guard/rbac/permission_registry.hpp"
#include "access_guard/core/error_codes.hpp"

namespace access_guard {
namespace rbac {

using common::Permission;
using common::Role;
using common::SecurityLevel;

PermissionRegistry::PermissionRegistry() {
    const auto& everything = common::allPermissions();

    roles_[Role::ADMIN] = {
        Role::ADMIN,
        "Full system access",
        common::PermissionSet(everything.begin(), everything.end()),
        SecurityLevel::CRITICAL
    };

    roles_[Role::MANAGER] = {
        Role::MANAGER,
        "Management access with user oversight",
        {
            Permission::READ_USER, Permission::UPDATE_USER,
            Permission::READ_BANK_DATA, Permission::VIEW_BALANCES,
            Permission::VIEW_TRANSACTIONS, Permission::VIEW_ANALYTICS,
            Permission::VIEW_AUDIT_LOGS, Permission::VIEW_SECURITY_ALERTS
        },
        SecurityLevel::HIGH
    };

    roles_[Role::ANALYST] = {
        Role::ANALYST,
        "Data analysis and reporting access",
        {
            Permission::READ_BANK_DATA, Permission::VIEW_BALANCES,
            Permission::VIEW_TRANSACTIONS, Permission::VIEW_ANALYTICS,
            Permission::VIEW_AUDIT_LOGS
        },
        SecurityLevel::MEDIUM
    };

    roles_[Role::SUPPORT] = {
        Role::SUPPORT,
        "Customer support access",
        {
            Permission::READ_USER, Permission::READ_BANK_DATA, Permission::VIEW_BALANCES
        },
        SecurityLevel::MEDIUM
    };

    roles_[Role::USER] = {
        Role::USER,
        "Standard user access",
        {
            Permission::READ_BANK_DATA, Permission::VIEW_BALANCES, Permission::VIEW_TRANSACTIONS
        },
        SecurityLevel::LOW
    };

    roles_[Role::READ_ONLY] = {
        Role::READ_ONLY,
        "Read-only access",
        {
            Permission::READ_BANK_DATA, Permission::VIEW_BALANCES
        },
        SecurityLevel::LOW
    };
}

const common::RoleDefinition& PermissionRegistry::definition(Role role) const {
    auto it = roles_.find(role);
    if (it == roles_.end()) {
        throw core::GuardError(core::GuardErrorCode::UNKNOWN_ROLE,
                               std::to_string(static_cast<int>(role)));
    }
    return it->second;
}

const common::PermissionSet& PermissionRegistry::rolePermissions(Role role) const {
    return definition(role).permissions;
}

Role PermissionRegistry::resolve(const std::string& role_name) const {
    return common::parseRole(role_name);
}

Permission PermissionRegistry::resolvePermission(const std::string& permission_name) const {
    return common::parsePermission(permission_name);
}

bool PermissionRegistry::roleHas(Role role, Permission permission) const {
    const auto& permissions = rolePermissions(role);
    return permissions.find(permission) != permissions.end();
}

}}
