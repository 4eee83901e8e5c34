#include <gtest/gtest.h>

#include "access_guard/rbac/permission_registry.hpp"
#include "access_guard/core/error_codes.hpp"

using namespace access_guard;
using common::Permission;
using common::Role;

class PermissionRegistryTest : public ::testing::Test {
protected:
    rbac::PermissionRegistry registry_;
};

TEST_F(PermissionRegistryTest, Admin_HoldsEveryPermission) {
    EXPECT_EQ(registry_.rolePermissions(Role::ADMIN).size(), common::allPermissions().size());
    EXPECT_EQ(registry_.definition(Role::ADMIN).security_level, common::SecurityLevel::CRITICAL);
}

TEST_F(PermissionRegistryTest, EveryRole_HasDefinition) {
    for (auto role : common::allRoles()) {
        EXPECT_FALSE(registry_.definition(role).description.empty()) << common::to_string(role);
    }
}

TEST_F(PermissionRegistryTest, Manager_OversightWithoutAdministration) {
    EXPECT_TRUE(registry_.roleHas(Role::MANAGER, Permission::UPDATE_USER));
    EXPECT_TRUE(registry_.roleHas(Role::MANAGER, Permission::VIEW_SECURITY_ALERTS));
    EXPECT_FALSE(registry_.roleHas(Role::MANAGER, Permission::SYSTEM_ADMIN));
    EXPECT_FALSE(registry_.roleHas(Role::MANAGER, Permission::EXPORT_BANK_DATA));
}

TEST_F(PermissionRegistryTest, Support_CanReadUsersButNotTransactions) {
    EXPECT_TRUE(registry_.roleHas(Role::SUPPORT, Permission::READ_USER));
    EXPECT_FALSE(registry_.roleHas(Role::SUPPORT, Permission::VIEW_TRANSACTIONS));
}

TEST_F(PermissionRegistryTest, ReadOnly_IsSubsetOfUser) {
    const auto& user = registry_.rolePermissions(Role::USER);
    for (auto permission : registry_.rolePermissions(Role::READ_ONLY)) {
        EXPECT_EQ(user.count(permission), 1u) << common::to_string(permission);
    }
    EXPECT_EQ(registry_.rolePermissions(Role::READ_ONLY).size(), 2u);
}

TEST_F(PermissionRegistryTest, Resolve_ByWireName) {
    EXPECT_EQ(registry_.resolve("analyst"), Role::ANALYST);
    EXPECT_EQ(registry_.resolvePermission("view_analytics"), Permission::VIEW_ANALYTICS);
}

TEST_F(PermissionRegistryTest, Resolve_UnknownRole_Throws) {
    EXPECT_THROW(registry_.resolve("root"), core::GuardError);
}
