#include "access_guard/rbac/user_access_store.hpp"
#include "access_guard/common/logger.hpp"
#include "access_guard/core/error_codes.hpp"
#include <functional>
#include <mutex>

namespace access_guard {
namespace rbac {

namespace keys = constants::metadata_keys;
namespace resources = constants::resources;
using common::ActivityType;
using common::Permission;

std::string to_string(DenyReason reason) {
    switch (reason) {
        case DenyReason::NONE: return "none";
        case DenyReason::NO_ACCESS_RECORD: return "no_access_record";
        case DenyReason::ACCOUNT_LOCKED: return "account_locked";
        case DenyReason::PERMISSION_MISSING: return "permission_missing";
        case DenyReason::RESOURCE_DENIED: return "resource_access_denied";
        case DenyReason::CONSENT_REQUIRED: return "consent_required";
        case DenyReason::INTERNAL_ERROR: return "internal_error";
    }
    return "unknown";
}

UserAccessStore::UserAccessStore(const common::RbacConfig& rbac,
                                 const common::ConsentConfig& consent,
                                 StoreCollaborators collaborators)
    : lockout_threshold_(rbac.lockout_threshold),
      session_timeout_minutes_(rbac.session_timeout_minutes),
      deps_(collaborators) {
    for (const auto& [resource, type_name] : consent.gated_resources) {
        gated_resources_[resource] = common::parseConsentType(type_name);
    }
}

UserAccessStore::Shard& UserAccessStore::shardFor(const std::string& user_id) {
    return shards_[std::hash<std::string>{}(user_id) % shards_.size()];
}

const UserAccessStore::Shard& UserAccessStore::shardFor(const std::string& user_id) const {
    return shards_[std::hash<std::string>{}(user_id) % shards_.size()];
}

common::UserAccess UserAccessStore::makeRecord(const std::string& user_id, common::Role role) const {
    const auto& definition = deps_.registry.definition(role);

    common::UserAccess record;
    record.user_id = user_id;
    record.role = role;
    record.permissions = definition.permissions;
    record.security_level = definition.security_level;
    record.session_timeout_minutes = session_timeout_minutes_;
    return record;
}

AccessDecision UserAccessStore::validateAccess(const std::string& user_id,
                                               Permission permission,
                                               const std::optional<std::string>& resource_type,
                                               const std::optional<std::string>& resource_id) const {
    std::optional<common::UserAccess> record = find(user_id);
    if (!record) {
        return {false, DenyReason::NO_ACCESS_RECORD};
    }
    if (record->is_locked) {
        return {false, DenyReason::ACCOUNT_LOCKED};
    }
    if (record->permissions.count(permission) == 0) {
        return {false, DenyReason::PERMISSION_MISSING};
    }

    if (resource_type && resource_id) {
        if (*resource_type == resources::BANK_ACCOUNT) {
            if (!deps_.compliance.validateBankDataAccess(user_id, *resource_id, common::to_string(permission))) {
                return {false, DenyReason::RESOURCE_DENIED};
            }
        } else if (*resource_type == resources::USER) {
            if (*resource_id != user_id && record->permissions.count(Permission::SYSTEM_ADMIN) == 0) {
                return {false, DenyReason::RESOURCE_DENIED};
            }
        }
    }

    if (resource_type) {
        auto gated = gated_resources_.find(*resource_type);
        if (gated != gated_resources_.end() && !deps_.consents.hasConsent(user_id, gated->second)) {
            return {false, DenyReason::CONSENT_REQUIRED};
        }
    }

    return {true, DenyReason::NONE};
}

bool UserAccessStore::checkPermission(const std::string& user_id,
                                      Permission permission,
                                      const std::optional<std::string>& resource_type,
                                      const std::optional<std::string>& resource_id) {
    auto& logger = common::Logger::instance();

    AccessDecision decision;
    try {
        decision = validateAccess(user_id, permission, resource_type, resource_id);
    } catch (const std::exception& e) {
        common::ErrorContext ctx{"Access", user_id, {{"permission", common::to_string(permission)}, {"error", e.what()}}};
        logger.error("[Access] Permission check failed, denying | {}", common::formatContext(ctx));
        decision = {false, DenyReason::INTERNAL_ERROR};
    }

    nlohmann::json metadata = {
        {keys::PERMISSION, common::to_string(permission)},
        {keys::GRANTED, decision.granted}
    };
    if (!decision.granted) {
        metadata[keys::REASON] = to_string(decision.reason);
    }

    try {
        deps_.recorder.logActivity(user_id, ActivityType::DATA_ACCESS,
                                   resource_type.value_or(resources::PERMISSION),
                                   resource_id, metadata);

        if (decision.reason == DenyReason::PERMISSION_MISSING) {
            raiseViolation(user_id, permission);
        }
    } catch (const std::exception& e) {
        logger.error("[Access] Failed to record permission check | user={} | error={}", user_id, e.what());
    }

    if (!decision.granted) {
        logger.info("[Access] Denied | user={} | permission={} | reason={}",
                    user_id, common::to_string(permission), to_string(decision.reason));
    }
    return decision.granted;
}

void UserAccessStore::raiseViolation(const std::string& user_id, Permission permission) {
    std::string description = "Unauthorized access attempt: " + common::to_string(permission);

    auto activity = deps_.recorder.logActivity(user_id, ActivityType::SECURITY_VIOLATION,
                                               resources::SECURITY, std::nullopt,
                                               {{keys::PERMISSION, common::to_string(permission)},
                                                {"description", description}});

    deps_.alerts.createAlert(common::AlertType::SECURITY_VIOLATION,
                             common::Severity::HIGH,
                             "Security violation by user " + user_id,
                             description,
                             user_id,
                             activity.ip_address,
                             {{"activity_id", activity.activity_id},
                              {keys::PERMISSION, common::to_string(permission)}});
}

bool UserAccessStore::recordLoginAttempt(const std::string& user_id,
                                         const std::string& ip_address,
                                         const std::string& user_agent,
                                         bool success) {
    bool locked_now = false;
    bool usable = false;
    bool was_locked = false;
    int failed_attempts = 0;

    {
        auto& shard = shardFor(user_id);
        std::unique_lock<std::shared_mutex> lock(shard.mutex);

        auto it = shard.users.find(user_id);
        if (it == shard.users.end()) {
            it = shard.users.emplace(user_id, makeRecord(user_id, common::Role::USER)).first;
        }

        // A locked account stays locked, with its counters frozen for a
        // successful login, until unlockAccount().
        auto& record = it->second;
        was_locked = record.is_locked;
        if (success) {
            if (!record.is_locked) {
                record.failed_attempts = 0;
                record.login_count += 1;
                record.last_login = deps_.clock.now();
                usable = true;
            }
        } else {
            record.failed_attempts += 1;
            if (!record.is_locked && record.failed_attempts >= lockout_threshold_) {
                record.is_locked = true;
                locked_now = true;
            }
        }
        failed_attempts = record.failed_attempts;
    }

    nlohmann::json metadata = {
        {keys::IP_ADDRESS, ip_address},
        {keys::USER_AGENT, user_agent},
        {"success", success}
    };
    if (!success) {
        metadata[keys::FAILED_ATTEMPTS] = failed_attempts;
    }
    if (was_locked) {
        metadata["account_locked"] = true;
    }

    deps_.recorder.logActivity(user_id, ActivityType::LOGIN, resources::AUTHENTICATION, std::nullopt, metadata);

    if (locked_now) {
        common::Logger::instance().warn("[Access] Account locked | user={} | failed_attempts={}",
                                        user_id, failed_attempts);
        deps_.alerts.createAlert(common::AlertType::ACCOUNT_LOCKED,
                                 common::Severity::HIGH,
                                 "Account locked for user " + user_id,
                                 "Account locked due to " + std::to_string(failed_attempts) + " failed login attempts",
                                 user_id,
                                 ip_address,
                                 {{keys::FAILED_ATTEMPTS, failed_attempts}});
    }

    return usable;
}

void UserAccessStore::recordLogout(const std::string& user_id,
                                   const std::string& ip_address,
                                   const std::string& user_agent) {
    deps_.recorder.logActivity(user_id, ActivityType::LOGOUT, resources::AUTHENTICATION, std::nullopt,
                               {{keys::IP_ADDRESS, ip_address}, {keys::USER_AGENT, user_agent}});
}

bool UserAccessStore::assignRole(const std::string& user_id, common::Role role, const std::string& assigned_by) {
    if (!checkPermission(assigned_by, Permission::SYSTEM_ADMIN)) {
        return false;
    }

    try {
        common::UserAccess fresh = makeRecord(user_id, role);
        {
            auto& shard = shardFor(user_id);
            std::unique_lock<std::shared_mutex> lock(shard.mutex);

            auto it = shard.users.find(user_id);
            if (it == shard.users.end()) {
                shard.users.emplace(user_id, std::move(fresh));
            } else {
                it->second.role = role;
                it->second.permissions = fresh.permissions;
                it->second.security_level = fresh.security_level;
            }
        }

        deps_.recorder.logActivity(assigned_by, ActivityType::ROLE_CHANGE, resources::USER, user_id,
                                   {{"new_role", common::to_string(role)}, {"assigned_by", assigned_by}});
    } catch (const std::exception& e) {
        common::Logger::instance().error("[Access] Role assignment failed | user={} | role={} | error={}",
                                         user_id, common::to_string(role), e.what());
        return false;
    }

    common::Logger::instance().info("[Access] Role assigned | user={} | role={} | by={}",
                                    user_id, common::to_string(role), assigned_by);
    return true;
}

bool UserAccessStore::revokePermission(const std::string& user_id, Permission permission, const std::string& revoked_by) {
    if (!checkPermission(revoked_by, Permission::SYSTEM_ADMIN)) {
        return false;
    }

    {
        auto& shard = shardFor(user_id);
        std::unique_lock<std::shared_mutex> lock(shard.mutex);

        auto it = shard.users.find(user_id);
        if (it == shard.users.end() || it->second.permissions.erase(permission) == 0) {
            return false;
        }
    }

    deps_.recorder.logActivity(revoked_by, ActivityType::PERMISSION_CHANGE, resources::USER, user_id,
                               {{"revoked_permission", common::to_string(permission)}, {"revoked_by", revoked_by}});

    common::Logger::instance().info("[Access] Permission revoked | user={} | permission={} | by={}",
                                    user_id, common::to_string(permission), revoked_by);
    return true;
}

bool UserAccessStore::unlockAccount(const std::string& user_id, const std::string& unlocked_by) {
    if (!checkPermission(unlocked_by, Permission::SYSTEM_ADMIN)) {
        return false;
    }

    {
        auto& shard = shardFor(user_id);
        std::unique_lock<std::shared_mutex> lock(shard.mutex);

        auto it = shard.users.find(user_id);
        if (it == shard.users.end()) {
            return false;
        }
        it->second.is_locked = false;
        it->second.failed_attempts = 0;
    }

    deps_.recorder.logActivity(unlocked_by, ActivityType::PERMISSION_CHANGE, resources::USER, user_id,
                               {{"action", "unlock"}, {"unlocked_by", unlocked_by}});

    common::Logger::instance().info("[Access] Account unlocked | user={} | by={}", user_id, unlocked_by);
    return true;
}

void UserAccessStore::seedUser(const std::string& user_id, common::Role role) {
    common::UserAccess record = makeRecord(user_id, role);

    auto& shard = shardFor(user_id);
    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    shard.users.emplace(user_id, std::move(record));
}

std::optional<common::UserAccess> UserAccessStore::find(const std::string& user_id) const {
    const auto& shard = shardFor(user_id);
    std::shared_lock<std::shared_mutex> lock(shard.mutex);

    auto it = shard.users.find(user_id);
    if (it == shard.users.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<common::UserAccess> UserAccessStore::snapshot() const {
    std::vector<common::UserAccess> result;
    for (const auto& shard : shards_) {
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        for (const auto& entry : shard.users) {
            result.push_back(entry.second);
        }
    }
    return result;
}

void UserAccessStore::restore(const std::vector<common::UserAccess>& records) {
    for (auto& shard : shards_) {
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        shard.users.clear();
    }

    for (const auto& record : records) {
        auto& shard = shardFor(record.user_id);
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        shard.users[record.user_id] = record;
    }
}

size_t UserAccessStore::size() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        total += shard.users.size();
    }
    return total;
}

}}
