#pragma once

#include "permission_registry.hpp"
#include "../activity/activity_recorder.hpp"
#include "../alert/alert_manager.hpp"
#include "../common/clock.hpp"
#include "../common/config.hpp"
#include "../common/constants.hpp"
#include "../common/types.hpp"
#include "../compliance/compliance.hpp"
#include "../consent/consent_store.hpp"
#include <array>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace access_guard {
namespace rbac {

enum class DenyReason {
    NONE,
    NO_ACCESS_RECORD,
    ACCOUNT_LOCKED,
    PERMISSION_MISSING,
    RESOURCE_DENIED,
    CONSENT_REQUIRED,
    INTERNAL_ERROR
};

std::string to_string(DenyReason reason);

struct AccessDecision {
    bool granted = false;
    DenyReason reason = DenyReason::NONE;
};

struct StoreCollaborators {
    const PermissionRegistry& registry;
    activity::ActivityRecorder& recorder;
    alert::SecurityAlertManager& alerts;
    const compliance::ComplianceCollaborator& compliance;
    const consent::ConsentStore& consents;
    const common::Clock& clock;
};

// Per-user authentication and authorization state, split across
// shards so that unrelated users never contend. No shard lock is held
// while calling out to the recorder, the alert manager or a collaborator.
class UserAccessStore {
public:
    UserAccessStore(const common::RbacConfig& rbac,
                    const common::ConsentConfig& consent,
                    StoreCollaborators collaborators);

    // Records one DATA_ACCESS activity per call. Default-deny on any error.
    bool checkPermission(const std::string& user_id,
                         common::Permission permission,
                         const std::optional<std::string>& resource_type = std::nullopt,
                         const std::optional<std::string>& resource_id = std::nullopt);

    // Same decision as checkPermission without recording anything.
    AccessDecision validateAccess(const std::string& user_id,
                                  common::Permission permission,
                                  const std::optional<std::string>& resource_type = std::nullopt,
                                  const std::optional<std::string>& resource_id = std::nullopt) const;

    // Returns true when the login was successful and the account is usable.
    bool recordLoginAttempt(const std::string& user_id,
                            const std::string& ip_address,
                            const std::string& user_agent,
                            bool success);

    void recordLogout(const std::string& user_id,
                      const std::string& ip_address,
                      const std::string& user_agent);

    bool assignRole(const std::string& user_id, common::Role role, const std::string& assigned_by);
    bool revokePermission(const std::string& user_id, common::Permission permission, const std::string& revoked_by);
    bool unlockAccount(const std::string& user_id, const std::string& unlocked_by);

    void seedUser(const std::string& user_id, common::Role role);

    std::optional<common::UserAccess> find(const std::string& user_id) const;
    std::vector<common::UserAccess> snapshot() const;
    void restore(const std::vector<common::UserAccess>& records);
    size_t size() const;

private:
    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, common::UserAccess> users;
    };

    int lockout_threshold_;
    int session_timeout_minutes_;
    std::map<std::string, common::ConsentType> gated_resources_;
    StoreCollaborators deps_;
    std::array<Shard, constants::limits::USER_STORE_SHARDS> shards_;

    Shard& shardFor(const std::string& user_id);
    const Shard& shardFor(const std::string& user_id) const;

    common::UserAccess makeRecord(const std::string& user_id, common::Role role) const;
    void raiseViolation(const std::string& user_id, common::Permission permission);
};

}}
