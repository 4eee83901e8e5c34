#pragma once

#include "../activity/activity_log.hpp"
#include "../activity/activity_queue.hpp"
#include "../activity/activity_recorder.hpp"
#include "../activity/ip_reputation.hpp"
#include "../alert/alert_manager.hpp"
#include "../audit/audit_sink.hpp"
#include "../common/clock.hpp"
#include "../common/config.hpp"
#include "../compliance/compliance.hpp"
#include "../consent/consent_store.hpp"
#include "../monitor/activity_monitor.hpp"
#include "../monitor/breach_prevention.hpp"
#include "../monitor/periodic_worker.hpp"
#include "../monitor/suspicious_activity_detector.hpp"
#include "../rbac/permission_registry.hpp"
#include "../rbac/user_access_store.hpp"
#include "../storage/persistence.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace access_guard {
namespace service {

struct ServiceMetrics {
    size_t total_users = 0;
    size_t active_users = 0;
    size_t locked_users = 0;
    std::map<std::string, size_t> role_distribution;

    size_t total_alerts = 0;
    size_t open_alerts = 0;
    size_t critical_alerts = 0;

    size_t recent_activities = 0;
    size_t high_risk_activities = 0;

    size_t total_consents = 0;
    size_t active_consents = 0;

    size_t total_incidents = 0;
    size_t open_incidents = 0;

    uint64_t dropped_events = 0;
    uint64_t audit_failures = 0;
};

void to_json(nlohmann::json& j, const ServiceMetrics& metrics);

struct ServiceCollaborators {
    std::unique_ptr<audit::AuditSink> audit_sink;
    std::unique_ptr<storage::PersistenceLayer> persistence;
    std::unique_ptr<compliance::ComplianceCollaborator> compliance;
    std::unique_ptr<activity::IpReputation> ip_reputation;
};

// Composition root for one process. Owns all domain state and the
// background workers; initialize() and shutdown() bracket its lifetime.
class AccessControlService {
public:
    AccessControlService(const common::GlobalConfig& config,
                         const common::Clock& clock,
                         ServiceCollaborators collaborators);
    ~AccessControlService();

    AccessControlService(const AccessControlService&) = delete;
    AccessControlService& operator=(const AccessControlService&) = delete;

    // Collaborators built from configuration: JSONL audit file, JSON state
    // directory, account ownership table and the private range heuristic.
    static ServiceCollaborators defaultCollaborators(const common::GlobalConfig& config);

    bool initialize(bool start_workers = true);
    void shutdown();
    bool isInitialized() const { return initialized_.load(); }

    // Writes the full state through the persistence layer.
    bool checkpoint();

    bool checkPermission(const std::string& user_id,
                         common::Permission permission,
                         const std::optional<std::string>& resource_type = std::nullopt,
                         const std::optional<std::string>& resource_id = std::nullopt);

    bool recordLoginAttempt(const std::string& user_id,
                            const std::string& ip_address,
                            const std::string& user_agent,
                            bool success);

    void recordLogout(const std::string& user_id, const std::string& ip_address, const std::string& user_agent);

    common::Activity logActivity(const std::string& user_id,
                                 common::ActivityType type,
                                 const std::string& resource_type,
                                 const std::optional<std::string>& resource_id = std::nullopt,
                                 const nlohmann::json& metadata = nlohmann::json::object());

    common::SecurityAlert createAlert(common::AlertType type,
                                      common::Severity severity,
                                      const std::string& title,
                                      const std::string& description,
                                      const std::string& user_id,
                                      const std::string& ip_address,
                                      const nlohmann::json& evidence = nlohmann::json::object());

    std::string recordConsent(const std::string& user_id,
                              common::ConsentType type,
                              bool granted,
                              const std::string& ip_address,
                              const std::string& user_agent,
                              std::optional<common::Timestamp> expires_at = std::nullopt);

    bool assignRole(const std::string& user_id, common::Role role, const std::string& assigned_by);
    bool revokePermission(const std::string& user_id, common::Permission permission, const std::string& revoked_by);
    bool unlockAccount(const std::string& user_id, const std::string& unlocked_by);

    ServiceMetrics metrics() const;

    // Seeds admin records for ids that have none. Returns how many were added.
    size_t seedBootstrapAdmins(const std::vector<std::string>& admins);

    // Single synchronous worker iterations, with the same failure
    // accounting as the background threads.
    bool runMonitorOnce();
    bool runDetectionOnce();
    bool runBreachScanOnce();

    const rbac::PermissionRegistry& registry() const { return registry_; }
    rbac::UserAccessStore& users() { return *store_; }
    alert::SecurityAlertManager& alerts() { return *alerts_; }
    monitor::BreachPreventionSystem& breach() { return *breach_; }
    consent::ConsentStore& consents() { return *consents_; }
    const activity::ActivityLog& activityLog() const { return log_; }
    const activity::ActivityQueue& activityQueue() const { return queue_; }
    const common::GlobalConfig& config() const { return config_; }

private:
    common::GlobalConfig config_;
    const common::Clock& clock_;

    ServiceCollaborators collaborators_;
    audit::AuditDispatcher audit_;

    rbac::PermissionRegistry registry_;
    activity::ActivityLog log_;
    activity::ActivityQueue queue_;

    std::unique_ptr<activity::ActivityRecorder> recorder_;
    std::unique_ptr<alert::SecurityAlertManager> alerts_;
    std::unique_ptr<consent::ConsentStore> consents_;
    std::unique_ptr<rbac::UserAccessStore> store_;
    std::unique_ptr<monitor::ActivityMonitor> monitor_;
    std::unique_ptr<monitor::SuspiciousActivityDetector> detector_;
    std::unique_ptr<monitor::BreachPreventionSystem> breach_;

    std::unique_ptr<monitor::PeriodicWorker> monitor_worker_;
    std::unique_ptr<monitor::PeriodicWorker> detection_worker_;
    std::unique_ptr<monitor::PeriodicWorker> breach_worker_;
    std::unique_ptr<monitor::PeriodicWorker> checkpoint_worker_;

    std::atomic<bool> initialized_{false};
    std::mutex lifecycle_mutex_;
    std::mutex checkpoint_mutex_;

    void createWorkers();
    void onWorkerDegraded(const std::string& worker, int consecutive_failures);
    bool restoreState();
};

}}
