#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace access_guard {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

struct LoggingConfig {
    size_t rotation_size_mb;
    size_t max_files;
    LogFormat format;
};

struct RbacConfig {
    int lockout_threshold;
    int session_timeout_minutes;
    std::vector<std::string> bootstrap_admins;
};

// Thresholds are strict: a pattern fires when the count is greater than the threshold.
struct MonitorConfig {
    int business_hours_start;
    int business_hours_end;
    size_t queue_capacity;
    int activity_retention_hours;
    // Resolved and false-positive alerts older than this are dropped.
    int alert_retention_hours;

    int monitor_interval_ms;
    int rapid_window_seconds;
    int rapid_threshold;
    int unusual_risk_threshold;

    int detection_interval_seconds;
    int detection_window_minutes;
    int role_change_threshold;
    int failed_login_threshold;
    int data_access_threshold;

    int breach_interval_seconds;
    int breach_window_minutes;
    int export_threshold;

    int degraded_failure_threshold;
    int analysis_threads;
};

struct ConsentConfig {
    // resource_type -> consent type name
    std::map<std::string, std::string> gated_resources;
};

struct ComplianceConfig {
    // account_id -> owning user_id
    std::map<std::string, std::string> bank_accounts;
};

struct AuditConfig {
    bool enabled;
    std::string audit_file;
};

struct PersistenceConfig {
    bool enabled;
    int checkpoint_interval_seconds;
};

struct DaemonConfig {
    std::string http_host;
    uint16_t http_port;
};

struct GlobalConfig {
    std::string log_file;
    LogLevel log_level;
    std::string state_dir;
    LoggingConfig logging;
    RbacConfig rbac;
    MonitorConfig monitor;
    ConsentConfig consent;
    ComplianceConfig compliance;
    AuditConfig audit;
    PersistenceConfig persistence;
    DaemonConfig daemon;
};

class Config {
public:
    static Config& instance();

    bool load(const std::string& config_file = "");
    bool save(const std::string& config_file = "");
    bool exists() const;
    void resetToDefaults();

    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }

    bool setValue(const std::string& key, const std::string& value);
    std::optional<std::string> getValue(const std::string& key) const;
    static const std::vector<std::string>& knownKeys();

    std::optional<std::string> findBestConfig() const;
    std::string getConfigPath() const;
    std::string getPidFilePath() const;

    static GlobalConfig createDefaultConfig();
    static std::string to_string(LogLevel level);
    static std::optional<LogLevel> parseLogLevel(const std::string& value);

private:
    Config();
    GlobalConfig global_;
    std::string current_config_path_;

    void applyPathDefaults();
    bool tryLoadTomlFile(const std::string& path);
};

}}
