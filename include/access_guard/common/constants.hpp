#pragma once

#include <string>
#include <cstddef>
#include <cstdint>

namespace access_guard {
namespace constants {

namespace version {
    constexpr const char* VERSION = "1.0.0";

    inline std::string getFullVersion() {
        return std::string("AccessGuard v") + VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "AccessGuard";
    constexpr const char* BINARY_NAME = "access-guard";
    constexpr const char* LOGGER_NAME = "access-guard";
    constexpr const char* CONFIG_FILE_NAME = "access-guard.toml";
}

namespace limits {
    constexpr int DEFAULT_LOCKOUT_THRESHOLD = 5;
    constexpr int DEFAULT_SESSION_TIMEOUT_MINUTES = 30;

    constexpr int DEFAULT_BUSINESS_HOURS_START = 6;
    constexpr int DEFAULT_BUSINESS_HOURS_END = 22;
    constexpr size_t DEFAULT_QUEUE_CAPACITY = 1000;
    constexpr int DEFAULT_ACTIVITY_RETENTION_HOURS = 168;
    constexpr int DEFAULT_ALERT_RETENTION_HOURS = 720;

    constexpr int DEFAULT_MONITOR_INTERVAL_MS = 1000;
    constexpr int DEFAULT_RAPID_WINDOW_SECONDS = 60;
    constexpr int DEFAULT_RAPID_THRESHOLD = 10;
    constexpr int DEFAULT_UNUSUAL_RISK_THRESHOLD = 8;

    constexpr int DEFAULT_DETECTION_INTERVAL_SECONDS = 30;
    constexpr int DEFAULT_DETECTION_WINDOW_MINUTES = 60;
    constexpr int DEFAULT_ROLE_CHANGE_THRESHOLD = 1;
    constexpr int DEFAULT_FAILED_LOGIN_THRESHOLD = 3;
    constexpr int DEFAULT_DATA_ACCESS_THRESHOLD = 20;

    constexpr int DEFAULT_BREACH_INTERVAL_SECONDS = 60;
    constexpr int DEFAULT_BREACH_WINDOW_MINUTES = 5;
    constexpr int DEFAULT_EXPORT_THRESHOLD = 5;

    constexpr int DEFAULT_DEGRADED_FAILURE_THRESHOLD = 3;
    constexpr int DEFAULT_ANALYSIS_THREADS = 4;

    constexpr int DEFAULT_CHECKPOINT_INTERVAL_SECONDS = 300;

    constexpr const char* DEFAULT_HTTP_HOST = "127.0.0.1";
    constexpr uint16_t DEFAULT_HTTP_PORT = 9317;

    constexpr size_t DEFAULT_LOG_ROTATION_SIZE_MB = 100;
    constexpr size_t DEFAULT_LOG_MAX_FILES = 5;

    constexpr int MAX_RISK_SCORE = 10;
    constexpr int HIGH_RISK_SCORE = 7;
    constexpr int RECENT_ACTIVITY_DAYS = 7;
    constexpr size_t USER_STORE_SHARDS = 16;
}

namespace config_defaults {
    constexpr int LOCKOUT_THRESHOLD = limits::DEFAULT_LOCKOUT_THRESHOLD;
    constexpr int SESSION_TIMEOUT_MINUTES = limits::DEFAULT_SESSION_TIMEOUT_MINUTES;

    constexpr int BUSINESS_HOURS_START = limits::DEFAULT_BUSINESS_HOURS_START;
    constexpr int BUSINESS_HOURS_END = limits::DEFAULT_BUSINESS_HOURS_END;
    constexpr size_t QUEUE_CAPACITY = limits::DEFAULT_QUEUE_CAPACITY;
    constexpr int ACTIVITY_RETENTION_HOURS = limits::DEFAULT_ACTIVITY_RETENTION_HOURS;
    constexpr int ALERT_RETENTION_HOURS = limits::DEFAULT_ALERT_RETENTION_HOURS;
    constexpr int MONITOR_INTERVAL_MS = limits::DEFAULT_MONITOR_INTERVAL_MS;
    constexpr int RAPID_WINDOW_SECONDS = limits::DEFAULT_RAPID_WINDOW_SECONDS;
    constexpr int RAPID_THRESHOLD = limits::DEFAULT_RAPID_THRESHOLD;
    constexpr int UNUSUAL_RISK_THRESHOLD = limits::DEFAULT_UNUSUAL_RISK_THRESHOLD;
    constexpr int DETECTION_INTERVAL_SECONDS = limits::DEFAULT_DETECTION_INTERVAL_SECONDS;
    constexpr int DETECTION_WINDOW_MINUTES = limits::DEFAULT_DETECTION_WINDOW_MINUTES;
    constexpr int ROLE_CHANGE_THRESHOLD = limits::DEFAULT_ROLE_CHANGE_THRESHOLD;
    constexpr int FAILED_LOGIN_THRESHOLD = limits::DEFAULT_FAILED_LOGIN_THRESHOLD;
    constexpr int DATA_ACCESS_THRESHOLD = limits::DEFAULT_DATA_ACCESS_THRESHOLD;
    constexpr int BREACH_INTERVAL_SECONDS = limits::DEFAULT_BREACH_INTERVAL_SECONDS;
    constexpr int BREACH_WINDOW_MINUTES = limits::DEFAULT_BREACH_WINDOW_MINUTES;
    constexpr int EXPORT_THRESHOLD = limits::DEFAULT_EXPORT_THRESHOLD;
    constexpr int DEGRADED_FAILURE_THRESHOLD = limits::DEFAULT_DEGRADED_FAILURE_THRESHOLD;
    constexpr int ANALYSIS_THREADS = limits::DEFAULT_ANALYSIS_THREADS;

    constexpr bool AUDIT_ENABLED = true;
    constexpr bool PERSISTENCE_ENABLED = true;
    constexpr int CHECKPOINT_INTERVAL_SECONDS = limits::DEFAULT_CHECKPOINT_INTERVAL_SECONDS;

    constexpr uint16_t DAEMON_HTTP_PORT = limits::DEFAULT_HTTP_PORT;
    constexpr const char* DAEMON_HTTP_HOST = limits::DEFAULT_HTTP_HOST;

    constexpr size_t LOG_ROTATION_SIZE_MB = limits::DEFAULT_LOG_ROTATION_SIZE_MB;
    constexpr size_t LOG_MAX_FILES = limits::DEFAULT_LOG_MAX_FILES;
}

namespace resources {
    constexpr const char* BANK_ACCOUNT = "bank_account";
    constexpr const char* USER = "user";
    constexpr const char* SECURITY = "security";
    constexpr const char* CONSENT = "consent";
    constexpr const char* AUTHENTICATION = "authentication";
    constexpr const char* PERMISSION = "permission";
}

namespace metadata_keys {
    constexpr const char* IP_ADDRESS = "ip_address";
    constexpr const char* USER_AGENT = "user_agent";
    constexpr const char* FAILED_ATTEMPTS = "failed_attempts";
    constexpr const char* PERMISSION = "permission";
    constexpr const char* GRANTED = "granted";
    constexpr const char* REASON = "reason";
    constexpr const char* UNKNOWN_VALUE = "unknown";
}

}
}
