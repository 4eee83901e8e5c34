#pragma once

#include "../activity/activity_log.hpp"
#include "../alert/alert_manager.hpp"
#include "../common/clock.hpp"
#include "../common/config.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace access_guard {
namespace monitor {

struct PatternFinding {
    std::string user_id;
    std::string kind;
    size_t count = 0;
    uint64_t newest_sequence = 0;
    std::vector<std::string> activity_ids;
};

class SuspiciousActivityDetector {
public:
    static constexpr const char* EXCESSIVE_ROLE_CHANGES = "excessive_role_changes";
    static constexpr const char* REPEATED_FAILED_LOGINS = "repeated_failed_logins";
    static constexpr const char* EXCESSIVE_DATA_ACCESS = "excessive_data_access";

    SuspiciousActivityDetector(const common::MonitorConfig& config,
                               const common::Clock& clock,
                               const activity::ActivityLog& log,
                               alert::SecurityAlertManager& alerts);

    // One worker iteration over the detection window. Returns the number
    // of alerts raised.
    size_t scan();

    std::vector<PatternFinding> analyzeUser(const std::string& user_id,
                                            const std::vector<common::Activity>& activities) const;

    // (user, pattern) pairs currently remembered for dedupe.
    size_t trackedPatterns() const;

private:
    common::MonitorConfig config_;
    const common::Clock& clock_;
    const activity::ActivityLog& log_;
    alert::SecurityAlertManager& alerts_;

    mutable std::mutex alerted_mutex_;
    std::map<std::pair<std::string, std::string>, uint64_t> last_alerted_;
};

}}
