#include "access_guard/monitor/suspicious_activity_detector.hpp"
#include "access_guard/common/constants.hpp"
#include "access_guard/common/logger.hpp"
#include <tbb/concurrent_queue.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <algorithm>
#include <iterator>

namespace access_guard {
namespace monitor {

using common::ActivityType;

SuspiciousActivityDetector::SuspiciousActivityDetector(const common::MonitorConfig& config,
                                                       const common::Clock& clock,
                                                       const activity::ActivityLog& log,
                                                       alert::SecurityAlertManager& alerts)
    : config_(config), clock_(clock), log_(log), alerts_(alerts) {}

std::vector<PatternFinding> SuspiciousActivityDetector::analyzeUser(
        const std::string& user_id,
        const std::vector<common::Activity>& activities) const {
    PatternFinding role_changes{user_id, EXCESSIVE_ROLE_CHANGES};
    PatternFinding failed_logins{user_id, REPEATED_FAILED_LOGINS};
    PatternFinding data_access{user_id, EXCESSIVE_DATA_ACCESS};

    auto add = [](PatternFinding& finding, const common::Activity& activity) {
        ++finding.count;
        finding.newest_sequence = std::max(finding.newest_sequence, activity.sequence);
        finding.activity_ids.push_back(activity.activity_id);
    };

    for (const auto& activity : activities) {
        switch (activity.activity_type) {
            case ActivityType::ROLE_CHANGE:
                add(role_changes, activity);
                break;
            case ActivityType::LOGIN: {
                auto it = activity.metadata.find(constants::metadata_keys::FAILED_ATTEMPTS);
                if (it != activity.metadata.end() && it->is_number_integer() && it->get<int>() > 0) {
                    add(failed_logins, activity);
                }
                break;
            }
            case ActivityType::DATA_ACCESS:
                add(data_access, activity);
                break;
            default:
                break;
        }
    }

    std::vector<PatternFinding> findings;
    if (role_changes.count > static_cast<size_t>(config_.role_change_threshold)) {
        findings.push_back(std::move(role_changes));
    }
    if (failed_logins.count > static_cast<size_t>(config_.failed_login_threshold)) {
        findings.push_back(std::move(failed_logins));
    }
    if (data_access.count > static_cast<size_t>(config_.data_access_threshold)) {
        findings.push_back(std::move(data_access));
    }
    return findings;
}

size_t SuspiciousActivityDetector::trackedPatterns() const {
    std::lock_guard<std::mutex> lock(alerted_mutex_);
    return last_alerted_.size();
}

size_t SuspiciousActivityDetector::scan() {
    auto since = clock_.now() - std::chrono::minutes(config_.detection_window_minutes);
    std::vector<common::Activity> window = log_.window(since);

    std::map<std::string, std::vector<common::Activity>> by_user;
    for (auto& activity : window) {
        by_user[activity.user_id].push_back(std::move(activity));
    }

    std::vector<const std::pair<const std::string, std::vector<common::Activity>>*> groups;
    groups.reserve(by_user.size());
    for (const auto& entry : by_user) {
        groups.push_back(&entry);
    }

    tbb::concurrent_queue<PatternFinding> results;

    tbb::task_arena arena(std::max(1, config_.analysis_threads));
    arena.execute([&] {
        tbb::parallel_for(size_t(0), groups.size(), [&](size_t i) {
            for (auto& finding : analyzeUser(groups[i]->first, groups[i]->second)) {
                results.push(std::move(finding));
            }
        });
    });

    std::map<std::string, std::vector<PatternFinding>> fresh_by_user;
    {
        std::lock_guard<std::mutex> lock(alerted_mutex_);
        PatternFinding finding;
        while (results.try_pop(finding)) {
            auto key = std::make_pair(finding.user_id, finding.kind);
            auto it = last_alerted_.find(key);
            if (it != last_alerted_.end() && it->second >= finding.newest_sequence) {
                continue;
            }
            last_alerted_[key] = finding.newest_sequence;
            fresh_by_user[finding.user_id].push_back(std::move(finding));
        }

        // Users with nothing left in the window can only produce findings
        // with newer sequences, so their dedupe marks are no longer needed.
        for (auto it = last_alerted_.begin(); it != last_alerted_.end();) {
            it = by_user.count(it->first.first) == 0 ? last_alerted_.erase(it) : std::next(it);
        }
    }

    for (auto& [user_id, findings] : fresh_by_user) {
        std::sort(findings.begin(), findings.end(),
                  [](const PatternFinding& a, const PatternFinding& b) { return a.kind < b.kind; });

        nlohmann::json patterns = nlohmann::json::array();
        std::string kinds;
        for (const auto& finding : findings) {
            patterns.push_back({
                {"type", finding.kind},
                {"count", finding.count},
                {"activity_ids", finding.activity_ids}
            });
            kinds += (kinds.empty() ? "" : ", ") + finding.kind;
        }

        alerts_.createAlert(common::AlertType::SUSPICIOUS_PATTERN,
                            common::Severity::HIGH,
                            "Suspicious activity pattern detected for user " + user_id,
                            "Detected patterns: " + kinds,
                            user_id,
                            constants::metadata_keys::UNKNOWN_VALUE,
                            {{"patterns", patterns},
                             {"window_minutes", config_.detection_window_minutes}});
    }

    common::Logger::instance().debug("[Detector] Scan complete | activities={} | users={} | alerts={}",
                                     window.size(), by_user.size(), fresh_by_user.size());
    return fresh_by_user.size();
}

}}
