#pragma once

#include "../activity/activity_log.hpp"
#include "../activity/activity_queue.hpp"
#include "../activity/activity_recorder.hpp"
#include "../alert/alert_manager.hpp"
#include "../common/clock.hpp"
#include "../common/config.hpp"
#include <string>
#include <vector>

namespace access_guard {
namespace monitor {

// Drains the activity queue and raises per-activity alerts.
class ActivityMonitor {
public:
    ActivityMonitor(const common::MonitorConfig& config,
                    const common::Clock& clock,
                    activity::ActivityQueue& queue,
                    activity::ActivityLog& log,
                    const activity::ActivityRecorder& recorder,
                    alert::SecurityAlertManager& alerts);

    // One worker iteration. Returns false when any item failed.
    bool processPending();

    void analyze(const common::Activity& activity);

    std::vector<std::string> unusualReasons(const common::Activity& activity) const;
    bool isRapid(const common::Activity& activity) const;

private:
    common::MonitorConfig config_;
    const common::Clock& clock_;
    activity::ActivityQueue& queue_;
    activity::ActivityLog& log_;
    const activity::ActivityRecorder& recorder_;
    alert::SecurityAlertManager& alerts_;
};

}}
