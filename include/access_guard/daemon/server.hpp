#pragma once

#include "../common/clock.hpp"
#include "../common/config.hpp"
#include "../service/access_control_service.hpp"
#include "reloadable_config.hpp"
#include "http_server.hpp"
#include "pid_file.hpp"
#include <atomic>
#include <chrono>
#include <memory>

namespace access_guard {
namespace daemon {

// Owns one AccessControlService and the status API for the lifetime of
// the `daemon run` process. SIGINT/SIGTERM stop it, SIGHUP reloads the
// settings in ReloadableConfig.
class DaemonServer {
public:
    explicit DaemonServer(const common::DaemonConfig& config);
    ~DaemonServer();

    bool startService();
    void stopService();

    // Blocks until a shutdown signal, servicing reloads and heartbeats.
    void run();

    bool isRunning() const { return running_; }

    static bool isDaemonRunning();
    static int getDaemonPid();
    static bool sendSignalToDaemon(int signal);

private:
    common::DaemonConfig config_;
    common::SystemClock clock_;
    std::unique_ptr<PidFile> pid_file_;
    std::unique_ptr<service::AccessControlService> service_;
    std::unique_ptr<HttpApiServer> http_server_;
    ReloadableConfig active_config_;

    std::atomic<bool> running_{false};

    static std::atomic<bool> shutdown_requested_;
    static std::atomic<bool> reload_requested_;

    static void installSignalHandlers();
    static void onSignal(int signal);
    static bool runningInContainer();

    void reloadConfiguration();
    void logHeartbeat();
};

}}
