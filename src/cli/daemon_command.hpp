#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>
#include "access_guard/common/config.hpp"

namespace access_guard {
namespace cli {

class DaemonCommand : public MainCommand {
public:
    DaemonCommand();

    void setup(CLI::App* subcommand);
    int execute() override;

    // True when `daemon run` was selected; the service then logs to file.
    bool runsInForeground() const { return run_cmd_ != nullptr && run_cmd_->parsed(); }

private:
    CLI::App* run_cmd_ = nullptr;
    uint16_t http_port_ = 0;
    std::string http_host_;
    std::string state_dir_;
    bool check_config_ = false;

    CLI::App* start_cmd_ = nullptr;
    CLI::App* stop_cmd_ = nullptr;
    CLI::App* reload_cmd_ = nullptr;
    CLI::App* status_cmd_ = nullptr;
    CLI::App* restart_cmd_ = nullptr;

    int executeRun();
    int executeStart();
    int executeStop();
    int executeReload();
    int executeStatus();
    int executeRestart();

    int startManually();
    int stopManually();
    void printServiceSummary();

    int runServer(common::DaemonConfig daemon_config);
    int daemonize();

    static bool isSystemdAvailable();
    static int systemctl(const std::string& action);
    static void absolutizePaths(common::GlobalConfig& config);
};

}}
