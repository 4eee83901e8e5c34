#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <string>

#include "access_guard/common/config.hpp"
#include "access_guard/common/constants.hpp"
#include "access_guard/common/logger.hpp"
#include "access_guard/common/paths.hpp"
#include "cli/config_command.hpp"
#include "cli/daemon_command.hpp"

namespace {

void warnMissingConfig() {
    auto& paths = access_guard::common::PathManager::instance();

    std::cerr << "\nNo configuration file found (" << to_string(paths.mode()) << " mode).\n";
    std::cerr << "Searched:\n";
    for (const auto& candidate : paths.getConfigSearchPaths()) {
        std::cerr << "  " << candidate << "\n";
    }
    std::cerr << "\nCreate one with:\n  \033[32m"
              << (paths.isSystemMode() ? "sudo " : "")
              << "access-guard config init\033[0m\n\n";
    std::cerr << "Continuing with built-in defaults.\n\n";
}

bool loadConfiguration(const std::string& explicit_path, bool warn_if_missing) {
    auto& config = access_guard::common::Config::instance();

    if (!explicit_path.empty()) {
        return config.load(explicit_path);
    }
    if (warn_if_missing && !config.findBestConfig()) {
        warnMissingConfig();
    }
    return config.load();
}

}

int main(int argc, char** argv) {
    using namespace access_guard;

    try {
        CLI::App app{constants::system::APPLICATION_NAME, constants::system::BINARY_NAME};
        app.set_version_flag("--version,-v", constants::version::getFullVersion());
        app.require_subcommand(0, 1);

        std::string config_file;
        bool verbose = false;
        app.add_option("-c,--config", config_file, "Configuration file path")->check(CLI::ExistingFile);
        app.add_flag("--verbose", verbose, "Force debug logging");

        cli::ConfigCommand config_cmd;
        cli::DaemonCommand daemon_cmd;

        config_cmd.setup(app.add_subcommand("config", "Manage configuration"));
        daemon_cmd.setup(app.add_subcommand("daemon", "Run and control the monitoring service"));

        CLI11_PARSE(app, argc, argv);

        if (!loadConfiguration(config_file, daemon_cmd.wasCalled())) {
            std::cerr << "Error: configuration could not be parsed" << std::endl;
            if (daemon_cmd.wasCalled()) {
                return 1;
            }
        }

        auto& global = common::Config::instance().global();
        common::LogLevel level = verbose ? common::LogLevel::DEBUG : global.log_level;

        if (daemon_cmd.runsInForeground()) {
            common::Logger::instance().initialize(common::LogMode::FILE_ONLY, global.log_file, level, global.logging);
        } else {
            common::Logger::instance().initialize(common::LogMode::CONSOLE_ONLY, "", level, global.logging);
        }

        if (config_cmd.wasCalled()) {
            return config_cmd.execute();
        }
        if (daemon_cmd.wasCalled()) {
            return daemon_cmd.execute();
        }

        std::cout << app.help() << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
