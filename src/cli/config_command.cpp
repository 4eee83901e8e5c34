#include "config_command.hpp"
#include "access_guard/common/paths.hpp"
#include "access_guard/config/validator.hpp"
#include "access_guard/daemon/reloadable_config.hpp"
#include "access_guard/daemon/server.hpp"
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <unistd.h>

namespace access_guard {
namespace cli {

namespace {

bool pathWritable(const std::string& config_path) {
    if (std::filesystem::exists(config_path)) {
        return access(config_path.c_str(), W_OK) == 0;
    }
    std::filesystem::path parent = std::filesystem::path(config_path).parent_path();
    return access(parent.c_str(), W_OK) == 0;
}

void printMap(const std::string& title, const std::map<std::string, std::string>& entries,
              const std::string& arrow) {
    std::cout << title << " (" << entries.size() << "):\n";
    for (const auto& [key, value] : entries) {
        std::cout << "  " << key << " " << arrow << " " << value << "\n";
    }
}

}

ConfigCommand::ConfigCommand() = default;

void ConfigCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    init_cmd_ = subcommand->add_subcommand("init", "Write a configuration file with default values");
    init_cmd_->add_flag("-f,--force", init_force_, "Overwrite an existing configuration file");
    markCalledOn(init_cmd_);

    set_cmd_ = subcommand->add_subcommand("set", "Set a configuration value");
    set_cmd_->add_option("key", set_key_, "Configuration key")->required();
    set_cmd_->add_option("value", set_value_, "Value; lists are comma separated")->required();
    markCalledOn(set_cmd_);

    get_cmd_ = subcommand->add_subcommand("get", "Print one value, or every key when none is given");
    get_cmd_->add_option("key", get_key_, "Configuration key");
    markCalledOn(get_cmd_);

    show_cmd_ = subcommand->add_subcommand("show", "Print the configuration file");
    markCalledOn(show_cmd_);

    validate_cmd_ = subcommand->add_subcommand("validate", "Check the configuration file");
    markCalledOn(validate_cmd_);

    account_cmd_ = subcommand->add_subcommand("account", "Manage bank account ownership");
    account_add_cmd_ = account_cmd_->add_subcommand("add", "Assign an account to its owner");
    account_add_cmd_->add_option("account_id", account_id_, "Account identifier")->required();
    account_add_cmd_->add_option("owner", account_owner_, "Owning user id")->required();
    account_remove_cmd_ = account_cmd_->add_subcommand("remove", "Forget an account");
    account_remove_cmd_->add_option("account_id", account_id_, "Account identifier")->required();
    account_list_cmd_ = account_cmd_->add_subcommand("list", "List known accounts");
    markCalledOn(account_cmd_);

    gate_cmd_ = subcommand->add_subcommand("gate", "Manage consent-gated resource types");
    gate_add_cmd_ = gate_cmd_->add_subcommand("add", "Require a consent for a resource type");
    gate_add_cmd_->add_option("resource_type", gate_resource_, "Resource type")->required();
    gate_add_cmd_->add_option("consent_type", gate_consent_, "Consent type, e.g. data_processing")->required();
    gate_remove_cmd_ = gate_cmd_->add_subcommand("remove", "Stop gating a resource type");
    gate_remove_cmd_->add_option("resource_type", gate_resource_, "Resource type")->required();
    gate_list_cmd_ = gate_cmd_->add_subcommand("list", "List gated resource types");
    markCalledOn(gate_cmd_);
}

int ConfigCommand::execute() {
    if (init_cmd_->parsed()) return executeInit();
    if (set_cmd_->parsed()) return executeSet();
    if (get_cmd_->parsed()) return executeGet();
    if (show_cmd_->parsed()) return executeShow();
    if (validate_cmd_->parsed()) return executeValidate();
    if (account_cmd_->parsed()) return executeAccount();
    if (gate_cmd_->parsed()) return executeGate();

    std::cout << subcommand_->help() << std::endl;
    return 0;
}

bool ConfigCommand::ensureWritable(const std::string& config_path) {
    if (pathWritable(config_path)) {
        return true;
    }

    std::cerr << "\033[31mError: cannot write " << config_path << "\033[0m\n";
    if (common::PathManager::instance().isSystemMode()) {
        std::cerr << "System configuration requires root; re-run the command with sudo.\n";
    }
    return false;
}

int ConfigCommand::executeInit() {
    std::string config_path = common::PathManager::instance().getConfigFile();

    if (std::filesystem::exists(config_path) && !init_force_) {
        std::cerr << "Configuration already exists: " << config_path << "\n";
        std::cerr << "Use --force to overwrite.\n";
        return 1;
    }

    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(config_path).parent_path(), ec);

    if (!ensureWritable(config_path)) {
        return 1;
    }

    auto& config = common::Config::instance();
    config.resetToDefaults();

    if (!config.save(config_path)) {
        std::cerr << "Failed to write configuration.\n";
        return 1;
    }

    std::cout << "✓ Configuration written: " << config_path << "\n";
    std::cout << "\nNext: access-guard config set rbac.bootstrap_admins \"<user_id>\"\n";
    return 0;
}

// Loads the file, applies the mutation, validates, then saves. Nothing is
// written when validation fails.
int ConfigCommand::applyAndSave(const std::string& description, const Mutation& mutate) {
    auto& config = common::Config::instance();

    if (!config.exists()) {
        std::cerr << "Configuration file does not exist.\n";
        std::cerr << "Run: access-guard config init\n";
        return 1;
    }

    std::string config_path = config.getConfigPath();
    if (!ensureWritable(config_path)) {
        return 1;
    }

    if (!config.load(config_path)) {
        std::cerr << "Failed to load configuration.\n";
        return 1;
    }

    common::GlobalConfig before = config.global();
    if (!mutate(config.global())) {
        return 1;
    }

    config::ConfigValidator validator;
    auto result = validator.validate(config.global());
    if (!result.is_valid) {
        for (const auto& error : result.errors) {
            std::cerr << "  ERROR: " << error << "\n";
        }
        std::cerr << "Configuration not saved.\n";
        return 1;
    }

    if (!config.save(config_path)) {
        std::cerr << "Failed to save configuration.\n";
        return 1;
    }

    std::cout << "✓ " << description << "\n";
    notifyDaemon(before, config.global());
    return 0;
}

void ConfigCommand::notifyDaemon(const common::GlobalConfig& before, const common::GlobalConfig& after) {
    if (!daemon::DaemonServer::isDaemonRunning()) {
        return;
    }

    auto previous = daemon::ReloadableConfig::capture(before);
    auto next = daemon::ReloadableConfig::capture(after);

    if (previous.listenerChanged(next)) {
        std::cout << "ℹ Restart the daemon to move the status API\n";
    }

    bool reloadable = previous.log_level != next.log_level ||
                      previous.bootstrap_admins != next.bootstrap_admins;
    if (!reloadable) {
        std::cout << "ℹ Restart the daemon to apply this change\n";
        return;
    }

    if (daemon::DaemonServer::sendSignalToDaemon(SIGHUP)) {
        std::cout << "ℹ Daemon reload requested\n";
    } else {
        std::cout << "⚠ Failed to signal the daemon; run: access-guard daemon reload\n";
    }
}

int ConfigCommand::executeSet() {
    return applyAndSave(set_key_ + " = " + set_value_, [this](common::GlobalConfig&) {
        bool applied = false;
        try {
            applied = common::Config::instance().setValue(set_key_, set_value_);
        } catch (const std::invalid_argument&) {
            applied = false;
        } catch (const std::out_of_range&) {
            applied = false;
        }

        if (!applied) {
            std::cerr << "Invalid key or value: " << set_key_ << " = " << set_value_ << "\n";
        }
        return applied;
    });
}

int ConfigCommand::executeAccount() {
    if (account_add_cmd_->parsed()) {
        return applyAndSave("Account " + account_id_ + " owned by " + account_owner_,
                            [this](common::GlobalConfig& global) {
            global.compliance.bank_accounts[account_id_] = account_owner_;
            return true;
        });
    }

    if (account_remove_cmd_->parsed()) {
        return applyAndSave("Account " + account_id_ + " removed", [this](common::GlobalConfig& global) {
            if (global.compliance.bank_accounts.erase(account_id_) == 0) {
                std::cerr << "Unknown account: " << account_id_ << "\n";
                return false;
            }
            return true;
        });
    }

    if (account_list_cmd_->parsed()) {
        printMap("Accounts", common::Config::instance().global().compliance.bank_accounts, "owned by");
        return 0;
    }

    std::cout << account_cmd_->help() << std::endl;
    return 0;
}

int ConfigCommand::executeGate() {
    if (gate_add_cmd_->parsed()) {
        return applyAndSave("Resource " + gate_resource_ + " requires " + gate_consent_,
                            [this](common::GlobalConfig& global) {
            global.consent.gated_resources[gate_resource_] = gate_consent_;
            return true;
        });
    }

    if (gate_remove_cmd_->parsed()) {
        return applyAndSave("Resource " + gate_resource_ + " no longer gated",
                            [this](common::GlobalConfig& global) {
            if (global.consent.gated_resources.erase(gate_resource_) == 0) {
                std::cerr << "Resource type is not gated: " << gate_resource_ << "\n";
                return false;
            }
            return true;
        });
    }

    if (gate_list_cmd_->parsed()) {
        printMap("Gated resources", common::Config::instance().global().consent.gated_resources, "requires");
        return 0;
    }

    std::cout << gate_cmd_->help() << std::endl;
    return 0;
}

int ConfigCommand::executeGet() {
    auto& config = common::Config::instance();

    if (get_key_.empty()) {
        for (const auto& key : common::Config::knownKeys()) {
            auto value = config.getValue(key);
            std::cout << key << " = " << (value ? *value : "") << "\n";
        }
        return 0;
    }

    auto value = config.getValue(get_key_);
    if (!value) {
        std::cerr << "Unknown configuration key: " << get_key_ << "\n";
        return 1;
    }

    std::cout << *value << "\n";
    return 0;
}

int ConfigCommand::executeShow() {
    std::string config_path = common::Config::instance().getConfigPath();

    std::ifstream file(config_path);
    if (!file) {
        std::cerr << "Cannot read " << config_path << "\n";
        std::cerr << "Run: access-guard config init\n";
        return 1;
    }

    std::cout << "# " << config_path << "\n";
    std::cout << file.rdbuf();
    return 0;
}

int ConfigCommand::executeValidate() {
    std::string config_path = common::Config::instance().getConfigPath();

    config::ConfigValidator validator;
    auto result = validator.validateFile(config_path);

    for (const auto& error : result.errors) {
        std::cout << "ERROR: " << error << "\n";
    }
    for (const auto& warning : result.warnings) {
        std::cout << "WARNING: " << warning << "\n";
    }

    std::cout << config_path << ": " << (result.is_valid ? "valid" : "invalid")
              << " (" << result.errors.size() << " errors, "
              << result.warnings.size() << " warnings)\n";
    return result.is_valid ? 0 : 1;
}

}}
