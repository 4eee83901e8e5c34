#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <functional>
#include <string>
#include "access_guard/common/config.hpp"

namespace access_guard {
namespace cli {

class ConfigCommand : public MainCommand {
public:
    ConfigCommand();

    void setup(CLI::App* subcommand);
    int execute() override;

private:
    using Mutation = std::function<bool(common::GlobalConfig&)>;

    CLI::App* init_cmd_ = nullptr;
    bool init_force_ = false;

    CLI::App* set_cmd_ = nullptr;
    std::string set_key_;
    std::string set_value_;

    CLI::App* get_cmd_ = nullptr;
    std::string get_key_;

    CLI::App* show_cmd_ = nullptr;
    CLI::App* validate_cmd_ = nullptr;

    // Account ownership table consulted by the compliance checks.
    CLI::App* account_cmd_ = nullptr;
    CLI::App* account_add_cmd_ = nullptr;
    CLI::App* account_remove_cmd_ = nullptr;
    CLI::App* account_list_cmd_ = nullptr;
    std::string account_id_;
    std::string account_owner_;

    // Resource types that require a granted consent.
    CLI::App* gate_cmd_ = nullptr;
    CLI::App* gate_add_cmd_ = nullptr;
    CLI::App* gate_remove_cmd_ = nullptr;
    CLI::App* gate_list_cmd_ = nullptr;
    std::string gate_resource_;
    std::string gate_consent_;

    int executeInit();
    int executeSet();
    int executeGet();
    int executeShow();
    int executeValidate();
    int executeAccount();
    int executeGate();

    int applyAndSave(const std::string& description, const Mutation& mutate);
    bool ensureWritable(const std::string& config_path);
    void notifyDaemon(const common::GlobalConfig& before, const common::GlobalConfig& after);
};

}}
