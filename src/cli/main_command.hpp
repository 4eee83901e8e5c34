#pragma once

#include <CLI/CLI.hpp>
#include <string>

namespace access_guard {
namespace cli {

class MainCommand {
public:
    MainCommand();
    virtual ~MainCommand();

    bool wasCalled() const { return was_called_; }
    virtual int execute() = 0;

protected:
    CLI::App* subcommand_ = nullptr;
    bool was_called_ = false;

    void markCalledOn(CLI::App* command);
};

}}
