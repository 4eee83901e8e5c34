#include "main_command.hpp"

namespace access_guard {
namespace cli {

MainCommand::MainCommand() = default;
MainCommand::~MainCommand() = default;

void MainCommand::markCalledOn(CLI::App* command) {
    command->callback([this]() { was_called_ = true; });
}

}}
