#include "main_command.hpp"

namespace fluttersec {
namespace cli {

MainCommand::MainCommand() = default;
MainCommand::~MainCommand() = default;

bool MainCommand::validateArguments() const {
    return true;
}

void MainCommand::markCalledOn(CLI::App* app) {
    app->callback([this]() { was_called_ = true; });
}

}}
