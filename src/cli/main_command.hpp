#pragma once

#include <CLI/CLI.hpp>
#include <string>

namespace fluttersec {
namespace cli {

// One CLI11 subcommand. setup() registers options on the subcommand handed
// out by the app; execute() runs only when the subcommand was parsed.
class MainCommand {
public:
    MainCommand();
    virtual ~MainCommand();

    virtual void setup(CLI::App* subcommand) = 0;
    virtual int execute() = 0;
    virtual bool validateArguments() const;

    bool wasCalled() const { return was_called_; }

protected:
    CLI::App* subcommand_ = nullptr;
    bool was_called_ = false;

    // Flags the command as called when `app` is parsed.
    void markCalledOn(CLI::App* app);
};

}}
