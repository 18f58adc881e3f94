#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "fluttersec/common/config.hpp"
#include "fluttersec/common/constants.hpp"
#include "fluttersec/common/logger.hpp"
#include "cli/scan_command.hpp"
#include "cli/config_command.hpp"

// The configuration is needed before CLI11 parses, so --config is read early.
std::string find_config_argument(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            return argv[i + 1];
        }
        const std::string prefix = "--config=";
        if (arg.compare(0, prefix.size(), prefix) == 0) {
            return arg.substr(prefix.size());
        }
    }
    return "";
}

bool has_flag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (flag == argv[i]) {
            return true;
        }
    }
    return false;
}

int main(int argc, char** argv) {
    try {
        CLI::App app{fluttersec::constants::system::APPLICATION_NAME, "fluttersec"};
        app.set_version_flag("--version", fluttersec::constants::version::getFullVersion());
        app.require_subcommand(0, 1);

        std::string config_file;
        bool log_to_file = false;
        app.add_option("-c,--config", config_file, "Configuration file path");
        app.add_flag("--log-to-file", log_to_file, "Write logs to global.log_file instead of stderr");

        auto& config = fluttersec::common::Config::instance();
        if (!config.load(find_config_argument(argc, argv))) {
            std::cerr << "Warning: configuration could not be parsed, using defaults" << std::endl;
            config.reset();
        }

        fluttersec::common::Logger::instance().initialize(
            has_flag(argc, argv, "--log-to-file") ? fluttersec::common::LogMode::FILE_ONLY
                                                   : fluttersec::common::LogMode::CONSOLE_ONLY,
            config.global().log_file,
            config.global().log_level,
            config.global().logging
        );

        std::vector<std::pair<std::unique_ptr<fluttersec::cli::MainCommand>, CLI::App*>> commands;
        commands.emplace_back(std::make_unique<fluttersec::cli::ScanCommand>(),
                              app.add_subcommand("scan", "Audit an APK or IPA package"));
        commands.emplace_back(std::make_unique<fluttersec::cli::ConfigCommand>(),
                              app.add_subcommand("config", "Manage configuration"));

        for (auto& [command, subcommand] : commands) {
            command->setup(subcommand);
        }

        CLI11_PARSE(app, argc, argv);

        int rc = 0;
        bool dispatched = false;
        for (auto& entry : commands) {
            if (entry.first->wasCalled()) {
                rc = entry.first->execute();
                dispatched = true;
                break;
            }
        }
        if (!dispatched) {
            std::cout << app.help() << std::endl;
        }

        fluttersec::common::Logger::instance().shutdown();
        return rc;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
