#include "config_command.hpp"
#include "fluttersec/common/config.hpp"
#include "fluttersec/common/logger.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <unistd.h>

namespace fluttersec {
namespace cli {

ConfigCommand::ConfigCommand() = default;

void ConfigCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    init_cmd_ = subcommand->add_subcommand("init", "Write a configuration file with default values");
    init_cmd_->add_flag("--force", init_force_, "Overwrite an existing configuration file");
    markCalledOn(init_cmd_);

    set_cmd_ = subcommand->add_subcommand("set", "Set configuration value");
    set_cmd_->add_option("key", set_key_, "Configuration key (e.g. scan.min_string_length)")->required();
    set_cmd_->add_option("value", set_value_, "Configuration value")->required();
    markCalledOn(set_cmd_);

    get_cmd_ = subcommand->add_subcommand("get", "Get configuration value");
    get_cmd_->add_option("key", get_key_, "Configuration key (optional)");
    markCalledOn(get_cmd_);

    show_cmd_ = subcommand->add_subcommand("show", "Show configuration file");
    markCalledOn(show_cmd_);

    markCalledOn(subcommand);
}

int ConfigCommand::execute() {
    if (init_cmd_->parsed()) {
        return executeInit();
    } else if (set_cmd_->parsed()) {
        return executeSet();
    } else if (get_cmd_->parsed()) {
        return executeGet();
    } else if (show_cmd_->parsed()) {
        return executeShow();
    }

    std::cout << subcommand_->help() << std::endl;
    return 0;
}

int ConfigCommand::executeInit() {
    auto& config = common::Config::instance();
    std::string config_path = config.getConfigPath();

    if (config.exists() && !init_force_) {
        std::cerr << "Configuration already exists: " << config_path << "\n";
        std::cerr << "Use --force to overwrite it.\n";
        return 1;
    }

    std::string log_file = config.global().log_file;
    config.reset();
    config.global().log_file = log_file;
    if (!config.save(config_path)) {
        std::cerr << "Error: cannot write configuration to " << config_path << "\n";
        return 1;
    }

    std::cout << "Configuration written: " << config_path << "\n";
    return 0;
}

int ConfigCommand::executeSet() {
    auto& config = common::Config::instance();
    std::string config_path = config.getConfigPath();

    if (config.exists() && !canWriteConfig(config_path)) {
        std::cerr << "Error: Permission denied\n\n";
        std::cerr << "Resource: " << config_path << "\n";
        std::cerr << "Check file permissions: ls -l " << config_path << "\n";
        return 1;
    }

    if (!config.setValue(set_key_, set_value_)) {
        std::cerr << "Invalid key or value: " << set_key_ << " = " << set_value_ << "\n\n";
        std::cerr << "Known keys:\n";
        for (const auto& key : common::Config::knownKeys()) {
            std::cerr << "  " << key << "\n";
        }
        return 1;
    }

    if (!config.save()) {
        std::cerr << "Error: cannot write configuration to " << config_path << "\n";
        return 1;
    }

    std::cout << "Configuration updated: " << set_key_ << " = " << set_value_ << "\n";
    return 0;
}

int ConfigCommand::executeGet() {
    auto& config = common::Config::instance();

    if (get_key_.empty()) {
        std::cout << "Configuration (" << config.getConfigPath() << "):\n";
        for (const auto& key : common::Config::knownKeys()) {
            auto value = config.getValue(key);
            std::cout << "  " << key << " = " << (value ? *value : "") << "\n";
        }
        return 0;
    }

    auto value = config.getValue(get_key_);
    if (!value) {
        std::cerr << "Unknown key: " << get_key_ << "\n";
        return 1;
    }
    std::cout << *value << "\n";
    return 0;
}

int ConfigCommand::executeShow() {
    auto& config = common::Config::instance();
    std::string config_path = config.getConfigPath();

    if (!config.exists()) {
        std::cerr << "Configuration file does not exist: " << config_path << "\n";
        std::cerr << "Run: fluttersec config init\n";
        return 1;
    }

    std::ifstream file(config_path);
    if (!file) {
        std::cerr << "Error: cannot read " << config_path << "\n";
        return 1;
    }

    std::cout << "Configuration file: " << config_path << "\n\n";
    std::string line;
    while (std::getline(file, line)) {
        std::cout << line << "\n";
    }
    return 0;
}

bool ConfigCommand::canWriteConfig(const std::string& config_path) const {
    return access(config_path.c_str(), W_OK) == 0;
}

}}
