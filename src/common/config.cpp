#include "fluttersec/common/config.hpp"
#include "fluttersec/common/constants.hpp"
#include "fluttersec/common/paths.hpp"
#include "fluttersec/common/logger.hpp"
#include <toml.hpp>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <unistd.h>

namespace fluttersec {
namespace common {

namespace {

std::string joinList(const std::vector<std::string>& values) {
    std::string result;
    for (const auto& value : values) {
        if (!result.empty()) result += ",";
        result += value;
    }
    return result;
}

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto start = item.find_first_not_of(" \t");
        auto end = item.find_last_not_of(" \t");
        if (start != std::string::npos) {
            items.push_back(item.substr(start, end - start + 1));
        }
    }
    return items;
}

bool parseBool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes";
}

template<typename T>
void readIfPresent(const toml::value& section, const char* key, T& target) {
    if (section.contains(key)) {
        target = toml::find<T>(section, key);
    }
}

}

LogLevel parseLogLevel(const std::string& value, LogLevel fallback) {
    if (value == "DEBUG" || value == "debug") return LogLevel::DEBUG;
    if (value == "INFO" || value == "info") return LogLevel::INFO;
    if (value == "WARN" || value == "warn") return LogLevel::WARN;
    if (value == "ERROR" || value == "error") return LogLevel::ERROR;
    return fallback;
}

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

GlobalConfig Config::createDefaultConfig() {
    using namespace constants::config_defaults;

    GlobalConfig config;

    config.log_level = LogLevel::INFO;
    config.log_file = "";

    config.scan.min_string_length = MIN_STRING_LENGTH;
    config.scan.max_string_length = MAX_STRING_LENGTH;
    config.scan.max_binary_scan_mb = MAX_BINARY_SCAN_MB;
    config.scan.max_extracted_size_mb = MAX_EXTRACTED_SIZE_MB;
    config.scan.max_archive_entries = MAX_ARCHIVE_ENTRIES;
    config.scan.max_compression_ratio = MAX_COMPRESSION_RATIO;
    config.scan.parallel_detectors = PARALLEL_DETECTORS;
    config.scan.work_dir = "";

    config.logging.rotation_size_mb = LOG_ROTATION_SIZE_MB;
    config.logging.max_files = LOG_MAX_FILES;
    config.logging.format = LogFormat::TEXT;

    config.report.default_format = REPORT_DEFAULT_FORMAT;
    config.report.priority_limit = REPORT_PRIORITY_LIMIT;

    return config;
}

void Config::reset() {
    global_ = createDefaultConfig();
    current_config_path_.clear();
}

std::optional<std::string> Config::findBestConfig() const {
    auto paths = PathManager::instance().getConfigSearchPaths();

    for (const auto& path : paths) {
        if (std::filesystem::exists(path) && access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }

    return std::nullopt;
}

bool Config::load(const std::string& config_file) {
    try {
        global_ = createDefaultConfig();
        global_.log_file = PathManager::instance().getLogDir() + "/fluttersec.log";

        std::string effective_config_file = config_file;
        if (effective_config_file.empty()) {
            auto best = findBestConfig();
            effective_config_file = best ? *best : PathManager::instance().getConfigFile();
        }

        current_config_path_ = effective_config_file;

        bool loaded = tryLoadTomlFile(effective_config_file, "main config");

        Logger::instance().debug("[Config] Loaded | path={} | from_file={}",
                                effective_config_file, loaded);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Parse failed | error={}", e.what());
        return false;
    }
}

bool Config::tryLoadTomlFile(const std::string& path, const std::string& description) {
    if (!std::filesystem::exists(path)) {
        Logger::instance().debug("[Config] {} not found | path={}", description, path);
        return false;
    }

    if (access(path.c_str(), R_OK) != 0) {
        Logger::instance().debug("[Config] {} not readable | path={}", description, path);
        return false;
    }

    try {
        auto data = toml::parse(path);

        if (data.contains("global")) {
            const auto& section = data.at("global");
            readIfPresent(section, "log_file", global_.log_file);
            if (section.contains("log_level")) {
                global_.log_level = parseLogLevel(toml::find<std::string>(section, "log_level"),
                                                  global_.log_level);
            }
        }

        if (data.contains("scan")) {
            const auto& section = data.at("scan");
            readIfPresent(section, "min_string_length", global_.scan.min_string_length);
            readIfPresent(section, "max_string_length", global_.scan.max_string_length);
            readIfPresent(section, "max_binary_scan_mb", global_.scan.max_binary_scan_mb);
            readIfPresent(section, "max_extracted_size_mb", global_.scan.max_extracted_size_mb);
            readIfPresent(section, "max_archive_entries", global_.scan.max_archive_entries);
            readIfPresent(section, "max_compression_ratio", global_.scan.max_compression_ratio);
            readIfPresent(section, "parallel_detectors", global_.scan.parallel_detectors);
            readIfPresent(section, "work_dir", global_.scan.work_dir);
        }

        if (data.contains("logging")) {
            const auto& section = data.at("logging");
            readIfPresent(section, "rotation_size_mb", global_.logging.rotation_size_mb);
            readIfPresent(section, "max_files", global_.logging.max_files);
            if (section.contains("format")) {
                std::string format_str = toml::find<std::string>(section, "format");
                global_.logging.format = (format_str == "json") ? LogFormat::JSON : LogFormat::TEXT;
            }
        }

        if (data.contains("report")) {
            const auto& section = data.at("report");
            readIfPresent(section, "default_format", global_.report.default_format);
            readIfPresent(section, "priority_limit", global_.report.priority_limit);
        }

        if (data.contains("rules")) {
            const auto& section = data.at("rules");
            readIfPresent(section, "extra_env_files", global_.rules.extra_env_files);
            readIfPresent(section, "extra_sensitive_extensions", global_.rules.extra_sensitive_extensions);
            readIfPresent(section, "extra_sensitive_filenames", global_.rules.extra_sensitive_filenames);
            readIfPresent(section, "extra_whitelisted_domains", global_.rules.extra_whitelisted_domains);
        }

        Logger::instance().info("[Config] {} loaded | path={}", description, path);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().warn("[Config] {} parse failed | path={} | error={}",
                               description, path, e.what());
        return false;
    }
}

bool Config::save(const std::string& config_file) {
    try {
        std::string effective_config_file = config_file;
        if (effective_config_file.empty()) {
            effective_config_file = getConfigPath();
        }

        auto parent = std::filesystem::path(effective_config_file).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                Logger::instance().error("[Config] Directory creation failed | path={} | error={}",
                                        parent.string(), ec.message());
                return false;
            }
        }

        toml::value data = toml::table{
            {"global", toml::table{
                {"log_file", global_.log_file},
                {"log_level", to_string(global_.log_level)}
            }},
            {"scan", toml::table{
                {"min_string_length", global_.scan.min_string_length},
                {"max_string_length", global_.scan.max_string_length},
                {"max_binary_scan_mb", global_.scan.max_binary_scan_mb},
                {"max_extracted_size_mb", global_.scan.max_extracted_size_mb},
                {"max_archive_entries", global_.scan.max_archive_entries},
                {"max_compression_ratio", global_.scan.max_compression_ratio},
                {"parallel_detectors", global_.scan.parallel_detectors},
                {"work_dir", global_.scan.work_dir}
            }},
            {"logging", toml::table{
                {"rotation_size_mb", global_.logging.rotation_size_mb},
                {"max_files", global_.logging.max_files},
                {"format", global_.logging.format == LogFormat::JSON ? "json" : "text"}
            }},
            {"report", toml::table{
                {"default_format", global_.report.default_format},
                {"priority_limit", global_.report.priority_limit}
            }},
            {"rules", toml::table{
                {"extra_env_files", global_.rules.extra_env_files},
                {"extra_sensitive_extensions", global_.rules.extra_sensitive_extensions},
                {"extra_sensitive_filenames", global_.rules.extra_sensitive_filenames},
                {"extra_whitelisted_domains", global_.rules.extra_whitelisted_domains}
            }}
        };

        std::ofstream file(effective_config_file);
        if (!file) {
            Logger::instance().error("[Config] File open failed | path={}", effective_config_file);
            return false;
        }

        file << toml::format(data);
        file.close();

        current_config_path_ = effective_config_file;

        Logger::instance().info("[Config] Saved | path={}", effective_config_file);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Save failed | error={}", e.what());
        return false;
    }
}

bool Config::exists() const {
    return std::filesystem::exists(getConfigPath());
}

std::vector<std::string> Config::knownKeys() {
    return {
        "log_file", "log_level",
        "scan.min_string_length", "scan.max_string_length", "scan.max_binary_scan_mb",
        "scan.max_extracted_size_mb", "scan.max_archive_entries", "scan.max_compression_ratio",
        "scan.parallel_detectors", "scan.work_dir",
        "logging.rotation_size_mb", "logging.max_files", "logging.format",
        "report.default_format", "report.priority_limit",
        "rules.extra_env_files", "rules.extra_sensitive_extensions",
        "rules.extra_sensitive_filenames", "rules.extra_whitelisted_domains"
    };
}

bool Config::setValue(const std::string& key, const std::string& value) {
    try {
        if (key == "log_file") global_.log_file = value;
        else if (key == "log_level") global_.log_level = parseLogLevel(value, global_.log_level);
        else if (key == "scan.min_string_length") global_.scan.min_string_length = std::stoull(value);
        else if (key == "scan.max_string_length") global_.scan.max_string_length = std::stoull(value);
        else if (key == "scan.max_binary_scan_mb") global_.scan.max_binary_scan_mb = std::stoull(value);
        else if (key == "scan.max_extracted_size_mb") global_.scan.max_extracted_size_mb = std::stoull(value);
        else if (key == "scan.max_archive_entries") global_.scan.max_archive_entries = std::stoull(value);
        else if (key == "scan.max_compression_ratio") global_.scan.max_compression_ratio = std::stoull(value);
        else if (key == "scan.parallel_detectors") global_.scan.parallel_detectors = parseBool(value);
        else if (key == "scan.work_dir") global_.scan.work_dir = value;
        else if (key == "logging.rotation_size_mb") global_.logging.rotation_size_mb = std::stoull(value);
        else if (key == "logging.max_files") global_.logging.max_files = std::stoull(value);
        else if (key == "logging.format") {
            global_.logging.format = (value == "json") ? LogFormat::JSON : LogFormat::TEXT;
        }
        else if (key == "report.default_format") global_.report.default_format = value;
        else if (key == "report.priority_limit") global_.report.priority_limit = std::stoull(value);
        else if (key == "rules.extra_env_files") global_.rules.extra_env_files = splitList(value);
        else if (key == "rules.extra_sensitive_extensions") global_.rules.extra_sensitive_extensions = splitList(value);
        else if (key == "rules.extra_sensitive_filenames") global_.rules.extra_sensitive_filenames = splitList(value);
        else if (key == "rules.extra_whitelisted_domains") global_.rules.extra_whitelisted_domains = splitList(value);
        else {
            Logger::instance().warn("[Config] Unknown key | key={}", key);
            return false;
        }
    } catch (const std::exception& e) {
        Logger::instance().warn("[Config] Invalid value | key={} | value={} | error={}",
                               key, value, e.what());
        return false;
    }
    return true;
}

std::optional<std::string> Config::getValue(const std::string& key) const {
    if (key == "log_file") return global_.log_file;
    else if (key == "log_level") return to_string(global_.log_level);
    else if (key == "scan.min_string_length") return std::to_string(global_.scan.min_string_length);
    else if (key == "scan.max_string_length") return std::to_string(global_.scan.max_string_length);
    else if (key == "scan.max_binary_scan_mb") return std::to_string(global_.scan.max_binary_scan_mb);
    else if (key == "scan.max_extracted_size_mb") return std::to_string(global_.scan.max_extracted_size_mb);
    else if (key == "scan.max_archive_entries") return std::to_string(global_.scan.max_archive_entries);
    else if (key == "scan.max_compression_ratio") return std::to_string(global_.scan.max_compression_ratio);
    else if (key == "scan.parallel_detectors") return global_.scan.parallel_detectors ? "true" : "false";
    else if (key == "scan.work_dir") return global_.scan.work_dir;
    else if (key == "logging.rotation_size_mb") return std::to_string(global_.logging.rotation_size_mb);
    else if (key == "logging.max_files") return std::to_string(global_.logging.max_files);
    else if (key == "logging.format") return global_.logging.format == LogFormat::JSON ? "json" : "text";
    else if (key == "report.default_format") return global_.report.default_format;
    else if (key == "report.priority_limit") return std::to_string(global_.report.priority_limit);
    else if (key == "rules.extra_env_files") return joinList(global_.rules.extra_env_files);
    else if (key == "rules.extra_sensitive_extensions") return joinList(global_.rules.extra_sensitive_extensions);
    else if (key == "rules.extra_sensitive_filenames") return joinList(global_.rules.extra_sensitive_filenames);
    else if (key == "rules.extra_whitelisted_domains") return joinList(global_.rules.extra_whitelisted_domains);

    return std::nullopt;
}

std::string Config::getConfigPath() const {
    if (!current_config_path_.empty()) {
        return current_config_path_;
    }
    return PathManager::instance().getConfigFile();
}

}}
