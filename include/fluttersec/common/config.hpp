#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>

namespace fluttersec {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

struct ScanConfig {
    size_t min_string_length;
    size_t max_string_length;
    size_t max_binary_scan_mb;
    size_t max_extracted_size_mb;
    size_t max_archive_entries;
    size_t max_compression_ratio;
    bool parallel_detectors;
    std::string work_dir;
};

struct LoggingConfig {
    size_t rotation_size_mb;
    size_t max_files;
    LogFormat format;
};

struct ReportConfig {
    std::string default_format;
    size_t priority_limit;
};

// Entries appended to the built-in detection vocabularies.
struct RulesConfig {
    std::vector<std::string> extra_env_files;
    std::vector<std::string> extra_sensitive_extensions;
    std::vector<std::string> extra_sensitive_filenames;
    std::vector<std::string> extra_whitelisted_domains;
};

struct GlobalConfig {
    std::string log_file;
    LogLevel log_level;
    ScanConfig scan;
    LoggingConfig logging;
    ReportConfig report;
    RulesConfig rules;
};

class Config {
public:
    static Config& instance();

    bool load(const std::string& config_file = "");
    bool save(const std::string& config_file = "");
    bool exists() const;
    void reset();

    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }

    bool setValue(const std::string& key, const std::string& value);
    std::optional<std::string> getValue(const std::string& key) const;
    static std::vector<std::string> knownKeys();

    std::string getConfigPath() const;

    static GlobalConfig createDefaultConfig();

private:
    Config();
    GlobalConfig global_;
    std::string current_config_path_;

    std::optional<std::string> findBestConfig() const;
    bool tryLoadTomlFile(const std::string& path, const std::string& description);
};

LogLevel parseLogLevel(const std::string& value, LogLevel fallback = LogLevel::INFO);
std::string to_string(LogLevel level);

}}
