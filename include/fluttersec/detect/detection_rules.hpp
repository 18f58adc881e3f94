#pragma once

#include "../common/config.hpp"
#include "../common/types.hpp"
#include <string>
#include <vector>

namespace fluttersec {
namespace detect {

struct StringPattern {
    std::string name;
    std::string regex;
    bool case_insensitive;
    common::Severity severity;
    std::string title;
    // The regex only runs on strings containing one of these literals
    // (lowercase when case_insensitive). Empty means always run.
    std::vector<std::string> required_literals;
};

// Fixed vocabularies used by the detectors. defaults() holds the built-in
// tables; fromConfig() appends the [rules] entries of the configuration.
struct DetectionRules {
    std::vector<std::string> env_files;
    std::vector<std::string> sensitive_key_tokens;

    std::vector<std::string> sensitive_extensions;
    std::vector<std::string> sensitive_filenames;
    std::vector<std::string> asset_whitelist;
    std::vector<std::string> key_material_tokens;
    std::vector<std::string> database_tokens;
    std::vector<std::string> credential_tokens;
    std::vector<std::string> firebase_tokens;

    std::vector<StringPattern> string_patterns;
    std::vector<std::string> whitelisted_domains;
    size_t min_string_length;
    size_t max_string_length;
    size_t max_binary_scan_bytes;

    static DetectionRules defaults();
    static DetectionRules fromConfig(const common::GlobalConfig& config);
};

common::Severity severityForPattern(const std::string& pattern_name);

std::string toLower(std::string value);
bool containsAny(const std::string& haystack, const std::vector<std::string>& needles);

}}
