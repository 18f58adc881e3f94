#include "fluttersec/detect/detection_rules.hpp"
#include "fluttersec/common/constants.hpp"
#include <algorithm>
#include <cctype>

namespace fluttersec {
namespace detect {

using common::Severity;

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

bool containsAny(const std::string& haystack, const std::vector<std::string>& needles) {
    return std::any_of(needles.begin(), needles.end(), [&](const std::string& needle) {
        return haystack.find(needle) != std::string::npos;
    });
}

Severity severityForPattern(const std::string& pattern_name) {
    if (pattern_name == "aws_key" || pattern_name == "private_key" || pattern_name == "secret" ||
        pattern_name == "api_key" || pattern_name == "token") {
        return Severity::CRITICAL;
    }
    if (pattern_name == "url") {
        return Severity::HIGH;
    }
    if (pattern_name == "email" || pattern_name == "ip") {
        return Severity::MEDIUM;
    }
    return Severity::LOW;
}

DetectionRules DetectionRules::defaults() {
    DetectionRules rules;

    rules.env_files = {
        ".env", ".env.production", ".env.development", ".env.local", ".env.staging",
        "config.json", "secrets.json", "credentials.json"
    };

    rules.sensitive_key_tokens = {
        "api", "key", "secret", "token", "password", "auth",
        "url", "endpoint", "host", "server", "id", "credential"
    };

    rules.sensitive_extensions = {
        ".key", ".pem", ".p12", ".pfx", ".jks", ".keystore",
        ".db", ".sqlite", ".sqlite3", ".realm",
        ".json", ".xml", ".yaml", ".yml", ".toml", ".ini"
    };

    rules.sensitive_filenames = {
        "google-services.json", "googleservice-info.plist",
        "firebase_options.dart", "secrets.dart",
        "config.json", "settings.json", "credentials.json",
        "database.db", "app.db", "user.db",
        "keystore.jks", "key.jks", "release.keystore"
    };

    rules.asset_whitelist = {
        "fontmanifest.json", "assetmanifest.json", "kernel_blob.bin", "isolate_snapshot"
    };

    rules.key_material_tokens = {".key", ".pem", ".p12", ".pfx", ".jks", "keystore"};
    rules.database_tokens = {".db", ".sqlite", ".realm"};
    rules.credential_tokens = {"secret", "credential", "password"};
    rules.firebase_tokens = {"firebase", "google-services"};

    struct PatternDef {
        const char* name;
        const char* regex;
        bool case_insensitive;
        const char* title;
        std::vector<std::string> literals;
    };

    const std::vector<PatternDef> patterns = {
        {"api_key", "api[_-]?key|apikey", true, "API Keys in Binary", {"api"}},
        {"secret", "secret|password|passwd|pwd", true, "Secrets in Binary", {"secret", "passw", "pwd"}},
        {"token", "token|auth[_-]?token", true, "Tokens in Binary", {"token"}},
        {"url", "https?://[a-zA-Z0-9.-]+\\.[a-zA-Z]{2,}", false, "URLs Exposed in Binary", {"://"}},
        {"email", "[a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\\.[a-zA-Z]{2,}", false, "Email Addresses in Binary", {"@"}},
        {"ip", "\\b\\d{1,3}\\.\\d{1,3}\\.\\d{1,3}\\.\\d{1,3}\\b", false, "IP Addresses in Binary", {"."}},
        {"aws_key", "AKIA[0-9A-Z]{16}", false, "AWS Access Keys in Binary", {"AKIA"}},
        {"private_key", "-----BEGIN (?:RSA )?PRIVATE KEY-----", false, "Private Keys in Binary", {"-----BEGIN"}},
    };

    for (const auto& def : patterns) {
        rules.string_patterns.push_back({def.name, def.regex, def.case_insensitive,
                                         severityForPattern(def.name), def.title, def.literals});
    }

    rules.whitelisted_domains = {
        "schemas.android.com", "xmlpull.org", "w3.org",
        "apache.org", "eclipse.org", "tile.openstreetmap.org"
    };

    rules.min_string_length = constants::limits::DEFAULT_MIN_STRING_LENGTH;
    rules.max_string_length = constants::limits::DEFAULT_MAX_STRING_LENGTH;
    rules.max_binary_scan_bytes = constants::limits::DEFAULT_MAX_BINARY_SCAN_MB * 1024 * 1024;

    return rules;
}

DetectionRules DetectionRules::fromConfig(const common::GlobalConfig& config) {
    DetectionRules rules = defaults();

    auto append = [](std::vector<std::string>& target, const std::vector<std::string>& extra, bool lower) {
        for (const auto& item : extra) {
            std::string value = lower ? toLower(item) : item;
            if (!value.empty() && std::find(target.begin(), target.end(), value) == target.end()) {
                target.push_back(value);
            }
        }
    };

    append(rules.env_files, config.rules.extra_env_files, false);
    append(rules.sensitive_extensions, config.rules.extra_sensitive_extensions, true);
    append(rules.sensitive_filenames, config.rules.extra_sensitive_filenames, true);
    append(rules.whitelisted_domains, config.rules.extra_whitelisted_domains, true);

    rules.min_string_length = std::max<size_t>(1, config.scan.min_string_length);
    rules.max_string_length = std::max(rules.min_string_length, config.scan.max_string_length);
    rules.max_binary_scan_bytes = config.scan.max_binary_scan_mb * 1024 * 1024;

    return rules;
}

}}
