#include "fluttersec/detect/env_file_detector.hpp"
#include "fluttersec/detect/asset_walker.hpp"
#include "fluttersec/common/constants.hpp"
#include "fluttersec/common/logger.hpp"
#include "fluttersec/extract/byte_reader.hpp"
#include <algorithm>
#include <sstream>

namespace fs = std::filesystem;

namespace fluttersec {
namespace detect {

using common::Finding;
using common::Remediation;
using common::Severity;

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

}

std::vector<Finding> EnvFileDetector::scan(const ScanContext& ctx) const {
    std::vector<Finding> findings;

    forEachAssetFile(ctx, [&](const fs::path& file) {
        std::string filename = file.filename().string();
        const auto& names = ctx.rules.env_files;
        if (std::find(names.begin(), names.end(), filename) == names.end()) {
            return;
        }

        std::string rel = ctx.layout.relativePath(file);
        std::vector<std::string> keys;
        std::vector<uint8_t> content;
        if (extract::read_file_bytes(file.string(), content, constants::limits::MAX_ENV_FILE_SIZE)) {
            keys = extractSensitiveKeys(std::string(content.begin(), content.end()),
                                        ctx.rules.sensitive_key_tokens);
        } else {
            common::Logger::instance().warn("[EnvFiles] Keys not read, file unreadable or too large | path={} | limit={}",
                                           rel, common::formatBytes(constants::limits::MAX_ENV_FILE_SIZE));
        }

        common::Logger::instance().debug("[EnvFiles] Match | path={} | sensitive_keys={}", rel, keys.size());
        findings.push_back(makeFinding(filename, rel, keys));
    });

    return findings;
}

std::vector<std::string> EnvFileDetector::extractSensitiveKeys(const std::string& content,
                                                               const std::vector<std::string>& tokens) {
    std::vector<std::string> keys;
    std::istringstream stream(content);
    std::string line;

    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        if (!key.empty() && containsAny(toLower(key), tokens)) {
            keys.push_back(key);
        }
    }
    return keys;
}

Finding EnvFileDetector::makeFinding(const std::string& filename, const std::string& rel_path,
                                     const std::vector<std::string>& keys) {
    const size_t limit = constants::limits::MAX_DESCRIPTION_SAMPLES;

    std::string sample;
    for (size_t i = 0; i < keys.size() && i < limit; ++i) {
        if (i > 0) sample += ", ";
        sample += keys[i];
    }

    Finding finding;
    finding.severity = Severity::CRITICAL;
    finding.title = filename + " File Exposed";
    finding.description = "Environment configuration file found at '" + rel_path + "'. "
                          "This file is completely unprotected and can be extracted in < 30 seconds. "
                          "Found " + std::to_string(keys.size()) + " sensitive keys: " + sample +
                          (keys.size() > limit ? "..." : "");
    finding.file_path = rel_path;
    finding.remediation = remediation(filename);
    finding.owasp_category = "M9: Reverse Engineering";
    finding.cwe_id = "CWE-312: Cleartext Storage of Sensitive Information";
    finding.cvss_score = 9.1;
    return finding;
}

Remediation EnvFileDetector::remediation(const std::string& filename) {
    Remediation r;
    r.summary = "Remove .env file from production builds";
    r.root_cause = "The file '" + filename + "' was included in pubspec.yaml assets section";
    r.why_wrong = "Flutter bundles all assets directly into the APK/IPA. "
                  "Anyone can extract the file using simple unzip command. "
                  "This exposes all API endpoints, keys, and sensitive configuration.";
    r.fix_steps = {
        "1. Remove .env from pubspec.yaml assets section",
        "2. Create lib/core/config/app_config.dart with compile-time constants",
        "3. Replace dotenv.env['KEY'] with AppConfig.key",
        "4. Rebuild: flutter clean && flutter build apk --release",
        "5. Verify: Re-scan with fluttersec to confirm .env is removed"
    };
    r.code_before = "# pubspec.yaml\n"
                    "flutter:\n"
                    "  assets:\n"
                    "    - .env  # EXPOSED in production build";
    r.code_after = "# pubspec.yaml\n"
                   "flutter:\n"
                   "  assets:\n"
                   "    # - .env  # REMOVED for security\n"
                   "\n"
                   "# lib/core/config/app_config.dart\n"
                   "class AppConfig {\n"
                   "  static const baseUrl = 'https://api.example.com';\n"
                   "  static const apiPrefix = '/api/v1';\n"
                   "\n"
                   "  static String get apiBaseUrl => '$baseUrl$apiPrefix';\n"
                   "}";
    r.verification = "Run: fluttersec scan app-release.apk\nExpected: No .env findings";
    r.references = {
        "https://owasp.org/www-project-mobile-top-10/",
        "https://docs.flutter.dev/deployment/obfuscate"
    };
    return r;
}

}}
