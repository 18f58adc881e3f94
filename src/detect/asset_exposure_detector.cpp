#include "fluttersec/detect/asset_exposure_detector.hpp"
#include "fluttersec/detect/asset_walker.hpp"
#include "fluttersec/common/logger.hpp"
#include <algorithm>

namespace fs = std::filesystem;

namespace fluttersec {
namespace detect {

using common::Finding;
using common::Remediation;
using common::Severity;

std::optional<std::string> AssetExposureDetector::classify(const std::string& filename,
                                                           const DetectionRules& rules) {
    std::string lower = toLower(filename);

    if (containsAny(lower, rules.asset_whitelist)) {
        return std::nullopt;
    }

    std::string ext = toLower(fs::path(filename).extension().string());
    const auto& exts = rules.sensitive_extensions;
    if (!ext.empty() && std::find(exts.begin(), exts.end(), ext) != exts.end()) {
        return std::string("extension");
    }

    const auto& names = rules.sensitive_filenames;
    if (std::find(names.begin(), names.end(), lower) != names.end()) {
        return std::string("filename");
    }

    return std::nullopt;
}

Severity AssetExposureDetector::severityFor(const std::string& filename, const DetectionRules& rules) {
    std::string lower = toLower(filename);

    if (containsAny(lower, rules.key_material_tokens)) return Severity::CRITICAL;
    if (containsAny(lower, rules.database_tokens)) return Severity::CRITICAL;
    if (containsAny(lower, rules.credential_tokens)) return Severity::HIGH;
    if (containsAny(lower, rules.firebase_tokens)) return Severity::MEDIUM;
    return Severity::MEDIUM;
}

std::vector<Finding> AssetExposureDetector::scan(const ScanContext& ctx) const {
    std::vector<Finding> findings;

    forEachAssetFile(ctx, [&](const fs::path& file) {
        std::string filename = file.filename().string();
        auto reason = classify(filename, ctx.rules);
        if (!reason) {
            return;
        }

        std::error_code ec;
        auto size = fs::file_size(file, ec);
        if (ec) {
            common::Logger::instance().debug("[Assets] Stat failed | path={} | error={}",
                                            file.string(), ec.message());
            return;
        }

        std::string rel = ctx.layout.relativePath(file);

        Finding finding;
        finding.severity = severityFor(filename, ctx.rules);
        finding.title = "Sensitive File Exposed: " + filename;
        finding.description = "File '" + filename + "' (" + std::to_string(size) + " bytes) found at '" +
                              rel + "'. Detected as sensitive " + *reason + ". "
                              "This file should not be included in production builds.";
        finding.file_path = rel;
        finding.remediation = remediation(filename, ctx.rules);
        finding.owasp_category = "M2: Insecure Data Storage";
        finding.cwe_id = "CWE-312: Cleartext Storage of Sensitive Information";

        common::Logger::instance().debug("[Assets] Match | path={} | reason={} | severity={}",
                                        rel, *reason, common::to_string(finding.severity));
        findings.push_back(std::move(finding));
    });

    return findings;
}

Remediation AssetExposureDetector::remediation(const std::string& filename, const DetectionRules& rules) {
    Remediation r;

    if (containsAny(toLower(filename), rules.firebase_tokens)) {
        r.summary = "Restrict Firebase API keys in console";
        r.root_cause = "Firebase configuration files are expected in mobile apps";
        r.why_wrong = "Firebase API keys are meant to be public but must be restricted. "
                      "Without restrictions, attackers can abuse your Firebase services.";
        r.fix_steps = {
            "1. Go to Firebase Console > Project Settings > API Keys",
            "2. Restrict Android API key to your package name + SHA-1",
            "3. Restrict iOS API key to your bundle ID",
            "4. Enable App Check for additional security",
            "5. Monitor Firebase usage for anomalies"
        };
        r.references = {"https://firebase.google.com/docs/projects/api-keys"};
        return r;
    }

    r.summary = "Remove " + filename + " from production build";
    r.root_cause = "File was included in assets via pubspec.yaml or build configuration";
    r.why_wrong = "Sensitive files should never be bundled in production apps. "
                  "They can be extracted by anyone and may contain secrets.";
    r.fix_steps = {
        "1. Remove " + filename + " from pubspec.yaml assets",
        "2. Use secure storage (Keychain/KeyStore) for secrets instead",
        "3. Fetch sensitive data from secure backend at runtime",
        "4. Rebuild and verify file is removed"
    };
    r.verification = "Run: fluttersec scan app.apk\nVerify: " + filename + " not found";
    return r;
}

}}
