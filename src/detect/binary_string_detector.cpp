#include "fluttersec/detect/binary_string_detector.hpp"
#include "fluttersec/common/constants.hpp"
#include "fluttersec/common/logger.hpp"
#include <regex>
#include <unordered_set>

namespace fs = std::filesystem;

namespace fluttersec {
namespace detect {

using common::Finding;
using common::Remediation;

namespace {

struct CompiledPattern {
    const StringPattern* pattern;
    std::regex regex;
    std::unordered_set<std::string> seen;
    std::vector<std::string> ordered;

    bool mayMatch(const std::string& candidate, const std::string& lowered) const {
        if (pattern->required_literals.empty()) {
            return true;
        }
        return containsAny(pattern->case_insensitive ? lowered : candidate, pattern->required_literals);
    }
};

}

std::vector<Finding> BinaryStringDetector::scan(const ScanContext& ctx) const {
    std::vector<Finding> findings;

    auto binary = ctx.layout.primaryBinary();
    if (!binary) {
        common::Logger::instance().debug("[Strings] No native binary found | platform={}",
                                        common::to_string(ctx.layout.platform()));
        return findings;
    }

    StringExtractorOptions options;
    options.min_length = ctx.rules.min_string_length;
    options.max_length = ctx.rules.max_string_length;
    options.max_bytes = ctx.rules.max_binary_scan_bytes;
    options.chunk_size = constants::limits::STRING_READ_CHUNK;

    auto strings = StringExtractor::openFile(*binary, options);
    if (!strings) {
        common::Logger::instance().debug("[Strings] Binary unreadable | path={}", binary->string());
        return findings;
    }

    auto results = analyze(*strings, ctx);

    if (strings->truncated()) {
        common::Logger::instance().warn("[Strings] Scan limit reached | path={} | scanned={}",
                                       binary->string(), common::formatBytes(strings->bytesConsumed()));
    }

    std::string binary_name = binary->filename().string();
    std::string rel = ctx.layout.relativePath(*binary);

    for (const auto& result : results) {
        if (!result.matches.empty()) {
            findings.push_back(makeFinding(result, binary_name, rel));
        }
    }

    common::Logger::instance().debug("[Strings] Scanned | path={} | bytes={} | findings={}",
                                    rel, strings->bytesConsumed(), findings.size());
    return findings;
}

std::vector<BinaryStringDetector::PatternMatches> BinaryStringDetector::analyze(StringExtractor& strings,
                                                                              const ScanContext& ctx) {
    std::vector<CompiledPattern> compiled;
    compiled.reserve(ctx.rules.string_patterns.size());
    for (const auto& pattern : ctx.rules.string_patterns) {
        auto flags = std::regex::ECMAScript | std::regex::optimize;
        if (pattern.case_insensitive) {
            flags |= std::regex::icase;
        }
        compiled.push_back({&pattern, std::regex(pattern.regex, flags), {}, {}});
    }

    std::string candidate;
    std::string lowered;
    while (strings.next(candidate)) {
        checkCancelled(ctx);
        lowered = toLower(candidate);

        for (auto& cp : compiled) {
            if (!cp.mayMatch(candidate, lowered) || !std::regex_search(candidate, cp.regex)) {
                continue;
            }
            if (cp.pattern->name == "url" && containsAny(candidate, ctx.rules.whitelisted_domains)) {
                continue;
            }
            if (cp.seen.insert(candidate).second) {
                cp.ordered.push_back(candidate);
            }
        }
    }
    checkCancelled(ctx);

    std::vector<PatternMatches> results;
    results.reserve(compiled.size());
    for (auto& cp : compiled) {
        results.push_back({cp.pattern, std::move(cp.ordered)});
    }
    return results;
}

Finding BinaryStringDetector::makeFinding(const PatternMatches& matches, const std::string& binary_name,
                                          const std::string& rel_path) {
    const size_t limit = constants::limits::MAX_DESCRIPTION_SAMPLES;
    const auto& name = matches.pattern->name;

    std::string preview;
    for (size_t i = 0; i < matches.matches.size() && i < limit; ++i) {
        if (i > 0) preview += "\n";
        preview += "  - " + matches.matches[i];
    }
    if (matches.matches.size() > limit) {
        preview += "\n  ... and " + std::to_string(matches.matches.size() - limit) + " more";
    }

    Finding finding;
    finding.severity = matches.pattern->severity;
    finding.title = matches.pattern->title.empty() ? name + " Found" : matches.pattern->title;
    finding.description = "Found " + std::to_string(matches.matches.size()) + " instances of " + name +
                          " in " + binary_name + ":\n\n" + preview;
    finding.file_path = rel_path;
    finding.remediation = remediation(name);
    finding.owasp_category = "M9: Reverse Engineering";
    finding.cwe_id = "CWE-798: Use of Hard-coded Credentials";
    return finding;
}

Remediation BinaryStringDetector::remediation(const std::string& pattern_name) {
    Remediation r;
    r.summary = "Obfuscate or encrypt " + pattern_name + " in code";
    r.root_cause = "Sensitive strings are hardcoded in Dart/Flutter code";
    r.why_wrong = "Strings in compiled binaries can be extracted using simple tools. "
                  "Hardcoded secrets, URLs, and keys are visible to attackers.";
    r.fix_steps = {
        "1. Move sensitive values to secure backend",
        "2. Use runtime key derivation instead of hardcoding",
        "3. Enable Dart code obfuscation: flutter build --obfuscate",
        "4. Consider string encryption for critical values",
        "5. Use ProGuard aggressive mode (Android)"
    };
    r.code_before = "// BAD: Hardcoded in code\n"
                    "const apiKey = 'sk_live_123456789';\n"
                    "const apiUrl = 'https://api.example.com';";
    r.code_after = "// GOOD: Fetch from secure backend\n"
                   "class SecureConfig {\n"
                   "  static Future<String> getApiKey() async {\n"
                   "    // Fetch from your secure backend\n"
                   "    final response = await api.getConfig();\n"
                   "    return decrypt(response.encryptedKey);\n"
                   "  }\n"
                   "}";
    r.verification = "Run: strings libapp.so | grep -i 'api\\|secret'\nExpect: Obfuscated/encrypted values";
    return r;
}

}}
