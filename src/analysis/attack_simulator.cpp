#include "fluttersec/analysis/attack_simulator.hpp"
#include "fluttersec/common/constants.hpp"
#include <algorithm>
#include <cctype>

namespace fluttersec {
namespace analysis {

using common::AttackerLevel;
using common::AttackerProfile;
using common::Finding;
using common::Severity;

namespace {

std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

bool referencesEnvFile(const Finding& finding) {
    return lower(finding.title).find(".env") != std::string::npos ||
           lower(finding.description).find("environment configuration file") != std::string::npos;
}

size_t countSeverity(const std::vector<Finding>& findings, Severity severity) {
    return static_cast<size_t>(std::count_if(findings.begin(), findings.end(),
        [severity](const Finding& f) { return f.severity == severity; }));
}

}

const std::vector<AttackerProfile>& attackerProfiles() {
    static const std::vector<AttackerProfile> profiles = {
        {AttackerLevel::BEGINNER, "Beginner (Script Kiddie)", 5, 0.60,
         {"unzip", "strings", "basic text editors"},
         {"Extract APK/IPA files", "View assets and configs", "Search for .env files",
          "Read basic text files"}},
        {AttackerLevel::INTERMEDIATE, "Intermediate (Security Researcher)", 30, 0.85,
         {"APKTool", "JADX", "Burp Suite", "strings", "grep"},
         {"Everything from beginner", "Decompile code", "Analyze network traffic",
          "Intercept API calls", "Read manifest/plist files", "Extract strings from binaries"}},
        {AttackerLevel::ADVANCED, "Advanced (Professional Hacker)", 240, 0.95,
         {"Frida", "IDA Pro", "Ghidra", "Hopper", "reFlutter", "Blutter", "Custom scripts"},
         {"Everything from intermediate", "Runtime code injection", "Bypass SSL pinning",
          "Bypass root/jailbreak detection", "Dump complete Dart code", "Dynamic instrumentation",
          "Memory analysis", "Patch binaries"}}
    };
    return profiles;
}

const AttackerProfile& attackerProfile(AttackerLevel level) {
    const auto& profiles = attackerProfiles();
    auto it = std::find_if(profiles.begin(), profiles.end(),
                           [level](const AttackerProfile& p) { return p.level == level; });
    return it != profiles.end() ? *it : profiles.back();
}

bool AttackSimulator::matches(const Finding& finding, AttackerLevel level) {
    switch (level) {
        case AttackerLevel::BEGINNER:
            return finding.severity == Severity::CRITICAL && referencesEnvFile(finding);
        case AttackerLevel::INTERMEDIATE:
            return finding.severity == Severity::CRITICAL || finding.severity == Severity::HIGH;
        case AttackerLevel::ADVANCED:
            return true;
    }
    return false;
}

bool AttackSimulator::canExploit(const std::vector<Finding>& findings, AttackerLevel level) {
    return std::any_of(findings.begin(), findings.end(),
                       [level](const Finding& f) { return matches(f, level); });
}

int AttackSimulator::timeToCompromise(const std::vector<Finding>& findings, AttackerLevel level) {
    auto critical = static_cast<int>(countSeverity(findings, Severity::CRITICAL));
    auto high = static_cast<int>(countSeverity(findings, Severity::HIGH));

    switch (level) {
        case AttackerLevel::BEGINNER:
            return canExploit(findings, level) ? 2 : 0;
        case AttackerLevel::INTERMEDIATE:
            if (critical > 0) return std::min(10, 5 + critical * 2);
            if (high > 0) return std::min(45, 15 + high * 5);
            return 0;
        case AttackerLevel::ADVANCED:
            if (findings.empty()) return 0;
            if (critical > 0) return 30;
            if (high > 0) return 90;
            return 180;
    }
    return 0;
}

std::vector<std::string> AttackSimulator::exploitableFindings(const std::vector<Finding>& findings,
                                                              AttackerLevel level) {
    std::vector<std::string> titles;
    for (const auto& finding : findings) {
        if (titles.size() >= constants::limits::MAX_EXPLOITABLE_FINDINGS) break;
        if (matches(finding, level)) {
            titles.push_back(finding.title);
        }
    }
    return titles;
}

common::AttackSimulationOutcome AttackSimulator::simulate(const std::vector<Finding>& findings) const {
    common::AttackSimulationOutcome outcome;

    for (const auto& profile : attackerProfiles()) {
        common::ProfileOutcome po;
        po.level = profile.level;
        po.exploitable = canExploit(findings, profile.level);
        po.minutes = timeToCompromise(findings, profile.level);
        po.exploitable_findings = exploitableFindings(findings, profile.level);
        outcome.profiles.push_back(std::move(po));
    }

    outcome.selected = AttackerLevel::ADVANCED;
    for (const auto& po : outcome.profiles) {
        if (po.exploitable) {
            outcome.selected = po.level;
            break;
        }
    }

    const auto* chosen = outcome.outcomeFor(outcome.selected);
    outcome.compromised = chosen && chosen->exploitable;
    outcome.time_to_compromise_minutes = chosen ? chosen->minutes : 0;
    outcome.scenario = scenario(findings, outcome.selected, outcome.compromised);
    outcome.defenses = defenseRecommendations(outcome.selected);
    return outcome;
}

std::vector<std::string> AttackSimulator::scenario(const std::vector<Finding>& findings,
                                                   AttackerLevel level, bool exploitable) {
    const auto& profile = attackerProfile(level);
    std::vector<std::string> lines;

    std::string tools;
    for (size_t i = 0; i < profile.tools.size() && i < 3; ++i) {
        if (i > 0) tools += ", ";
        tools += profile.tools[i];
    }

    lines.push_back("**Attacker Profile**: " + profile.label);
    lines.push_back("**Tools Required**: " + tools);
    lines.push_back("**Success Rate**: " + std::to_string(static_cast<int>(profile.success_rate * 100 + 0.5)) + "%");
    lines.push_back("**Exploitable Findings**: " + std::to_string(exploitableFindings(findings, level).size()) +
                    " of " + std::to_string(findings.size()));
    lines.push_back("");

    if (!exploitable) {
        lines.push_back("**Result**: No exploitable findings identified");
        return lines;
    }

    lines.push_back("**Attack Timeline**:");

    switch (level) {
        case AttackerLevel::BEGINNER:
            lines.push_back("- [00:00:30] Download APK/IPA from device or store");
            lines.push_back("- [00:01:00] Extract using unzip command");
            lines.push_back("- [00:01:30] Navigate to assets/flutter_assets/");
            lines.push_back("- [00:02:00] Found .env file with API endpoints");
            lines.push_back("- [00:02:30] Extracted all sensitive configuration");
            lines.push_back("");
            lines.push_back("**Result**: Full API access obtained in < 3 minutes");
            break;
        case AttackerLevel::INTERMEDIATE:
            lines.push_back("- [00:00] Download and extract app");
            lines.push_back("- [00:05] Decompile with APKTool/JADX");
            lines.push_back("- [00:10] Extract .env and config files");
            lines.push_back("- [00:15] Analyze AndroidManifest/Info.plist");
            lines.push_back("- [00:20] Extract strings from libapp.so/App binary");
            lines.push_back("- [00:25] Map all API endpoints");
            lines.push_back("- [00:30] Complete app infrastructure mapped");
            lines.push_back("");
            lines.push_back("**Result**: Full understanding of app architecture");
            break;
        case AttackerLevel::ADVANCED:
            lines.push_back("- [00:00] Extract and decompile app");
            lines.push_back("- [00:30] Run Blutter to dump Dart classes");
            lines.push_back("- [01:00] Analyze business logic");
            lines.push_back("- [01:30] Setup Frida for runtime analysis");
            lines.push_back("- [02:00] Bypass SSL pinning");
            lines.push_back("- [02:30] Bypass root/jailbreak detection");
            lines.push_back("- [03:00] Intercept and modify API calls");
            lines.push_back("- [04:00] Complete compromise achieved");
            lines.push_back("");
            lines.push_back("**Result**: Full control over app behavior");
            break;
    }
    return lines;
}

std::vector<std::string> AttackSimulator::defenseRecommendations(AttackerLevel level) {
    switch (level) {
        case AttackerLevel::BEGINNER:
            return {
                "1. Remove .env files from production builds immediately",
                "2. Move sensitive data to compile-time constants",
                "3. Verify assets don't contain secrets",
                "4. This will block most unsophisticated attacks"
            };
        case AttackerLevel::INTERMEDIATE:
            return {
                "1. Fix all beginner-level issues",
                "2. Enable code obfuscation (--obfuscate flag)",
                "3. Implement certificate pinning",
                "4. Add root/jailbreak detection",
                "5. Use ProGuard aggressive mode (Android)"
            };
        case AttackerLevel::ADVANCED:
            return {
                "1. Fix all intermediate-level issues",
                "2. Implement tamper detection",
                "3. Use native code for sensitive logic",
                "4. Add runtime integrity checks",
                "5. Implement Play Integrity API (Android)",
                "6. Monitor for suspicious behavior",
                "7. Consider bug bounty program",
                "Note: Advanced attackers are very difficult to stop completely"
            };
    }
    return {};
}

}}
