#pragma once

#include "error_framework.hpp"
#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <optional>

namespace fluttersec {
namespace common {

enum class Severity {
    CRITICAL = 0,
    HIGH = 1,
    MEDIUM = 2,
    LOW = 3,
    INFO = 4
};

enum class Platform {
    ANDROID,
    IOS,
    UNKNOWN
};

enum class AttackerLevel {
    BEGINNER,
    INTERMEDIATE,
    ADVANCED
};

struct Remediation {
    std::string summary;
    std::string root_cause;
    std::string why_wrong;
    std::vector<std::string> fix_steps;
    std::optional<std::string> code_before;
    std::optional<std::string> code_after;
    std::optional<std::string> verification;
    std::vector<std::string> references;
};

struct Finding {
    Severity severity = Severity::INFO;
    std::string title;
    std::string description;
    std::optional<std::string> file_path;
    std::optional<int> line_number;
    std::optional<Remediation> remediation;
    std::optional<std::string> owasp_category;
    std::optional<std::string> cwe_id;
    std::optional<double> cvss_score;
};

struct AttackerProfile {
    AttackerLevel level;
    std::string label;
    int baseline_minutes = 0;
    double success_rate = 0.0;
    std::vector<std::string> tools;
    std::vector<std::string> capabilities;
};

struct ProfileOutcome {
    AttackerLevel level = AttackerLevel::ADVANCED;
    bool exploitable = false;
    int minutes = 0;
    std::vector<std::string> exploitable_findings;
};

struct AttackSimulationOutcome {
    std::vector<ProfileOutcome> profiles;
    AttackerLevel selected = AttackerLevel::ADVANCED;
    int time_to_compromise_minutes = 0;
    bool compromised = false;
    std::vector<std::string> scenario;
    std::vector<std::string> defenses;

    const ProfileOutcome* outcomeFor(AttackerLevel level) const;
};

struct AnalysisResult {
    std::string app_name;
    std::string package_name;
    Platform platform = Platform::UNKNOWN;
    std::string file_path;
    bool is_flutter = false;
    std::vector<Finding> findings;
    int security_score = 100;
    std::string grade = "A";
    int attack_surface_score = 0;
    int time_to_compromise_minutes = 0;
    std::optional<AttackerLevel> attacker;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();

    std::map<Severity, size_t> countBySeverity() const;
};

constexpr int severityRank(Severity severity) {
    return static_cast<int>(severity);
}

std::vector<Severity> allSeverities();

std::string to_string(Severity severity);
std::string to_string(Platform platform);
std::string to_string(AttackerLevel level);

std::optional<Severity> parseSeverity(const std::string& value);
std::optional<AttackerLevel> parseAttackerLevel(const std::string& value);

std::string formatTimestamp(std::chrono::system_clock::time_point tp);

}}
