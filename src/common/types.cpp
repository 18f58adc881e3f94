#include "fluttersec/common/types.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace fluttersec {
namespace common {

const ProfileOutcome* AttackSimulationOutcome::outcomeFor(AttackerLevel level) const {
    for (const auto& outcome : profiles) {
        if (outcome.level == level) {
            return &outcome;
        }
    }
    return nullptr;
}

std::map<Severity, size_t> AnalysisResult::countBySeverity() const {
    std::map<Severity, size_t> counts;
    for (auto severity : allSeverities()) {
        counts[severity] = 0;
    }
    for (const auto& finding : findings) {
        counts[finding.severity]++;
    }
    return counts;
}

std::vector<Severity> allSeverities() {
    return {Severity::CRITICAL, Severity::HIGH, Severity::MEDIUM, Severity::LOW, Severity::INFO};
}

std::string to_string(Severity severity) {
    switch (severity) {
        case Severity::CRITICAL: return "CRITICAL";
        case Severity::HIGH: return "HIGH";
        case Severity::MEDIUM: return "MEDIUM";
        case Severity::LOW: return "LOW";
        case Severity::INFO: return "INFO";
        default: return "UNKNOWN";
    }
}

std::string to_string(Platform platform) {
    switch (platform) {
        case Platform::ANDROID: return "Android";
        case Platform::IOS: return "iOS";
        default: return "Unknown";
    }
}

std::string to_string(AttackerLevel level) {
    switch (level) {
        case AttackerLevel::BEGINNER: return "beginner";
        case AttackerLevel::INTERMEDIATE: return "intermediate";
        case AttackerLevel::ADVANCED: return "advanced";
        default: return "unknown";
    }
}

static std::string lowered(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

std::optional<Severity> parseSeverity(const std::string& value) {
    auto v = lowered(value);
    if (v == "critical") return Severity::CRITICAL;
    if (v == "high") return Severity::HIGH;
    if (v == "medium") return Severity::MEDIUM;
    if (v == "low") return Severity::LOW;
    if (v == "info") return Severity::INFO;
    return std::nullopt;
}

std::optional<AttackerLevel> parseAttackerLevel(const std::string& value) {
    auto v = lowered(value);
    if (v == "beginner") return AttackerLevel::BEGINNER;
    if (v == "intermediate") return AttackerLevel::INTERMEDIATE;
    if (v == "advanced") return AttackerLevel::ADVANCED;
    return std::nullopt;
}

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
    localtime_r(&time_t_val, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

}}
