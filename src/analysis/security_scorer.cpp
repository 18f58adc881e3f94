#include "fluttersec/analysis/security_scorer.hpp"
#include <algorithm>

namespace fluttersec {
namespace analysis {

using common::Finding;
using common::Severity;

int SecurityScorer::weight(Severity severity) {
    switch (severity) {
        case Severity::CRITICAL: return 25;
        case Severity::HIGH: return 15;
        case Severity::MEDIUM: return 8;
        case Severity::LOW: return 3;
        case Severity::INFO: return 0;
    }
    return 0;
}

int SecurityScorer::calculateScore(const std::vector<Finding>& findings) {
    long deduction = 0;
    for (const auto& finding : findings) {
        deduction += weight(finding.severity);
    }
    return static_cast<int>(std::max<long>(0, MAX_SCORE - deduction));
}

int SecurityScorer::attackSurface(const std::vector<Finding>& findings) {
    long critical = 0;
    long high = 0;
    for (const auto& finding : findings) {
        if (finding.severity == Severity::CRITICAL) critical++;
        else if (finding.severity == Severity::HIGH) high++;
    }
    return static_cast<int>(std::min<long>(MAX_ATTACK_SURFACE, critical * 2 + high));
}

std::string SecurityScorer::gradeFor(int score) {
    if (score >= 90) return "A";
    if (score >= 75) return "B";
    if (score >= 60) return "C";
    if (score >= 40) return "D";
    return "F";
}

std::string SecurityScorer::gradeLabel(const std::string& grade) {
    if (grade == "A") return "A (Excellent)";
    if (grade == "B") return "B (Good)";
    if (grade == "C") return "C (Fair)";
    if (grade == "D") return "D (Poor)";
    if (grade == "F") return "F (Critical)";
    return grade;
}

std::string SecurityScorer::riskLevel(int score) {
    if (score >= 80) return "Low Risk";
    if (score >= 60) return "Medium Risk";
    if (score >= 40) return "High Risk";
    return "Critical Risk";
}

std::vector<Finding> SecurityScorer::priorityFindings(const std::vector<Finding>& findings, size_t limit) {
    std::vector<Finding> sorted = findings;
    std::stable_sort(sorted.begin(), sorted.end(), [](const Finding& a, const Finding& b) {
        return common::severityRank(a.severity) < common::severityRank(b.severity);
    });
    if (sorted.size() > limit) {
        sorted.resize(limit);
    }
    return sorted;
}

void SecurityScorer::apply(common::AnalysisResult& result) {
    result.security_score = calculateScore(result.findings);
    result.grade = gradeFor(result.security_score);
    result.attack_surface_score = attackSurface(result.findings);
}

SecurityPosture SecurityScorer::analyzePosture(const common::AnalysisResult& result) {
    SecurityPosture posture;
    posture.score = result.security_score;
    posture.grade = result.grade;
    posture.risk_level = riskLevel(result.security_score);
    posture.attack_surface = result.attack_surface_score;
    posture.breakdown = result.countBySeverity();
    posture.total_findings = result.findings.size();
    posture.needs_immediate_attention = posture.breakdown[Severity::CRITICAL] > 0;

    for (const auto& finding : priorityFindings(result.findings, 3)) {
        posture.priority_fixes.push_back(finding.title);
    }

    if (posture.breakdown[Severity::CRITICAL] > 0) {
        posture.recommendation = "URGENT: Fix critical issues immediately before production release";
    } else if (posture.breakdown[Severity::HIGH] > 0) {
        posture.recommendation = "Fix high severity issues within 1 week";
    } else if (posture.breakdown[Severity::MEDIUM] > 0) {
        posture.recommendation = "Address medium issues in next sprint";
    } else {
        posture.recommendation = "Good security posture! Continue monitoring";
    }
    return posture;
}

}}
