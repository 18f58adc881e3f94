#pragma once

#include "../common/types.hpp"
#include <map>
#include <string>
#include <vector>

namespace fluttersec {
namespace analysis {

struct SecurityPosture {
    int score = 100;
    std::string grade;
    std::string risk_level;
    int attack_surface = 0;
    std::map<common::Severity, size_t> breakdown;
    size_t total_findings = 0;
    bool needs_immediate_attention = false;
    std::vector<std::string> priority_fixes;
    std::string recommendation;
};

// Severity-weighted score: 100 minus the summed weights, floored at 0.
class SecurityScorer {
public:
    static constexpr int MAX_SCORE = 100;
    static constexpr int MAX_ATTACK_SURFACE = 10;

    static int weight(common::Severity severity);

    static int calculateScore(const std::vector<common::Finding>& findings);
    static int attackSurface(const std::vector<common::Finding>& findings);

    // "A".."F"
    static std::string gradeFor(int score);
    // "A (Excellent)" etc.
    static std::string gradeLabel(const std::string& grade);
    static std::string riskLevel(int score);

    // Stable: equal-severity findings keep their detection order.
    static std::vector<common::Finding> priorityFindings(const std::vector<common::Finding>& findings,
                                                         size_t limit = 5);

    // Fills score, grade and attack surface from result.findings.
    static void apply(common::AnalysisResult& result);

    static SecurityPosture analyzePosture(const common::AnalysisResult& result);
};

}}
