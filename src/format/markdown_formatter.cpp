#include "fluttersec/format/markdown_formatter.hpp"
#include "fluttersec/format/format_utils.hpp"
#include "fluttersec/analysis/security_scorer.hpp"
#include "fluttersec/common/constants.hpp"
#include <sstream>

namespace fluttersec {
namespace format {

MarkdownFormatter::MarkdownFormatter(size_t priority_limit) : priority_limit_(priority_limit) {}

std::string MarkdownFormatter::format(const core::AuditReport& report) const {
    std::ostringstream md;

    md << "# FlutterSec Security Report\n\n";
    md << formatOverview(report.result);
    md << "\n" << formatSummary(report.result);

    if (!report.result.findings.empty()) {
        md << "\n" << formatPriorities(report.result);
    }

    md << "\n" << formatSimulation(report.simulation);

    if (!report.result.findings.empty()) {
        md << "\n" << formatFindings(report.result);
    }

    md << "\n---\n\n*Generated by " << constants::version::getFullVersion() << "*\n";
    return md.str();
}

std::string MarkdownFormatter::formatOverview(const common::AnalysisResult& result) const {
    std::ostringstream md;
    md << "| Property | Value |\n";
    md << "|----------|-------|\n";
    md << "| App Name | " << escapeMarkdown(result.app_name) << " |\n";
    md << "| Package | `" << result.package_name << "` |\n";
    md << "| Platform | " << common::to_string(result.platform) << " |\n";
    md << "| File | `" << result.file_path << "` |\n";
    md << "| Flutter Detected | " << (result.is_flutter ? "Yes" : "No") << " |\n";
    md << "| Scanned | " << common::formatTimestamp(result.timestamp) << " |\n";
    return md.str();
}

std::string MarkdownFormatter::formatSummary(const common::AnalysisResult& result) const {
    auto posture = analysis::SecurityScorer::analyzePosture(result);
    std::ostringstream md;

    md << "## Security Score\n\n";
    md << "**" << result.security_score << "/100** - "
       << analysis::SecurityScorer::gradeLabel(result.grade) << "\n\n";
    md << "- Risk Level: " << posture.risk_level << "\n";
    md << "- Attack Surface: " << result.attack_surface_score << "/10\n";
    md << "- Recommendation: " << posture.recommendation << "\n\n";

    md << "## Findings Summary\n\n";
    md << "| Severity | Count |\n";
    md << "|----------|------:|\n";
    for (const auto& [severity, count] : posture.breakdown) {
        md << "| " << common::to_string(severity) << " | " << count << " |\n";
    }
    return md.str();
}

std::string MarkdownFormatter::formatPriorities(const common::AnalysisResult& result) const {
    std::ostringstream md;
    md << "## Top Priority Issues\n\n";
    int n = 1;
    for (const auto& finding : analysis::SecurityScorer::priorityFindings(result.findings, priority_limit_)) {
        md << n++ << ". **[" << common::to_string(finding.severity) << "]** " << escapeMarkdown(finding.title) << "\n";
    }
    return md.str();
}

std::string MarkdownFormatter::formatSimulation(const common::AttackSimulationOutcome& simulation) const {
    std::ostringstream md;
    md << "## Attack Simulation\n\n";
    md << "- Most Likely Attacker: " << common::to_string(simulation.selected) << "\n";
    md << "- Time to Compromise: " << formatDuration(simulation.time_to_compromise_minutes) << "\n";
    md << "- Compromised: " << (simulation.compromised ? "yes" : "no") << "\n\n";

    md << "| Attacker | Can Exploit | Time |\n";
    md << "|----------|-------------|-----:|\n";
    for (const auto& outcome : simulation.profiles) {
        md << "| " << common::to_string(outcome.level) << " | "
           << (outcome.exploitable ? "yes" : "no") << " | "
           << formatDuration(outcome.minutes) << " |\n";
    }

    md << "\n### Scenario\n\n";
    for (const auto& line : simulation.scenario) {
        md << line << "\n";
    }

    if (!simulation.defenses.empty()) {
        md << "\n### Recommended Defenses\n\n";
        for (const auto& defense : simulation.defenses) {
            md << "- " << defense << "\n";
        }
    }
    return md.str();
}

std::string MarkdownFormatter::formatFindings(const common::AnalysisResult& result) const {
    std::ostringstream md;
    md << "## Detailed Findings\n";

    for (auto severity : common::allSeverities()) {
        for (const auto& finding : result.findings) {
            if (finding.severity != severity) continue;

            md << "\n### [" << common::to_string(severity) << "] " << escapeMarkdown(finding.title) << "\n\n";
            md << "```\n" << finding.description << "\n```\n\n";

            if (finding.file_path) md << "- Location: `" << *finding.file_path << "`\n";
            if (finding.owasp_category) md << "- OWASP: " << *finding.owasp_category << "\n";
            if (finding.cwe_id) md << "- CWE: " << *finding.cwe_id << "\n";
            if (finding.cvss_score) md << "- CVSS: " << *finding.cvss_score << "\n";

            if (finding.remediation) {
                md << "\n#### How to Fix\n\n" << remediationMarkdown(*finding.remediation);
            }
        }
    }
    return md.str();
}

}}
