#include "fluttersec/format/json_formatter.hpp"
#include "fluttersec/analysis/security_scorer.hpp"

namespace fluttersec {
namespace format {

namespace {

template<typename T>
nlohmann::json optionalValue(const std::optional<T>& value) {
    if (value) {
        return *value;
    }
    return nullptr;
}

}

nlohmann::json JsonFormatter::format(const core::AuditReport& report) {
    const auto& result = report.result;
    nlohmann::json json;

    json["app_name"] = result.app_name;
    json["package_name"] = result.package_name;
    json["platform"] = common::to_string(result.platform);
    json["file_path"] = result.file_path;
    json["flutter_detected"] = result.is_flutter;
    json["security_score"] = result.security_score;
    json["grade"] = analysis::SecurityScorer::gradeLabel(result.grade);
    json["attack_surface_score"] = result.attack_surface_score;
    json["time_to_compromise_minutes"] = result.time_to_compromise_minutes;
    json["timestamp"] = common::formatTimestamp(result.timestamp);

    nlohmann::json counts = nlohmann::json::object();
    for (const auto& [severity, count] : result.countBySeverity()) {
        counts[common::to_string(severity)] = count;
    }
    json["findings_count"] = counts;

    json["findings"] = nlohmann::json::array();
    for (const auto& finding : result.findings) {
        json["findings"].push_back(formatFinding(finding));
    }

    json["attack_simulation"] = formatSimulation(report.simulation);
    return json;
}

nlohmann::json JsonFormatter::formatFinding(const common::Finding& finding) {
    nlohmann::json json;
    json["severity"] = common::to_string(finding.severity);
    json["title"] = finding.title;
    json["description"] = finding.description;
    json["file_path"] = optionalValue(finding.file_path);
    json["line_number"] = optionalValue(finding.line_number);
    json["owasp"] = optionalValue(finding.owasp_category);
    json["cwe"] = optionalValue(finding.cwe_id);
    json["cvss_score"] = optionalValue(finding.cvss_score);

    if (finding.remediation) {
        json["remediation"] = formatRemediation(*finding.remediation);
    } else {
        json["remediation"] = nullptr;
    }
    return json;
}

nlohmann::json JsonFormatter::formatRemediation(const common::Remediation& remediation) {
    nlohmann::json json;
    json["summary"] = remediation.summary;
    json["root_cause"] = remediation.root_cause;
    json["why_wrong"] = remediation.why_wrong;
    json["fix_steps"] = remediation.fix_steps;
    json["code_before"] = optionalValue(remediation.code_before);
    json["code_after"] = optionalValue(remediation.code_after);
    json["verification"] = optionalValue(remediation.verification);
    json["references"] = remediation.references;
    return json;
}

nlohmann::json JsonFormatter::formatSimulation(const common::AttackSimulationOutcome& simulation) {
    nlohmann::json json;
    json["most_likely_attacker"] = common::to_string(simulation.selected);
    json["time_to_compromise_minutes"] = simulation.time_to_compromise_minutes;
    json["compromised"] = simulation.compromised;
    json["attack_scenario"] = simulation.scenario;
    json["defense_recommendations"] = simulation.defenses;

    nlohmann::json profiles = nlohmann::json::object();
    for (const auto& outcome : simulation.profiles) {
        nlohmann::json entry;
        entry["can_exploit"] = outcome.exploitable;
        entry["time_minutes"] = outcome.minutes;
        entry["exploitable_findings"] = outcome.exploitable_findings;
        profiles[common::to_string(outcome.level)] = entry;
    }
    json["profiles"] = profiles;
    return json;
}

}}
