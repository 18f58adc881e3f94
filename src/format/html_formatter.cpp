#include "fluttersec/format/html_formatter.hpp"
#include "fluttersec/format/format_utils.hpp"
#include "fluttersec/format/markdown_renderer.hpp"
#include "fluttersec/analysis/security_scorer.hpp"
#include "fluttersec/common/constants.hpp"
#include <inja/inja.hpp>

namespace fluttersec {
namespace format {

HtmlFormatter::HtmlFormatter(size_t priority_limit) : priority_limit_(priority_limit) {}

std::string HtmlFormatter::format(const core::AuditReport& report) const {
    inja::Environment env;
    return env.render(getHtmlTemplate(), prepareTemplateData(report));
}

nlohmann::json HtmlFormatter::prepareTemplateData(const core::AuditReport& report) const {
    const auto& result = report.result;
    const auto& simulation = report.simulation;
    auto posture = analysis::SecurityScorer::analyzePosture(result);
    MarkdownRenderer renderer;

    nlohmann::json data;
    data["app_name"] = escapeHtml(result.app_name);
    data["package_name"] = escapeHtml(result.package_name);
    data["platform"] = common::to_string(result.platform);
    data["file_path"] = escapeHtml(result.file_path);
    data["flutter_detected"] = result.is_flutter;
    data["timestamp"] = common::formatTimestamp(result.timestamp);
    data["version"] = escapeHtml(constants::version::getFullVersion());

    data["score"] = result.security_score;
    data["grade"] = analysis::SecurityScorer::gradeLabel(result.grade);
    data["risk_level"] = posture.risk_level;
    data["attack_surface"] = result.attack_surface_score;
    data["recommendation"] = escapeHtml(posture.recommendation);

    data["severities"] = nlohmann::json::array();
    for (const auto& [severity, count] : posture.breakdown) {
        nlohmann::json entry;
        entry["name"] = common::to_string(severity);
        entry["css"] = severityCssClass(severity);
        entry["count"] = count;
        data["severities"].push_back(entry);
    }

    data["priorities"] = nlohmann::json::array();
    for (const auto& finding : analysis::SecurityScorer::priorityFindings(result.findings, priority_limit_)) {
        nlohmann::json entry;
        entry["severity"] = common::to_string(finding.severity);
        entry["css"] = severityCssClass(finding.severity);
        entry["title"] = escapeHtml(finding.title);
        data["priorities"].push_back(entry);
    }

    nlohmann::json sim;
    sim["attacker"] = common::to_string(simulation.selected);
    sim["time"] = formatDuration(simulation.time_to_compromise_minutes);
    sim["compromised"] = simulation.compromised;
    sim["scenario_html"] = renderer.render(joinLines(simulation.scenario));
    sim["defenses"] = nlohmann::json::array();
    for (const auto& defense : simulation.defenses) {
        sim["defenses"].push_back(escapeHtml(defense));
    }
    sim["profiles"] = nlohmann::json::array();
    for (const auto& outcome : simulation.profiles) {
        nlohmann::json entry;
        entry["level"] = common::to_string(outcome.level);
        entry["exploitable"] = outcome.exploitable;
        entry["time"] = formatDuration(outcome.minutes);
        entry["selected"] = outcome.level == simulation.selected;
        sim["profiles"].push_back(entry);
    }
    data["simulation"] = sim;

    data["findings"] = nlohmann::json::array();
    for (auto severity : common::allSeverities()) {
        for (const auto& finding : result.findings) {
            if (finding.severity == severity) {
                data["findings"].push_back(findingData(finding));
            }
        }
    }
    data["has_findings"] = !result.findings.empty();

    return data;
}

nlohmann::json HtmlFormatter::findingData(const common::Finding& finding) const {
    nlohmann::json entry;
    entry["severity"] = common::to_string(finding.severity);
    entry["css"] = severityCssClass(finding.severity);
    entry["title"] = escapeHtml(finding.title);
    entry["description"] = escapeHtml(finding.description);
    entry["location"] = finding.file_path ? escapeHtml(*finding.file_path) : "";
    entry["owasp"] = finding.owasp_category ? escapeHtml(*finding.owasp_category) : "";
    entry["cwe"] = finding.cwe_id ? escapeHtml(*finding.cwe_id) : "";

    if (finding.remediation) {
        MarkdownRenderer renderer;
        entry["remediation_html"] = renderer.render(remediationMarkdown(*finding.remediation));
    } else {
        entry["remediation_html"] = "";
    }
    return entry;
}

const char* HtmlFormatter::getHtmlTemplate() const {
    return R"HTML(<!DOCTYPE html>
<html lang="en">
<head>
    <meta charset="UTF-8">
    <meta name="viewport" content="width=device-width, initial-scale=1.0">
    <title>Security Report - {{ app_name }}</title>
    <style>
        * { margin: 0; padding: 0; box-sizing: border-box; }
        body {
            font-family: -apple-system, BlinkMacSystemFont, 'Segoe UI', Roboto, 'Helvetica Neue', Arial, sans-serif;
            line-height: 1.6;
            color: #212121;
            background: #fafafa;
            padding: 20px;
        }
        .container { max-width: 1200px; margin: 0 auto; background: white; padding: 40px; box-shadow: 0 2px 8px rgba(0,0,0,0.1); }
        h1 { color: #1565c0; margin-bottom: 8px; }
        h2 { color: #37474f; margin: 32px 0 16px; border-bottom: 2px solid #1976d2; padding-bottom: 8px; }
        .timestamp { color: #757575; font-size: 14px; }
        .metadata { background: #eceff1; padding: 16px; margin: 24px 0; }
        .metadata div { margin: 4px 0; }
        .score-card { background: #1976d2; color: white; padding: 28px; text-align: center; }
        .score-number { font-size: 48px; font-weight: bold; }
        .grade { font-size: 22px; }
        .score-meta { margin-top: 8px; font-size: 14px; opacity: 0.9; }
        .summary-grid { display: grid; grid-template-columns: repeat(auto-fit, minmax(160px, 1fr)); gap: 16px; }
        .summary-card { padding: 16px; text-align: center; border-left: 4px solid #90a4ae; background: #f5f5f5; }
        .summary-card .count { font-size: 32px; font-weight: bold; }
        .summary-card .label { font-size: 13px; text-transform: uppercase; color: #616161; }
        .critical { border-left-color: #c62828 !important; }
        .high { border-left-color: #ef6c00 !important; }
        .medium { border-left-color: #f9a825 !important; }
        .low { border-left-color: #1976d2 !important; }
        .info { border-left-color: #90a4ae !important; }
        .badge { display: inline-block; padding: 2px 10px; border-radius: 10px; font-size: 12px; font-weight: bold; color: white; background: #90a4ae; margin-right: 6px; }
        .badge.critical { background: #c62828; }
        .badge.high { background: #ef6c00; }
        .badge.medium { background: #f9a825; color: #212121; }
        .badge.low { background: #1976d2; }
        .attack-sim { background: #fff8e1; border-left: 4px solid #ef6c00; padding: 20px; }
        .attack-sim table { border-collapse: collapse; margin: 12px 0; }
        .attack-sim td, .attack-sim th { padding: 4px 14px; border-bottom: 1px solid #e0e0e0; text-align: left; }
        .attack-sim tr.selected { font-weight: bold; }
        .finding { border: 1px solid #e0e0e0; border-left: 4px solid #90a4ae; padding: 20px; margin-bottom: 20px; }
        .finding-title { font-size: 18px; font-weight: bold; margin-bottom: 10px; }
        .finding-description { white-space: pre-wrap; font-family: 'Courier New', monospace; font-size: 13px; background: #f5f5f5; padding: 12px; margin-bottom: 12px; }
        .finding-meta { font-size: 14px; margin-bottom: 12px; }
        .remediation { background: #e8f5e9; border-left: 3px solid #43a047; padding: 16px; }
        .remediation pre { background: #263238; color: #eceff1; padding: 12px; overflow-x: auto; margin: 8px 0; }
        .remediation ol, .remediation ul { margin: 8px 0 8px 24px; }
        .remediation p { margin: 6px 0; }
        .footer { text-align: center; margin-top: 40px; color: #9e9e9e; font-size: 13px; }
    </style>
</head>
<body>
    <div class="container">
        <h1>FlutterSec Security Report</h1>
        <div class="timestamp">Generated on {{ timestamp }}</div>

        <div class="metadata">
            <div><strong>App Name:</strong> {{ app_name }}</div>
            <div><strong>Package:</strong> {{ package_name }}</div>
            <div><strong>Platform:</strong> {{ platform }}</div>
            <div><strong>File:</strong> {{ file_path }}</div>
            <div><strong>Flutter Detected:</strong> {% if flutter_detected %}Yes{% else %}No{% endif %}</div>
        </div>

        <div class="score-card">
            <div class="score-number">{{ score }}/100</div>
            <div class="grade">{{ grade }}</div>
            <div class="score-meta">{{ risk_level }} | Attack Surface {{ attack_surface }}/10</div>
            <div class="score-meta">{{ recommendation }}</div>
        </div>

        <h2>Findings Summary</h2>
        <div class="summary-grid">
            {% for sev in severities %}
            <div class="summary-card {{ sev.css }}">
                <div class="count">{{ sev.count }}</div>
                <div class="label">{{ sev.name }}</div>
            </div>
            {% endfor %}
        </div>

        {% if length(priorities) > 0 %}
        <h2>Top Priority Issues</h2>
        <ol style="margin-left: 24px;">
            {% for item in priorities %}
            <li><span class="badge {{ item.css }}">{{ item.severity }}</span>{{ item.title }}</li>
            {% endfor %}
        </ol>
        {% endif %}

        <h2>Attack Simulation</h2>
        <div class="attack-sim">
            <div><strong>Time to Compromise:</strong> {{ simulation.time }}</div>
            <div><strong>Most Likely Attacker:</strong> {{ simulation.attacker }}</div>
            <div><strong>Compromised:</strong> {% if simulation.compromised %}yes{% else %}no{% endif %}</div>
            <table>
                <tr><th>Attacker</th><th>Can Exploit</th><th>Time</th></tr>
                {% for p in simulation.profiles %}
                <tr{% if p.selected %} class="selected"{% endif %}><td>{{ p.level }}</td><td>{% if p.exploitable %}yes{% else %}no{% endif %}</td><td>{{ p.time }}</td></tr>
                {% endfor %}
            </table>
            {{ simulation.scenario_html }}
            {% if length(simulation.defenses) > 0 %}
            <p><strong>Recommended Defenses:</strong></p>
            <ul style="margin-left: 24px;">
                {% for d in simulation.defenses %}
                <li>{{ d }}</li>
                {% endfor %}
            </ul>
            {% endif %}
        </div>

        {% if has_findings %}
        <h2>Detailed Findings</h2>
        {% for f in findings %}
        <div class="finding {{ f.css }}">
            <div class="finding-title"><span class="badge {{ f.css }}">{{ f.severity }}</span>{{ f.title }}</div>
            <div class="finding-description">{{ f.description }}</div>
            <div class="finding-meta">
                {% if f.location != "" %}<div><strong>Location:</strong> <code>{{ f.location }}</code></div>{% endif %}
                {% if f.owasp != "" %}<div><strong>OWASP:</strong> {{ f.owasp }}</div>{% endif %}
                {% if f.cwe != "" %}<div><strong>CWE:</strong> {{ f.cwe }}</div>{% endif %}
            </div>
            {% if f.remediation_html != "" %}
            <div class="remediation">
                <p><strong>How to Fix</strong></p>
                {{ f.remediation_html }}
            </div>
            {% endif %}
        </div>
        {% endfor %}
        {% endif %}

        <div class="footer">Generated by {{ version }}</div>
    </div>
</body>
</html>
)HTML";
}

}}
