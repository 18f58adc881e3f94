#include "fluttersec/format/console_formatter.hpp"
#include "fluttersec/format/format_utils.hpp"
#include "fluttersec/format/markdown_renderer.hpp"
#include "fluttersec/analysis/attack_simulator.hpp"
#include "fluttersec/analysis/security_scorer.hpp"
#include "fluttersec/common/constants.hpp"
#include <unistd.h>

namespace fluttersec {
namespace format {

namespace {
constexpr const char* TITLE_COLOR = "\033[1;38;2;25;118;210m";
constexpr const char* DIM = "\033[2m";
constexpr const char* BOLD = "\033[1m";
}

ConsoleFormatter::ConsoleFormatter(ConsoleOptions options) : options_(std::move(options)) {
    options_.use_colors = options_.use_colors && isatty(STDOUT_FILENO);
}

void ConsoleFormatter::format(const core::AuditReport& report, std::ostream& out) const {
    formatHeader(report.result, out);
    out << "\n";
    formatScore(report.result, out);
    out << "\n";
    formatSummaryTable(report.result, out);

    if (!report.result.findings.empty()) {
        out << "\n";
        formatPriorities(report.result, out);
    }

    if (options_.attack_detail) {
        out << "\n";
        formatSimulation(report, out);
    }
}

void ConsoleFormatter::formatHeader(const common::AnalysisResult& result, std::ostream& out) const {
    out << colorize(constants::version::getFullVersion(), TITLE_COLOR) << "\n\n";
    out << "  Platform: " << colorize(common::to_string(result.platform), BOLD) << "\n";
    out << "  App:      " << result.app_name << " (" << result.package_name << ")\n";
    out << "  File:     " << result.file_path << "\n";
    if (!result.is_flutter) {
        out << colorize("  Warning: this does not appear to be a Flutter app", "\033[33m") << "\n";
    }
}

void ConsoleFormatter::formatScore(const common::AnalysisResult& result, std::ostream& out) const {
    auto posture = analysis::SecurityScorer::analyzePosture(result);
    std::string color = scoreColor(result.security_score);

    out << colorize("Security Score", TITLE_COLOR) << "\n\n";
    out << "  " << colorize(std::to_string(result.security_score) + "/100", color + BOLD)
        << " - " << analysis::SecurityScorer::gradeLabel(result.grade) << "\n";
    out << "  Risk Level:     " << posture.risk_level << "\n";
    out << "  Attack Surface: " << result.attack_surface_score << "/10\n";
    out << "  " << colorize(posture.recommendation, DIM) << "\n";
}

void ConsoleFormatter::formatSummaryTable(const common::AnalysisResult& result, std::ostream& out) const {
    const size_t sev_width = 10;
    const size_t count_width = 7;
    const size_t status_width = 8;

    out << colorize("Findings Summary", TITLE_COLOR) << "\n\n";

    auto border = [&](const std::string& left, const std::string& mid, const std::string& right) {
        out << "  " << left << repeat(box_.horizontal, sev_width + 2) << mid
            << repeat(box_.horizontal, count_width + 2) << mid
            << repeat(box_.horizontal, status_width + 2) << right << "\n";
    };

    border(box_.top_left, box_.t_down, box_.top_right);
    out << "  " << box_.vertical << " " << colorize(pad("Severity", sev_width), BOLD) << " "
        << box_.vertical << " " << colorize(pad("Count", count_width, true), BOLD) << " "
        << box_.vertical << " " << colorize(pad("Status", status_width), BOLD) << " "
        << box_.vertical << "\n";
    border(box_.t_right, box_.cross, box_.t_left);

    for (const auto& [severity, count] : result.countBySeverity()) {
        if (severity == common::Severity::INFO) continue;
        std::string color = count > 0 ? severityColor(severity) : "";
        std::string status = count > 0 ? "FAIL" : "OK";
        std::string status_color = count > 0 ? severityColor(severity) : "\033[32m";

        out << "  " << box_.vertical << " " << colorize(pad(common::to_string(severity), sev_width), color)
            << " " << box_.vertical << " " << colorize(pad(std::to_string(count), count_width, true), color)
            << " " << box_.vertical << " " << colorize(pad(status, status_width), status_color)
            << " " << box_.vertical << "\n";
    }
    border(box_.bottom_left, box_.t_up, box_.bottom_right);
}

void ConsoleFormatter::formatPriorities(const common::AnalysisResult& result, std::ostream& out) const {
    out << colorize("Top Priority Issues", TITLE_COLOR) << "\n\n";

    int n = 1;
    for (const auto& finding : analysis::SecurityScorer::priorityFindings(result.findings, options_.priority_limit)) {
        out << "  " << colorize(std::to_string(n++) + ". [" + common::to_string(finding.severity) + "] " +
                                finding.title, severityColor(finding.severity)) << "\n";
        if (options_.verbose) {
            if (finding.file_path) {
                out << "     " << colorize("Location: " + *finding.file_path, DIM) << "\n";
            }
            if (finding.remediation) {
                out << "     Fix: " << finding.remediation->summary << "\n";
            }
        }
    }
}

void ConsoleFormatter::formatSimulation(const core::AuditReport& report, std::ostream& out) const {
    const auto& simulation = report.simulation;
    auto level = *options_.attack_detail;
    const auto& profile = analysis::attackerProfile(level);

    out << colorize("Attack Simulation", TITLE_COLOR) << "\n\n";

    const auto* outcome = simulation.outcomeFor(level);
    if (outcome) {
        out << "  Requested Attacker: " << profile.label << "\n";
        out << "  Can Exploit:        " << (outcome->exploitable ? colorize("yes", "\033[31m") : "no") << "\n";
        out << "  Time:               " << formatDuration(outcome->minutes) << "\n";
        for (const auto& title : outcome->exploitable_findings) {
            out << "    - " << title << "\n";
        }
        out << "\n";
    }

    const auto& selected = analysis::attackerProfile(simulation.selected);
    std::string verdict = "Time to Compromise: " + formatDuration(simulation.time_to_compromise_minutes);
    out << "  " << colorize(verdict, simulation.compromised ? "\033[1;31m" : "\033[1;32m") << "\n";
    out << "  Most Likely Attacker: " << common::to_string(simulation.selected) << "\n";
    out << "  Success Rate: " << formatPercentage(selected.success_rate) << "\n";

    if (report.result.findings.empty()) {
        return;
    }

    MarkdownRenderer renderer(MarkdownOutputFormat::ANSI_CONSOLE, options_.use_colors);
    out << renderer.render(joinLines(simulation.scenario));

    if (options_.verbose && !simulation.defenses.empty()) {
        out << "\n" << colorize("Recommended Defenses", BOLD) << "\n";
        for (const auto& defense : simulation.defenses) {
            out << "  - " << defense << "\n";
        }
    }
}

std::string ConsoleFormatter::colorize(const std::string& text, const std::string& color_code) const {
    if (!options_.use_colors || color_code.empty()) {
        return text;
    }
    return color_code + text + "\033[0m";
}

std::string ConsoleFormatter::severityColor(common::Severity severity) const {
    switch (severity) {
        case common::Severity::CRITICAL: return "\033[38;2;198;40;40m";
        case common::Severity::HIGH: return "\033[38;2;230;81;0m";
        case common::Severity::MEDIUM: return "\033[38;2;249;168;37m";
        case common::Severity::LOW: return "\033[38;2;25;118;210m";
        case common::Severity::INFO: return "\033[38;2;97;97;97m";
    }
    return "";
}

std::string ConsoleFormatter::scoreColor(int score) const {
    if (score >= 75) return "\033[32m";
    if (score >= 50) return "\033[33m";
    return "\033[31m";
}

std::string ConsoleFormatter::repeat(const std::string& str, size_t count) const {
    std::string out;
    out.reserve(str.size() * count);
    for (size_t i = 0; i < count; ++i) out += str;
    return out;
}

std::string ConsoleFormatter::pad(const std::string& text, size_t width, bool right_align) const {
    if (text.size() >= width) return text;
    std::string fill(width - text.size(), ' ');
    return right_align ? fill + text : text + fill;
}

}}
