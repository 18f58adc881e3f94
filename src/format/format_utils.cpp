#include "fluttersec/format/format_utils.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>

namespace fluttersec {
namespace format {

std::string escapeHtml(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c; break;
        }
    }
    return out;
}

std::string escapeMarkdown(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '\\': case '`': case '*': case '_': case '[': case ']':
            case '<': case '>': case '|': case '#':
                out += '\\';
                out += c;
                break;
            default: out += c; break;
        }
    }
    return out;
}

std::string formatDuration(int minutes) {
    if (minutes < 60) {
        return std::to_string(minutes) + (minutes == 1 ? " minute" : " minutes");
    }
    std::string out = std::to_string(minutes / 60) + "h";
    if (minutes % 60 != 0) {
        out += " " + std::to_string(minutes % 60) + "m";
    }
    return out;
}

std::string formatPercentage(double ratio, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << (ratio * 100.0) << "%";
    return oss.str();
}

std::string joinLines(const std::vector<std::string>& lines) {
    std::string out;
    for (const auto& line : lines) {
        out += line;
        out += "\n";
    }
    return out;
}

std::string severityCssClass(common::Severity severity) {
    switch (severity) {
        case common::Severity::CRITICAL: return "critical";
        case common::Severity::HIGH: return "high";
        case common::Severity::MEDIUM: return "medium";
        case common::Severity::LOW: return "low";
        case common::Severity::INFO: return "info";
    }
    return "info";
}

std::string stripStepNumber(const std::string& step) {
    size_t i = 0;
    while (i < step.size() && std::isdigit(static_cast<unsigned char>(step[i]))) {
        ++i;
    }
    if (i > 0 && i + 1 < step.size() && step[i] == '.' && step[i + 1] == ' ') {
        return step.substr(i + 2);
    }
    return step;
}

std::string remediationMarkdown(const common::Remediation& remediation) {
    std::ostringstream md;
    md << "**" << escapeMarkdown(remediation.summary) << "**\n\n";
    if (!remediation.root_cause.empty()) {
        md << "*Root cause:* " << escapeMarkdown(remediation.root_cause) << "\n\n";
    }
    if (!remediation.why_wrong.empty()) {
        md << "*Why this is wrong:* " << escapeMarkdown(remediation.why_wrong) << "\n\n";
    }
    if (!remediation.fix_steps.empty()) {
        int n = 1;
        for (const auto& step : remediation.fix_steps) {
            md << n++ << ". " << escapeMarkdown(stripStepNumber(step)) << "\n";
        }
        md << "\n";
    }
    if (remediation.code_before) {
        md << "Before (insecure):\n\n```\n" << *remediation.code_before << "\n```\n\n";
    }
    if (remediation.code_after) {
        md << "After (secure):\n\n```\n" << *remediation.code_after << "\n```\n\n";
    }
    if (remediation.verification) {
        md << "*Verification:* " << escapeMarkdown(*remediation.verification) << "\n\n";
    }
    if (!remediation.references.empty()) {
        md << "References:\n\n";
        for (const auto& ref : remediation.references) {
            md << "- <" << ref << ">\n";
        }
        md << "\n";
    }
    return md.str();
}

}}
