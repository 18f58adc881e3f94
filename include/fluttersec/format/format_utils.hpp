#pragma once

#include "../common/types.hpp"
#include <string>
#include <vector>

namespace fluttersec {
namespace format {

std::string escapeHtml(const std::string& text);

// Backslash-escapes characters markdown would treat as markup or raw HTML.
std::string escapeMarkdown(const std::string& text);

// "1. Remove foo" -> "Remove foo"; other text is returned unchanged.
std::string stripStepNumber(const std::string& step);

// "2 minutes", "1h 30m"
std::string formatDuration(int minutes);

std::string formatPercentage(double ratio, int precision = 0);

std::string joinLines(const std::vector<std::string>& lines);

std::string severityCssClass(common::Severity severity);

// Remediation as a markdown fragment, shared by the markdown and HTML reports.
std::string remediationMarkdown(const common::Remediation& remediation);

}}
