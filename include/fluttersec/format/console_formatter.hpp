#pragma once

#include "../core/pipeline.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace fluttersec {
namespace format {

struct BoxChars {
    std::string horizontal = "─";
    std::string vertical = "│";
    std::string top_left = "┌";
    std::string top_right = "┐";
    std::string bottom_left = "└";
    std::string bottom_right = "┘";
    std::string t_down = "┬";
    std::string t_up = "┴";
    std::string t_right = "├";
    std::string t_left = "┤";
    std::string cross = "┼";
};

struct ConsoleOptions {
    bool use_colors = true;
    bool verbose = false;
    size_t priority_limit = 5;
    // Detail for one attacker level, as requested with --attack-sim.
    std::optional<common::AttackerLevel> attack_detail;
};

class ConsoleFormatter {
public:
    explicit ConsoleFormatter(ConsoleOptions options = {});

    void format(const core::AuditReport& report, std::ostream& out) const;

private:
    ConsoleOptions options_;
    BoxChars box_;

    void formatHeader(const common::AnalysisResult& result, std::ostream& out) const;
    void formatScore(const common::AnalysisResult& result, std::ostream& out) const;
    void formatSummaryTable(const common::AnalysisResult& result, std::ostream& out) const;
    void formatPriorities(const common::AnalysisResult& result, std::ostream& out) const;
    void formatSimulation(const core::AuditReport& report, std::ostream& out) const;

    std::string colorize(const std::string& text, const std::string& color_code) const;
    std::string severityColor(common::Severity severity) const;
    std::string scoreColor(int score) const;
    std::string repeat(const std::string& str, size_t count) const;
    std::string pad(const std::string& text, size_t width, bool right_align = false) const;
};

}}
