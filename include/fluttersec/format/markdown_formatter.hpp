#pragma once

#include "../core/pipeline.hpp"
#include <string>

namespace fluttersec {
namespace format {

class MarkdownFormatter {
public:
    explicit MarkdownFormatter(size_t priority_limit = 5);

    std::string format(const core::AuditReport& report) const;

private:
    size_t priority_limit_;

    std::string formatOverview(const common::AnalysisResult& result) const;
    std::string formatSummary(const common::AnalysisResult& result) const;
    std::string formatPriorities(const common::AnalysisResult& result) const;
    std::string formatSimulation(const common::AttackSimulationOutcome& simulation) const;
    std::string formatFindings(const common::AnalysisResult& result) const;
};

}}
