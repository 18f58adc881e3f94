#pragma once

#include "../core/pipeline.hpp"
#include <nlohmann/json.hpp>

namespace fluttersec {
namespace format {

class JsonFormatter {
public:
    static nlohmann::json format(const core::AuditReport& report);

private:
    static nlohmann::json formatFinding(const common::Finding& finding);
    static nlohmann::json formatRemediation(const common::Remediation& remediation);
    static nlohmann::json formatSimulation(const common::AttackSimulationOutcome& simulation);
};

}}
