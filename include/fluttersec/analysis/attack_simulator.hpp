#pragma once

#include "../common/types.hpp"
#include <vector>

namespace fluttersec {
namespace analysis {

// Beginner, intermediate, advanced. Built once, never modified.
const std::vector<common::AttackerProfile>& attackerProfiles();
const common::AttackerProfile& attackerProfile(common::AttackerLevel level);

class AttackSimulator {
public:
    common::AttackSimulationOutcome simulate(const std::vector<common::Finding>& findings) const;

    static bool canExploit(const std::vector<common::Finding>& findings, common::AttackerLevel level);
    static int timeToCompromise(const std::vector<common::Finding>& findings, common::AttackerLevel level);
    static std::vector<std::string> exploitableFindings(const std::vector<common::Finding>& findings,
                                                        common::AttackerLevel level);

    static std::vector<std::string> scenario(const std::vector<common::Finding>& findings,
                                             common::AttackerLevel level, bool exploitable);
    static std::vector<std::string> defenseRecommendations(common::AttackerLevel level);

private:
    static bool matches(const common::Finding& finding, common::AttackerLevel level);
};

}}
