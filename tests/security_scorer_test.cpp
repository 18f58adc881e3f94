#include <gtest/gtest.h>
#include "fluttersec/analysis/security_scorer.hpp"
#include "test_helpers.hpp"

using namespace fluttersec;
using analysis::SecurityScorer;
using common::Finding;
using common::Severity;
using test::makeFinding;

TEST(SecurityScorerTest, EmptyFindingsScorePerfect) {
    EXPECT_EQ(SecurityScorer::calculateScore({}), 100);
    EXPECT_EQ(SecurityScorer::attackSurface({}), 0);
    EXPECT_EQ(SecurityScorer::gradeFor(100), "A");
}

TEST(SecurityScorerTest, DeductsSeverityWeights) {
    std::vector<Finding> findings = {
        makeFinding(Severity::CRITICAL, "a"),
        makeFinding(Severity::HIGH, "b"),
        makeFinding(Severity::MEDIUM, "c"),
        makeFinding(Severity::LOW, "d"),
        makeFinding(Severity::INFO, "e"),
    };
    EXPECT_EQ(SecurityScorer::calculateScore(findings), 100 - 25 - 15 - 8 - 3);
}

TEST(SecurityScorerTest, ScoreNeverDropsBelowZero) {
    std::vector<Finding> findings(6, makeFinding(Severity::CRITICAL, "x"));
    EXPECT_EQ(SecurityScorer::calculateScore(findings), 0);
    EXPECT_EQ(SecurityScorer::gradeFor(0), "F");
}

TEST(SecurityScorerTest, GradeBoundaries) {
    EXPECT_EQ(SecurityScorer::gradeFor(90), "A");
    EXPECT_EQ(SecurityScorer::gradeFor(89), "B");
    EXPECT_EQ(SecurityScorer::gradeFor(75), "B");
    EXPECT_EQ(SecurityScorer::gradeFor(74), "C");
    EXPECT_EQ(SecurityScorer::gradeFor(60), "C");
    EXPECT_EQ(SecurityScorer::gradeFor(59), "D");
    EXPECT_EQ(SecurityScorer::gradeFor(40), "D");
    EXPECT_EQ(SecurityScorer::gradeFor(39), "F");

    EXPECT_EQ(SecurityScorer::gradeLabel("B"), "B (Good)");
    EXPECT_EQ(SecurityScorer::gradeLabel("F"), "F (Critical)");
}

TEST(SecurityScorerTest, AttackSurfaceIsCapped) {
    std::vector<Finding> findings = {
        makeFinding(Severity::CRITICAL, "a"),
        makeFinding(Severity::HIGH, "b"),
        makeFinding(Severity::MEDIUM, "c"),
    };
    EXPECT_EQ(SecurityScorer::attackSurface(findings), 3);

    std::vector<Finding> many(7, makeFinding(Severity::CRITICAL, "x"));
    EXPECT_EQ(SecurityScorer::attackSurface(many), 10);
}

TEST(SecurityScorerTest, PriorityOrderIsStable) {
    std::vector<Finding> findings = {
        makeFinding(Severity::MEDIUM, "m1"),
        makeFinding(Severity::CRITICAL, "c1"),
        makeFinding(Severity::HIGH, "h1"),
        makeFinding(Severity::CRITICAL, "c2"),
        makeFinding(Severity::MEDIUM, "m2"),
        makeFinding(Severity::LOW, "l1"),
    };

    auto top = SecurityScorer::priorityFindings(findings, 5);
    ASSERT_EQ(top.size(), 5u);
    EXPECT_EQ(top[0].title, "c1");
    EXPECT_EQ(top[1].title, "c2");
    EXPECT_EQ(top[2].title, "h1");
    EXPECT_EQ(top[3].title, "m1");
    EXPECT_EQ(top[4].title, "m2");
}

TEST(SecurityScorerTest, PriorityLimitLargerThanFindings) {
    std::vector<Finding> findings = {
        makeFinding(Severity::LOW, "l1"),
        makeFinding(Severity::HIGH, "h1"),
    };

    auto top = SecurityScorer::priorityFindings(findings, 10);
    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0].title, "h1");
    EXPECT_EQ(top[1].title, "l1");

    EXPECT_TRUE(SecurityScorer::priorityFindings({}, 5).empty());
}

TEST(SecurityScorerTest, ApplyAndPosture) {
    common::AnalysisResult result;
    result.findings = {
        makeFinding(Severity::HIGH, "h1"),
        makeFinding(Severity::MEDIUM, "m1"),
    };
    SecurityScorer::apply(result);
    EXPECT_EQ(result.security_score, 77);
    EXPECT_EQ(result.grade, "B");
    EXPECT_EQ(result.attack_surface_score, 1);

    auto posture = SecurityScorer::analyzePosture(result);
    EXPECT_EQ(posture.risk_level, "Medium Risk");
    EXPECT_FALSE(posture.needs_immediate_attention);
    EXPECT_EQ(posture.total_findings, 2u);
    ASSERT_EQ(posture.priority_fixes.size(), 2u);
    EXPECT_EQ(posture.priority_fixes[0], "h1");
    EXPECT_EQ(posture.recommendation, "Fix high severity issues within 1 week");
}
