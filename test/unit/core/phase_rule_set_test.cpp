#include "core/phase_rule_set.hpp"
#include "duckdb/common/exception.hpp"
#include <gtest/gtest.h>

using namespace duckdb;

TEST(PhaseRuleSet, DefaultRuleSet) {
	auto rule_set = PhaseRuleSet::Default();
	EXPECT_EQ(rule_set->GetInitialPhase(), "CONFIG");
	ASSERT_EQ(rule_set->GetRegistry().RuleCount(), 3u);
	EXPECT_EQ(rule_set->GetRegistry().GetRules()[0].label, "INSTALL");
	EXPECT_EQ(rule_set->GetRegistry().GetRules()[1].label, "WORKLOAD");
	EXPECT_EQ(rule_set->GetRegistry().GetRules()[2].label, "ORION");
	EXPECT_TRUE(rule_set->IsKnownWorkload("workload_1"));
	EXPECT_FALSE(rule_set->IsKnownWorkload("workload_3"));
	EXPECT_EQ(rule_set->GetContextLines(), 0u);
}

TEST(PhaseRuleSet, DefaultRulesClassifySteps) {
	auto rule_set = PhaseRuleSet::Default();
	auto &registry = rule_set->GetRegistry();

	BoundaryMatch match;
	ASSERT_TRUE(registry.Match("Running step pre-install-deps", match));
	EXPECT_EQ(match.label, "INSTALL");
	ASSERT_TRUE(registry.Match("Running step workload_1", match));
	EXPECT_EQ(match.label, "WORKLOAD");
	EXPECT_EQ(match.step_name, "workload_1");
	ASSERT_TRUE(registry.Match("Running step run-orion-check", match));
	EXPECT_EQ(match.label, "ORION");
	EXPECT_FALSE(registry.Match("Step finished", match));
}

TEST(PhaseRuleSet, RulesKeepDocumentOrder) {
	auto rule_set = PhaseRuleSet::FromJson(R"({
		"initial_phase": "SETUP",
		"rules": [
			{"label": "TEST", "pattern": "== test (\\w+)"},
			{"label": "BUILD", "pattern": "== (\\w+)"}
		]
	})");
	EXPECT_EQ(rule_set->GetInitialPhase(), "SETUP");
	auto &rules = rule_set->GetRegistry().GetRules();
	ASSERT_EQ(rules.size(), 2u);
	EXPECT_EQ(rules[0].label, "TEST");
	EXPECT_EQ(rules[1].label, "BUILD");

	BoundaryMatch match;
	ASSERT_TRUE(rule_set->GetRegistry().Match("== test unit", match));
	EXPECT_EQ(match.label, "TEST");
	EXPECT_EQ(match.step_name, "unit");
}

TEST(PhaseRuleSet, StepsObjectForm) {
	auto rule_set = PhaseRuleSet::FromJson(
	    R"({"steps": {"INSTALL": "running step (.*install.*)", "WORKLOAD": "running step (.*)"}})");
	auto &rules = rule_set->GetRegistry().GetRules();
	ASSERT_EQ(rules.size(), 2u);
	EXPECT_EQ(rules[0].label, "INSTALL");
	EXPECT_EQ(rules[1].label, "WORKLOAD");
}

TEST(PhaseRuleSet, OptionalFields) {
	auto rule_set = PhaseRuleSet::FromJson(R"({
		"case_sensitive": true,
		"error_identifiers": ["Killed"],
		"workload_names": ["nightly"],
		"context_lines": 2
	})");
	EXPECT_TRUE(rule_set->GetRegistry().IsCaseSensitive());
	// Default rules carry (?i), which wins over the registry setting
	EXPECT_FALSE(rule_set->GetRegistry().GetRules()[0].case_sensitive);
	EXPECT_TRUE(rule_set->GetKeywords().Matches("process killed"));
	EXPECT_FALSE(rule_set->GetKeywords().Matches("error"));
	EXPECT_TRUE(rule_set->IsKnownWorkload("nightly"));
	EXPECT_FALSE(rule_set->IsKnownWorkload("workload_1"));
	EXPECT_EQ(rule_set->GetContextLines(), 2u);
}

TEST(PhaseRuleSet, EmptyObjectIsDefault) {
	auto rule_set = PhaseRuleSet::FromJson("{}");
	EXPECT_EQ(rule_set->GetInitialPhase(), PhaseRuleSet::DEFAULT_INITIAL_PHASE);
	EXPECT_EQ(rule_set->GetRegistry().RuleCount(), PhaseRuleSet::DefaultRules().size());
}

TEST(PhaseRuleSet, MalformedConfigurationIsRejected) {
	EXPECT_THROW(PhaseRuleSet::FromJson("not json"), InvalidInputException);
	EXPECT_THROW(PhaseRuleSet::FromJson("[]"), InvalidInputException);
	EXPECT_THROW(PhaseRuleSet::FromJson(R"({"unknown": 1})"), InvalidInputException);
	EXPECT_THROW(PhaseRuleSet::FromJson(R"({"initial_phase": ""})"), InvalidInputException);
	EXPECT_THROW(PhaseRuleSet::FromJson(R"({"initial_phase": 3})"), InvalidInputException);
	EXPECT_THROW(PhaseRuleSet::FromJson(R"({"case_sensitive": "yes"})"), InvalidInputException);
	EXPECT_THROW(PhaseRuleSet::FromJson(R"({"rules": {}})"), InvalidInputException);
	EXPECT_THROW(PhaseRuleSet::FromJson(R"({"rules": [{"label": "X"}]})"), InvalidInputException);
	EXPECT_THROW(PhaseRuleSet::FromJson(R"({"rules": [], "steps": {}})"), InvalidInputException);
	EXPECT_THROW(PhaseRuleSet::FromJson(R"({"error_identifiers": [1]})"), InvalidInputException);
	EXPECT_THROW(PhaseRuleSet::FromJson(R"({"context_lines": -1})"), InvalidInputException);
	EXPECT_THROW(PhaseRuleSet::FromJson(R"({"context_lines": 1.5})"), InvalidInputException);
}

TEST(PhaseRuleSet, InvalidRuleIsRejected) {
	EXPECT_THROW(PhaseRuleSet::FromJson(R"({"rules": [{"label": "X", "pattern": "no group"}]})"),
	             InvalidInputException);
	EXPECT_THROW(PhaseRuleSet::FromJson(R"({"steps": {"X": "(a)(b)"}})"), InvalidInputException);
}
