#pragma once

#include "duckdb.hpp"
#include <regex>
#include <string>
#include <vector>

namespace duckdb {

/**
 * Result of scanning a pattern for capturing groups.
 */
struct CaptureGroupInfo {
	idx_t total_groups = 0;     // All capturing groups, nested ones included
	idx_t outermost_groups = 0; // Capturing groups not enclosed by another capturing group
	idx_t step_group_index = 0; // Submatch index of the first outermost group (0 if none)
};

/**
 * Count the capturing groups of an ECMAScript pattern.
 * Escapes, bracket expressions, non-capturing groups and lookarounds are skipped.
 * Named groups must already have been rewritten to plain groups.
 */
CaptureGroupInfo ScanCaptureGroups(const std::string &pattern);

/**
 * A labeled pattern that marks the start of a new log phase.
 * The single outermost capturing group yields the step name.
 */
struct BoundaryRule {
	std::string label;
	std::string original_pattern;
	std::regex compiled_regex;
	idx_t step_group_index = 1;
	bool case_sensitive = false;

	/**
	 * Compile and validate a rule.
	 * Throws InvalidInputException if the pattern does not compile or does not have
	 * exactly one outermost capturing group.
	 */
	static BoundaryRule Compile(const std::string &label, const std::string &pattern, bool case_sensitive);
};

/**
 * Outcome of matching a line against the registry.
 */
struct BoundaryMatch {
	idx_t rule_index;
	std::string label;
	std::string step_name;
};

/**
 * Ordered list of boundary rules. Rules are tested in registration order and the
 * first hit wins; the registry never re-sorts and performs no conflict detection,
 * so specific rules must be registered before catch-all ones.
 *
 * Read-only once built; safe to share across concurrent runs.
 */
class BoundaryRuleRegistry {
public:
	explicit BoundaryRuleRegistry(bool case_sensitive = false) : case_sensitive_(case_sensitive) {
	}

	//! Append a rule. Validation errors throw InvalidInputException and leave the registry unchanged.
	void Register(const std::string &label, const std::string &pattern);

	//! Test rules in order; returns true and fills `match` on the first hit.
	bool Match(const std::string &line, BoundaryMatch &match) const;

	const std::vector<BoundaryRule> &GetRules() const {
		return rules_;
	}
	idx_t RuleCount() const {
		return rules_.size();
	}
	bool IsCaseSensitive() const {
		return case_sensitive_;
	}

private:
	bool case_sensitive_;
	std::vector<BoundaryRule> rules_;
};

} // namespace duckdb
