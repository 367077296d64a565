#pragma once

#include "core/boundary_rules.hpp"
#include "core/error_hinting.hpp"
#include "duckdb/common/unique_ptr.hpp"
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace duckdb {

/**
 * Everything needed to segment and triage one kind of build log:
 * the ordered boundary rules, the initial phase label, the error keywords,
 * the names of known workload steps and the context width for error extraction.
 */
class PhaseRuleSet {
public:
	static constexpr const char *DEFAULT_INITIAL_PHASE = "CONFIG";

	PhaseRuleSet(std::string initial_phase, BoundaryRuleRegistry registry, ErrorKeywordSet keywords,
	             std::unordered_set<std::string> workload_names, idx_t context_lines);

	/**
	 * The built-in CI rule set: CONFIG initial phase followed by INSTALL, WORKLOAD
	 * and ORION "running step" boundaries.
	 */
	static unique_ptr<PhaseRuleSet> Default();

	/**
	 * Build a rule set from JSON configuration. All fields are optional:
	 *
	 *   {
	 *     "initial_phase": "CONFIG",
	 *     "case_sensitive": false,
	 *     "rules": [{"label": "INSTALL", "pattern": "running step (.*install.*)"}],
	 *     "steps": {"INSTALL": "running step (.*install.*)"},
	 *     "error_identifiers": ["error", "failed"],
	 *     "workload_names": ["workload_1"],
	 *     "context_lines": 0
	 *   }
	 *
	 * "rules" and "steps" are alternative spellings of the ordered rule list and are
	 * mutually exclusive; without either the default rules apply.
	 * Throws InvalidInputException on malformed configuration.
	 */
	static unique_ptr<PhaseRuleSet> FromJson(const std::string &json_config);

	//! The (label, pattern) pairs of the default rule set, in registration order
	static const std::vector<std::pair<std::string, std::string>> &DefaultRules();
	static const std::vector<std::string> &DefaultWorkloadNames();

	const std::string &GetInitialPhase() const {
		return initial_phase_;
	}
	const BoundaryRuleRegistry &GetRegistry() const {
		return registry_;
	}
	const ErrorKeywordSet &GetKeywords() const {
		return keywords_;
	}
	const std::unordered_set<std::string> &GetWorkloadNames() const {
		return workload_names_;
	}
	idx_t GetContextLines() const {
		return context_lines_;
	}

	bool IsKnownWorkload(const std::string &step_name) const {
		return workload_names_.find(step_name) != workload_names_.end();
	}

private:
	std::string initial_phase_;
	BoundaryRuleRegistry registry_;
	ErrorKeywordSet keywords_;
	std::unordered_set<std::string> workload_names_;
	idx_t context_lines_;
};

} // namespace duckdb
