#include "phase_rule_set.hpp"
#include "duckdb/common/exception.hpp"
#include "yyjson.h"
#include <algorithm>

namespace duckdb {

constexpr const char *PhaseRuleSet::DEFAULT_INITIAL_PHASE;

PhaseRuleSet::PhaseRuleSet(std::string initial_phase, BoundaryRuleRegistry registry, ErrorKeywordSet keywords,
                           std::unordered_set<std::string> workload_names, idx_t context_lines)
    : initial_phase_(std::move(initial_phase)), registry_(std::move(registry)), keywords_(std::move(keywords)),
      workload_names_(std::move(workload_names)), context_lines_(context_lines) {
}

const std::vector<std::pair<std::string, std::string>> &PhaseRuleSet::DefaultRules() {
	// WORKLOAD is a catch-all guarded by a negative lookahead; it must never see install/deploy/orion steps
	static const std::vector<std::pair<std::string, std::string>> rules = {
	    {"INSTALL", R"((?i)running step (.*\b(install|deploy)[\w-]+))"},
	    {"WORKLOAD", R"((?i)running step ((?!.*\b(install|deploy|orion)\w*)[\w-]+))"},
	    {"ORION", R"((?i)running step (.*\b(orion)[\w-]+))"},
	};
	return rules;
}

const std::vector<std::string> &PhaseRuleSet::DefaultWorkloadNames() {
	static const std::vector<std::string> names = {"workload_1", "workload_2"};
	return names;
}

unique_ptr<PhaseRuleSet> PhaseRuleSet::Default() {
	BoundaryRuleRegistry registry(false);
	for (const auto &rule : DefaultRules()) {
		registry.Register(rule.first, rule.second);
	}
	auto &names = DefaultWorkloadNames();
	return make_uniq<PhaseRuleSet>(DEFAULT_INITIAL_PHASE, std::move(registry), ErrorKeywordSet(),
	                               std::unordered_set<std::string>(names.begin(), names.end()), 0);
}

static std::vector<std::string> ReadStringArray(yyjson_val *array_val, const char *field) {
	if (!yyjson_is_arr(array_val)) {
		throw InvalidInputException("Config field '%s' must be an array of strings", field);
	}
	std::vector<std::string> values;
	size_t idx, max;
	yyjson_val *val;
	yyjson_arr_foreach(array_val, idx, max, val) {
		if (!yyjson_is_str(val)) {
			throw InvalidInputException("Config field '%s' must be an array of strings", field);
		}
		values.emplace_back(yyjson_get_str(val), yyjson_get_len(val));
	}
	return values;
}

static std::string ReadString(yyjson_val *val, const char *field) {
	if (!yyjson_is_str(val)) {
		throw InvalidInputException("Config field '%s' must be a string", field);
	}
	return std::string(yyjson_get_str(val), yyjson_get_len(val));
}

unique_ptr<PhaseRuleSet> PhaseRuleSet::FromJson(const std::string &json_config) {
	yyjson_doc *doc = yyjson_read(json_config.c_str(), json_config.size(), 0);
	if (!doc) {
		throw InvalidInputException("Invalid JSON in build_phases config");
	}

	// RAII cleanup
	struct DocGuard {
		yyjson_doc *doc;
		~DocGuard() {
			if (doc) {
				yyjson_doc_free(doc);
			}
		}
	} doc_guard {doc};

	yyjson_val *root = yyjson_doc_get_root(doc);
	if (!yyjson_is_obj(root)) {
		throw InvalidInputException("build_phases config must be a JSON object");
	}

	static const std::vector<std::string> known_fields = {"initial_phase",     "case_sensitive", "rules",
	                                                      "steps",             "error_identifiers",
	                                                      "workload_names",    "context_lines"};
	yyjson_obj_iter field_iter;
	yyjson_obj_iter_init(root, &field_iter);
	yyjson_val *field_key;
	while ((field_key = yyjson_obj_iter_next(&field_iter))) {
		std::string name(yyjson_get_str(field_key), yyjson_get_len(field_key));
		if (std::find(known_fields.begin(), known_fields.end(), name) == known_fields.end()) {
			throw InvalidInputException("Unknown build_phases config field: '%s'", name);
		}
	}

	std::string initial_phase = DEFAULT_INITIAL_PHASE;
	yyjson_val *initial_val = yyjson_obj_get(root, "initial_phase");
	if (initial_val) {
		initial_phase = ReadString(initial_val, "initial_phase");
		if (initial_phase.empty()) {
			throw InvalidInputException("Config field 'initial_phase' must not be empty");
		}
	}

	bool case_sensitive = false;
	yyjson_val *case_val = yyjson_obj_get(root, "case_sensitive");
	if (case_val) {
		if (!yyjson_is_bool(case_val)) {
			throw InvalidInputException("Config field 'case_sensitive' must be a boolean");
		}
		case_sensitive = yyjson_get_bool(case_val);
	}

	// Rules, in document order
	std::vector<std::pair<std::string, std::string>> rules;
	yyjson_val *rules_val = yyjson_obj_get(root, "rules");
	yyjson_val *steps_val = yyjson_obj_get(root, "steps");
	if (rules_val && steps_val) {
		throw InvalidInputException("Config fields 'rules' and 'steps' are mutually exclusive");
	}
	if (rules_val) {
		if (!yyjson_is_arr(rules_val)) {
			throw InvalidInputException("Config field 'rules' must be an array");
		}
		size_t idx, max;
		yyjson_val *rule_val;
		yyjson_arr_foreach(rules_val, idx, max, rule_val) {
			if (!yyjson_is_obj(rule_val)) {
				throw InvalidInputException("Rule %llu must be an object with 'label' and 'pattern'", idx);
			}
			yyjson_val *label_val = yyjson_obj_get(rule_val, "label");
			yyjson_val *pattern_val = yyjson_obj_get(rule_val, "pattern");
			if (!label_val || !pattern_val) {
				throw InvalidInputException("Rule %llu is missing required field 'label' or 'pattern'", idx);
			}
			rules.emplace_back(ReadString(label_val, "label"), ReadString(pattern_val, "pattern"));
		}
	} else if (steps_val) {
		if (!yyjson_is_obj(steps_val)) {
			throw InvalidInputException("Config field 'steps' must be an object mapping labels to patterns");
		}
		yyjson_obj_iter iter;
		yyjson_obj_iter_init(steps_val, &iter);
		yyjson_val *key;
		while ((key = yyjson_obj_iter_next(&iter))) {
			yyjson_val *val = yyjson_obj_iter_get_val(key);
			rules.emplace_back(std::string(yyjson_get_str(key), yyjson_get_len(key)), ReadString(val, "steps"));
		}
	} else {
		rules = DefaultRules();
	}

	BoundaryRuleRegistry registry(case_sensitive);
	for (const auto &rule : rules) {
		registry.Register(rule.first, rule.second);
	}

	yyjson_val *keywords_val = yyjson_obj_get(root, "error_identifiers");
	ErrorKeywordSet keywords = keywords_val ? ErrorKeywordSet(ReadStringArray(keywords_val, "error_identifiers"))
	                                        : ErrorKeywordSet();

	std::vector<std::string> workload_names = DefaultWorkloadNames();
	yyjson_val *workloads_val = yyjson_obj_get(root, "workload_names");
	if (workloads_val) {
		workload_names = ReadStringArray(workloads_val, "workload_names");
	}

	idx_t context_lines = 0;
	yyjson_val *context_val = yyjson_obj_get(root, "context_lines");
	if (context_val) {
		if (!yyjson_is_int(context_val) || (yyjson_is_sint(context_val) && yyjson_get_sint(context_val) < 0)) {
			throw InvalidInputException("Config field 'context_lines' must be a non-negative integer");
		}
		context_lines = yyjson_get_uint(context_val);
	}

	return make_uniq<PhaseRuleSet>(std::move(initial_phase), std::move(registry), std::move(keywords),
	                               std::unordered_set<std::string>(workload_names.begin(), workload_names.end()),
	                               context_lines);
}

} // namespace duckdb
