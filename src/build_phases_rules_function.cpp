#include "include/build_phases_rules_function.hpp"
#include "include/build_phases_function_info.hpp"
#include "duckdb/common/exception.hpp"

namespace duckdb {

struct BuildPhasesRulesBindData : public TableFunctionData {
	shared_ptr<const PhaseRuleSet> rule_set;
};

struct BuildPhasesRulesGlobalState : public GlobalTableFunctionState {
	idx_t current_idx = 0;
};

static unique_ptr<FunctionData> BuildPhasesRulesBind(ClientContext &context, TableFunctionBindInput &input,
                                                     vector<LogicalType> &return_types, vector<string> &names) {
	std::string config_json;
	if (!input.inputs.empty()) {
		if (input.inputs[0].IsNull()) {
			throw BinderException("build_phases_rules: config must not be NULL");
		}
		config_json = input.inputs[0].ToString();
	}
	if (!input.info) {
		throw InternalException("build_phases_rules was registered without its rule set cache");
	}

	auto bind_data = make_uniq<BuildPhasesRulesBindData>();
	bind_data->rule_set = input.info->Cast<BuildPhasesTableInfo>().cache->GetOrCompile(config_json);

	return_types = {
	    LogicalType::BIGINT,  // rule_index
	    LogicalType::VARCHAR, // label
	    LogicalType::VARCHAR, // pattern
	    LogicalType::BOOLEAN  // case_sensitive
	};
	names = {"rule_index", "label", "pattern", "case_sensitive"};

	return std::move(bind_data);
}

static unique_ptr<GlobalTableFunctionState> BuildPhasesRulesInitGlobal(ClientContext &context,
                                                                       TableFunctionInitInput &input) {
	return make_uniq<BuildPhasesRulesGlobalState>();
}

static void BuildPhasesRulesFunction(ClientContext &context, TableFunctionInput &data_p, DataChunk &output) {
	auto &bind_data = data_p.bind_data->Cast<BuildPhasesRulesBindData>();
	auto &state = data_p.global_state->Cast<BuildPhasesRulesGlobalState>();
	auto &rules = bind_data.rule_set->GetRegistry().GetRules();

	idx_t count = 0;
	while (state.current_idx < rules.size() && count < STANDARD_VECTOR_SIZE) {
		const auto &rule = rules[state.current_idx];
		output.SetValue(0, count, Value::BIGINT(static_cast<int64_t>(state.current_idx)));
		output.SetValue(1, count, Value(rule.label));
		output.SetValue(2, count, Value(rule.original_pattern));
		output.SetValue(3, count, Value::BOOLEAN(rule.case_sensitive));
		state.current_idx++;
		count++;
	}

	output.SetCardinality(count);
}

TableFunctionSet GetBuildPhasesRulesFunction(shared_ptr<RuleSetCache> cache) {
	TableFunctionSet set("build_phases_rules");

	// build_phases_rules() - the built-in rule set
	TableFunction defaults("build_phases_rules", {}, BuildPhasesRulesFunction, BuildPhasesRulesBind,
	                       BuildPhasesRulesInitGlobal);
	defaults.function_info = make_shared_ptr<BuildPhasesTableInfo>(cache);
	set.AddFunction(defaults);

	// build_phases_rules(config)
	TableFunction configured("build_phases_rules", {LogicalType::VARCHAR}, BuildPhasesRulesFunction,
	                         BuildPhasesRulesBind, BuildPhasesRulesInitGlobal);
	configured.function_info = make_shared_ptr<BuildPhasesTableInfo>(cache);
	set.AddFunction(configured);

	return set;
}

} // namespace duckdb
