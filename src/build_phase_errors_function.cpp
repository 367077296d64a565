#include "include/build_phase_errors_function.hpp"
#include "include/build_phases_function_info.hpp"
#include "core/phase_bind.hpp"
#include "core/phase_router.hpp"
#include "duckdb/common/exception.hpp"
#include <algorithm>

namespace duckdb {

struct BuildPhaseErrorsGlobalState : public GlobalTableFunctionState {
	std::vector<PhaseErrorReport> reports;
	idx_t position = 0;
};

static LogicalType ErrorLineType() {
	child_list_t<LogicalType> children;
	children.push_back(make_pair("line_number", LogicalType::BIGINT));
	children.push_back(make_pair("content", LogicalType::VARCHAR));
	children.push_back(make_pair("is_match", LogicalType::BOOLEAN));
	return LogicalType::STRUCT(children);
}

static void SetErrorReportSchema(vector<LogicalType> &return_types, vector<string> &names) {
	return_types = {
	    LogicalType::BIGINT,                // report_index
	    LogicalType::VARCHAR,               // phase
	    LogicalType::VARCHAR,               // phase_kind
	    LogicalType::VARCHAR,               // step_name
	    LogicalType::BIGINT,                // start_line
	    LogicalType::BOOLEAN,               // is_known_workload
	    LogicalType::BIGINT,                // error_count
	    LogicalType::LIST(ErrorLineType()), // error_lines
	};
	names = {"report_index", "phase",       "phase_kind", "step_name", "start_line", "is_known_workload",
	         "error_count",  "error_lines"};
}

static unique_ptr<FunctionData> ReadBuildPhaseErrorsBind(ClientContext &context, TableFunctionBindInput &input,
                                                         vector<LogicalType> &return_types, vector<string> &names) {
	auto bind_data = make_uniq<BuildPhasesBindData>();
	bind_data->input_kind = PhaseInputKind::FILE;
	BindBuildPhasesInput(input, "read_build_phase_errors", *bind_data);
	SetErrorReportSchema(return_types, names);
	return std::move(bind_data);
}

static unique_ptr<FunctionData> ParseBuildPhaseErrorsBind(ClientContext &context, TableFunctionBindInput &input,
                                                          vector<LogicalType> &return_types, vector<string> &names) {
	auto bind_data = make_uniq<BuildPhasesBindData>();
	bind_data->input_kind = PhaseInputKind::CONTENT;
	BindBuildPhasesInput(input, "parse_build_phase_errors", *bind_data);
	SetErrorReportSchema(return_types, names);
	return std::move(bind_data);
}

static unique_ptr<GlobalTableFunctionState> BuildPhaseErrorsInitGlobal(ClientContext &context,
                                                                       TableFunctionInitInput &input) {
	auto &bind_data = input.bind_data->Cast<BuildPhasesBindData>();
	auto global_state = make_uniq<BuildPhaseErrorsGlobalState>();

	auto segments = SegmentBoundSource(context, bind_data);
	PhaseErrorRouter router(bind_data.keywords, bind_data.rule_set->GetWorkloadNames(), bind_data.context_lines);
	global_state->reports = router.Route(segments);
	return std::move(global_state);
}

static Value ErrorLinesToValue(const std::vector<ErrorLine> &error_lines) {
	vector<Value> items;
	items.reserve(error_lines.size());
	for (const auto &error_line : error_lines) {
		child_list_t<Value> fields;
		fields.push_back(make_pair("line_number", Value::BIGINT(static_cast<int64_t>(error_line.line_number))));
		fields.push_back(make_pair("content", Value(error_line.content)));
		fields.push_back(make_pair("is_match", Value::BOOLEAN(error_line.is_match)));
		items.push_back(Value::STRUCT(std::move(fields)));
	}
	return Value::LIST(ErrorLineType(), std::move(items));
}

static void BuildPhaseErrorsFunction(ClientContext &context, TableFunctionInput &data_p, DataChunk &output) {
	auto &state = data_p.global_state->Cast<BuildPhaseErrorsGlobalState>();

	idx_t remaining = state.reports.size() - state.position;
	idx_t rows_to_output = std::min<idx_t>(STANDARD_VECTOR_SIZE, remaining);
	output.SetCardinality(rows_to_output);

	for (idx_t i = 0; i < rows_to_output; i++) {
		idx_t report_index = state.position + i;
		const PhaseErrorReport &report = state.reports[report_index];

		idx_t match_count = 0;
		for (const auto &error_line : report.error_lines) {
			if (error_line.is_match) {
				match_count++;
			}
		}

		output.SetValue(0, i, Value::BIGINT(static_cast<int64_t>(report_index)));
		output.SetValue(1, i, Value(report.phase_label));
		output.SetValue(2, i, Value(PhaseKindToString(report.kind)));
		output.SetValue(3, i, report.has_step_name ? Value(report.step_name) : Value());
		output.SetValue(4, i, Value::BIGINT(static_cast<int64_t>(report.start_line)));
		output.SetValue(5, i, Value::BOOLEAN(report.is_known_workload));
		output.SetValue(6, i, Value::BIGINT(static_cast<int64_t>(match_count)));
		output.SetValue(7, i, ErrorLinesToValue(report.error_lines));
	}

	state.position += rows_to_output;
}

static TableFunction MakeErrorsFunction(const std::string &name, vector<LogicalType> arguments,
                                        table_function_bind_t bind, shared_ptr<RuleSetCache> cache) {
	TableFunction function(name, std::move(arguments), BuildPhaseErrorsFunction, bind, BuildPhaseErrorsInitGlobal);
	function.named_parameters["initial_phase"] = LogicalType::VARCHAR;
	function.named_parameters["error_identifiers"] = LogicalType::LIST(LogicalType::VARCHAR);
	function.named_parameters["context_lines"] = LogicalType::INTEGER;
	function.function_info = make_shared_ptr<BuildPhasesTableInfo>(std::move(cache));
	return function;
}

TableFunctionSet GetReadBuildPhaseErrorsFunction(shared_ptr<RuleSetCache> cache) {
	TableFunctionSet set("read_build_phase_errors");
	set.AddFunction(
	    MakeErrorsFunction("read_build_phase_errors", {LogicalType::VARCHAR}, ReadBuildPhaseErrorsBind, cache));
	set.AddFunction(MakeErrorsFunction("read_build_phase_errors", {LogicalType::VARCHAR, LogicalType::VARCHAR},
	                                   ReadBuildPhaseErrorsBind, cache));
	return set;
}

TableFunctionSet GetParseBuildPhaseErrorsFunction(shared_ptr<RuleSetCache> cache) {
	TableFunctionSet set("parse_build_phase_errors");
	set.AddFunction(
	    MakeErrorsFunction("parse_build_phase_errors", {LogicalType::VARCHAR}, ParseBuildPhaseErrorsBind, cache));
	set.AddFunction(MakeErrorsFunction("parse_build_phase_errors", {LogicalType::VARCHAR, LogicalType::VARCHAR},
	                                   ParseBuildPhaseErrorsBind, cache));
	return set;
}

} // namespace duckdb
