#include "include/read_build_phases_function.hpp"
#include "include/build_phases_function_info.hpp"
#include "core/phase_bind.hpp"
#include "duckdb/common/exception.hpp"
#include <algorithm>

namespace duckdb {

struct BuildPhasesGlobalState : public GlobalTableFunctionState {
	std::vector<Segment> segments;
	idx_t position = 0;
};

static void SetSegmentSchema(vector<LogicalType> &return_types, vector<string> &names) {
	return_types = {
	    LogicalType::BIGINT,  // segment_index
	    LogicalType::VARCHAR, // phase
	    LogicalType::VARCHAR, // step_name
	    LogicalType::BIGINT,  // start_line
	    LogicalType::BIGINT,  // line_count
	    LogicalType::VARCHAR, // body
	    LogicalType::BOOLEAN, // potential_error
	};
	names = {"segment_index", "phase", "step_name", "start_line", "line_count", "body", "potential_error"};
}

static unique_ptr<FunctionData> ReadBuildPhasesBind(ClientContext &context, TableFunctionBindInput &input,
                                                    vector<LogicalType> &return_types, vector<string> &names) {
	auto bind_data = make_uniq<BuildPhasesBindData>();
	bind_data->input_kind = PhaseInputKind::FILE;
	BindBuildPhasesInput(input, "read_build_phases", *bind_data);
	SetSegmentSchema(return_types, names);
	return std::move(bind_data);
}

static unique_ptr<FunctionData> ParseBuildPhasesBind(ClientContext &context, TableFunctionBindInput &input,
                                                     vector<LogicalType> &return_types, vector<string> &names) {
	auto bind_data = make_uniq<BuildPhasesBindData>();
	bind_data->input_kind = PhaseInputKind::CONTENT;
	BindBuildPhasesInput(input, "parse_build_phases", *bind_data);
	SetSegmentSchema(return_types, names);
	return std::move(bind_data);
}

static unique_ptr<GlobalTableFunctionState> BuildPhasesInitGlobal(ClientContext &context,
                                                                  TableFunctionInitInput &input) {
	auto &bind_data = input.bind_data->Cast<BuildPhasesBindData>();
	auto global_state = make_uniq<BuildPhasesGlobalState>();
	global_state->segments = SegmentBoundSource(context, bind_data);
	return std::move(global_state);
}

static void BuildPhasesFunction(ClientContext &context, TableFunctionInput &data_p, DataChunk &output) {
	auto &state = data_p.global_state->Cast<BuildPhasesGlobalState>();

	idx_t remaining = state.segments.size() - state.position;
	idx_t rows_to_output = std::min<idx_t>(STANDARD_VECTOR_SIZE, remaining);
	output.SetCardinality(rows_to_output);

	for (idx_t i = 0; i < rows_to_output; i++) {
		idx_t segment_index = state.position + i;
		const Segment &segment = state.segments[segment_index];

		output.SetValue(0, i, Value::BIGINT(static_cast<int64_t>(segment_index)));
		output.SetValue(1, i, Value(segment.phase_label));
		output.SetValue(2, i, segment.has_step_name ? Value(segment.step_name) : Value());
		output.SetValue(3, i, Value::BIGINT(static_cast<int64_t>(segment.start_line)));
		output.SetValue(4, i, Value::BIGINT(static_cast<int64_t>(segment.line_count)));
		output.SetValue(5, i, Value(segment.body));
		output.SetValue(6, i, Value::BOOLEAN(segment.flagged));
	}

	state.position += rows_to_output;
}

static TableFunction MakeSegmentFunction(const std::string &name, vector<LogicalType> arguments,
                                         table_function_bind_t bind, shared_ptr<RuleSetCache> cache) {
	TableFunction function(name, std::move(arguments), BuildPhasesFunction, bind, BuildPhasesInitGlobal);
	function.named_parameters["initial_phase"] = LogicalType::VARCHAR;
	function.named_parameters["error_identifiers"] = LogicalType::LIST(LogicalType::VARCHAR);
	function.function_info = make_shared_ptr<BuildPhasesTableInfo>(std::move(cache));
	return function;
}

TableFunctionSet GetReadBuildPhasesFunction(shared_ptr<RuleSetCache> cache) {
	TableFunctionSet set("read_build_phases");
	// read_build_phases(path)
	set.AddFunction(MakeSegmentFunction("read_build_phases", {LogicalType::VARCHAR}, ReadBuildPhasesBind, cache));
	// read_build_phases(path, config)
	set.AddFunction(MakeSegmentFunction("read_build_phases", {LogicalType::VARCHAR, LogicalType::VARCHAR},
	                                    ReadBuildPhasesBind, cache));
	return set;
}

TableFunctionSet GetParseBuildPhasesFunction(shared_ptr<RuleSetCache> cache) {
	TableFunctionSet set("parse_build_phases");
	set.AddFunction(MakeSegmentFunction("parse_build_phases", {LogicalType::VARCHAR}, ParseBuildPhasesBind, cache));
	set.AddFunction(MakeSegmentFunction("parse_build_phases", {LogicalType::VARCHAR, LogicalType::VARCHAR},
	                                    ParseBuildPhasesBind, cache));
	return set;
}

} // namespace duckdb
