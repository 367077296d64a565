#include "phase_bind.hpp"
#include "include/build_phases_function_info.hpp"
#include "core/line_source.hpp"
#include "core/trace.hpp"
#include "duckdb/common/exception.hpp"

namespace duckdb {

void BindBuildPhasesInput(TableFunctionBindInput &input, const std::string &function_name,
                          BuildPhasesBindData &bind_data) {
	if (input.inputs.empty() || input.inputs[0].IsNull()) {
		throw BinderException("%s requires a non-NULL first argument", function_name);
	}
	bind_data.source = input.inputs[0].ToString();

	std::string config_json;
	if (input.inputs.size() > 1) {
		if (input.inputs[1].IsNull()) {
			throw BinderException("%s: config must not be NULL", function_name);
		}
		config_json = input.inputs[1].ToString();
	}

	if (!input.info) {
		throw InternalException("%s was registered without its rule set cache", function_name);
	}
	auto &info = input.info->Cast<BuildPhasesTableInfo>();
	bind_data.rule_set = info.cache->GetOrCompile(config_json);
	bind_data.initial_phase = bind_data.rule_set->GetInitialPhase();
	bind_data.keywords = bind_data.rule_set->GetKeywords();
	bind_data.context_lines = bind_data.rule_set->GetContextLines();

	auto initial_param = input.named_parameters.find("initial_phase");
	if (initial_param != input.named_parameters.end()) {
		if (initial_param->second.IsNull() || initial_param->second.ToString().empty()) {
			throw BinderException("%s: initial_phase must be a non-empty string", function_name);
		}
		bind_data.initial_phase = initial_param->second.ToString();
	}

	auto keywords_param = input.named_parameters.find("error_identifiers");
	if (keywords_param != input.named_parameters.end()) {
		if (keywords_param->second.IsNull()) {
			throw BinderException("%s: error_identifiers must not be NULL", function_name);
		}
		std::vector<std::string> keywords;
		for (auto &child : ListValue::GetChildren(keywords_param->second)) {
			if (child.IsNull()) {
				throw BinderException("%s: error_identifiers must not contain NULL", function_name);
			}
			keywords.push_back(child.ToString());
		}
		bind_data.keywords = ErrorKeywordSet(keywords);
	}

	auto context_param = input.named_parameters.find("context_lines");
	if (context_param != input.named_parameters.end()) {
		if (context_param->second.IsNull()) {
			throw BinderException("%s: context_lines must not be NULL", function_name);
		}
		auto context_lines = context_param->second.GetValue<int32_t>();
		if (context_lines < 0) {
			throw BinderException("%s: context_lines must be non-negative", function_name);
		}
		bind_data.context_lines = static_cast<idx_t>(context_lines);
	}
}

std::vector<Segment> SegmentBoundSource(ClientContext &context, const BuildPhasesBindData &bind_data) {
	SegmentationEngine engine(bind_data.rule_set->GetRegistry(), bind_data.keywords, bind_data.initial_phase);
	if (bind_data.input_kind == PhaseInputKind::CONTENT) {
		ContentLineSource source(bind_data.source);
		return engine.Run(source);
	}
	BUILD_PHASES_TRACE("segmenting file " << bind_data.source);
	FileLineSource source(context, bind_data.source);
	return engine.Run(source);
}

} // namespace duckdb
