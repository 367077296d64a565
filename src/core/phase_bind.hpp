#pragma once

#include "duckdb.hpp"
#include "duckdb/function/table_function.hpp"
#include "core/phase_rule_set.hpp"
#include "core/segmentation_engine.hpp"
#include <string>
#include <vector>

namespace duckdb {

// Where the log text of a table function comes from
enum class PhaseInputKind : uint8_t { FILE = 0, CONTENT = 1 };

/**
 * Bind data shared by the segment and error table functions.
 * The rule set is shared with the cache; overrides from named parameters live
 * beside it so the cached rule set is never modified.
 */
struct BuildPhasesBindData : public TableFunctionData {
	PhaseInputKind input_kind = PhaseInputKind::FILE;
	std::string source;
	shared_ptr<const PhaseRuleSet> rule_set;
	std::string initial_phase;
	ErrorKeywordSet keywords;
	idx_t context_lines = 0;
};

/**
 * Resolve positional arguments (source [, config]) and the named parameters
 * initial_phase, error_identifiers and context_lines into `bind_data`.
 * Throws BinderException on missing or NULL arguments; configuration errors
 * surface as InvalidInputException.
 */
void BindBuildPhasesInput(TableFunctionBindInput &input, const std::string &function_name,
                          BuildPhasesBindData &bind_data);

//! Run the segmentation engine over the bound source
std::vector<Segment> SegmentBoundSource(ClientContext &context, const BuildPhasesBindData &bind_data);

} // namespace duckdb
