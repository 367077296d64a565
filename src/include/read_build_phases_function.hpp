#pragma once

#include "duckdb.hpp"
#include "duckdb/function/table_function.hpp"
#include "core/rule_set_cache.hpp"

namespace duckdb {

/**
 * read_build_phases(path [, config]) -> one row per segment of a log file.
 * parse_build_phases(content [, config]) -> the same for inline log text.
 *
 * Columns: segment_index, phase, step_name, start_line, line_count, body, potential_error.
 * Named parameters: initial_phase VARCHAR, error_identifiers VARCHAR[].
 */
TableFunctionSet GetReadBuildPhasesFunction(shared_ptr<RuleSetCache> cache);
TableFunctionSet GetParseBuildPhasesFunction(shared_ptr<RuleSetCache> cache);

} // namespace duckdb
