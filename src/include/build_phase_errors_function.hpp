#pragma once

#include "duckdb.hpp"
#include "duckdb/function/table_function.hpp"
#include "core/rule_set_cache.hpp"

namespace duckdb {

/**
 * read_build_phase_errors(path [, config]) and parse_build_phase_errors(content [, config])
 * route every flagged segment to its phase handler and return one row per report.
 *
 * error_lines is LIST(STRUCT(line_number BIGINT, content VARCHAR, is_match BOOLEAN)).
 */
TableFunctionSet GetReadBuildPhaseErrorsFunction(shared_ptr<RuleSetCache> cache);
TableFunctionSet GetParseBuildPhaseErrorsFunction(shared_ptr<RuleSetCache> cache);

} // namespace duckdb
