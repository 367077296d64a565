#pragma once

#include "duckdb.hpp"
#include "duckdb/function/function_set.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "core/rule_set_cache.hpp"

namespace duckdb {

// build_phases_has_error_keyword(line [, keywords]) -> BOOLEAN
ScalarFunctionSet GetHasErrorKeywordFunction();

// build_phases_clear_cache() -> BIGINT, the number of evicted rule sets
ScalarFunction GetClearCacheFunction(shared_ptr<RuleSetCache> cache);

} // namespace duckdb
