#pragma once

#include "duckdb.hpp"
#include "duckdb/function/table_function.hpp"
#include "core/rule_set_cache.hpp"

namespace duckdb {

// build_phases_rules([config]) - lists the compiled boundary rules in match order
TableFunctionSet GetBuildPhasesRulesFunction(shared_ptr<RuleSetCache> cache);

} // namespace duckdb
