#pragma once

#include "duckdb.hpp"
#include "duckdb/function/table_function.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "core/rule_set_cache.hpp"

namespace duckdb {

// Carries the extension's rule set cache into table function binds
struct BuildPhasesTableInfo : public TableFunctionInfo {
	explicit BuildPhasesTableInfo(shared_ptr<RuleSetCache> cache_p) : cache(std::move(cache_p)) {
	}
	shared_ptr<RuleSetCache> cache;
};

// Same, for scalar functions
struct BuildPhasesScalarInfo : public ScalarFunctionInfo {
	explicit BuildPhasesScalarInfo(shared_ptr<RuleSetCache> cache_p) : cache(std::move(cache_p)) {
	}
	shared_ptr<RuleSetCache> cache;
};

} // namespace duckdb
