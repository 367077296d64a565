#define DUCKDB_EXTENSION_MAIN

#include "build_phases_extension.hpp"
#include "duckdb.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/function/scalar_function.hpp"

#include "include/read_build_phases_function.hpp"
#include "include/build_phase_errors_function.hpp"
#include "include/build_phases_rules_function.hpp"
#include "include/build_phases_scalar_functions.hpp"
#include "core/rule_set_cache.hpp"

namespace duckdb {

static void LoadInternal(ExtensionLoader &loader) {
	// One cache per load, shared by every function that compiles rule sets
	auto cache = make_shared_ptr<RuleSetCache>();

	// Segment tables
	auto read_build_phases_function = GetReadBuildPhasesFunction(cache);
	loader.RegisterFunction(read_build_phases_function);

	auto parse_build_phases_function = GetParseBuildPhasesFunction(cache);
	loader.RegisterFunction(parse_build_phases_function);

	// Routed error reports
	auto read_build_phase_errors_function = GetReadBuildPhaseErrorsFunction(cache);
	loader.RegisterFunction(read_build_phase_errors_function);

	auto parse_build_phase_errors_function = GetParseBuildPhaseErrorsFunction(cache);
	loader.RegisterFunction(parse_build_phase_errors_function);

	// Rule introspection
	auto build_phases_rules_function = GetBuildPhasesRulesFunction(cache);
	loader.RegisterFunction(build_phases_rules_function);

	// Scalar utility functions
	auto has_error_keyword_function = GetHasErrorKeywordFunction();
	loader.RegisterFunction(has_error_keyword_function);

	auto clear_cache_function = GetClearCacheFunction(cache);
	loader.RegisterFunction(clear_cache_function);
}

void BuildPhasesExtension::Load(ExtensionLoader &loader) {
	LoadInternal(loader);
}
std::string BuildPhasesExtension::Name() {
	return "build_phases";
}

std::string BuildPhasesExtension::Version() const {
#ifdef EXT_VERSION_BUILD_PHASES
	return EXT_VERSION_BUILD_PHASES;
#else
	return "";
#endif
}

} // namespace duckdb

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(build_phases, loader) {
	duckdb::LoadInternal(loader);
}

DUCKDB_EXTENSION_API const char *build_phases_version() {
	return duckdb::DuckDB::LibraryVersion();
}
}

#ifndef DUCKDB_EXTENSION_MAIN
#error DUCKDB_EXTENSION_MAIN not defined
#endif
