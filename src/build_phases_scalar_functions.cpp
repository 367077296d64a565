#include "include/build_phases_scalar_functions.hpp"
#include "include/build_phases_function_info.hpp"
#include "core/error_hinting.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/vector_operations/unary_executor.hpp"
#include "duckdb/planner/expression/bound_function_expression.hpp"

namespace duckdb {

// Overload 1: build_phases_has_error_keyword(line VARCHAR) -> BOOLEAN
// Uses the default error identifiers
static void HasErrorKeywordDefaultFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &line_vector = args.data[0];
	auto count = args.size();
	ErrorKeywordSet keywords;

	UnaryExecutor::Execute<string_t, bool>(line_vector, result, count, [&](string_t line) {
		return HasErrorKeyword(line.GetString(), keywords);
	});
}

// Overload 2: build_phases_has_error_keyword(line VARCHAR, keywords VARCHAR[]) -> BOOLEAN
// NULL line or NULL keyword list yields NULL
static void HasErrorKeywordListFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto count = args.size();

	for (idx_t i = 0; i < count; i++) {
		auto line_value = args.data[0].GetValue(i);
		auto keywords_value = args.data[1].GetValue(i);
		if (line_value.IsNull() || keywords_value.IsNull()) {
			result.SetValue(i, Value());
			continue;
		}

		std::vector<std::string> keyword_list;
		for (auto &child : ListValue::GetChildren(keywords_value)) {
			if (child.IsNull()) {
				throw InvalidInputException("build_phases_has_error_keyword: keywords must not contain NULL");
			}
			keyword_list.push_back(child.ToString());
		}
		ErrorKeywordSet keywords(keyword_list);
		result.SetValue(i, Value::BOOLEAN(HasErrorKeyword(line_value.ToString(), keywords)));
	}

	if (args.AllConstant()) {
		result.SetVectorType(VectorType::CONSTANT_VECTOR);
	}
}

static void ClearCacheFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &func_expr = state.expr.Cast<BoundFunctionExpression>();
	if (!func_expr.function.function_info) {
		throw InternalException("build_phases_clear_cache was registered without its rule set cache");
	}
	auto &info = func_expr.function.function_info->Cast<BuildPhasesScalarInfo>();
	auto evicted = info.cache->Clear();

	result.SetVectorType(VectorType::CONSTANT_VECTOR);
	ConstantVector::GetData<int64_t>(result)[0] = static_cast<int64_t>(evicted);
}

ScalarFunctionSet GetHasErrorKeywordFunction() {
	ScalarFunctionSet set("build_phases_has_error_keyword");

	set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::BOOLEAN, HasErrorKeywordDefaultFunction));

	set.AddFunction(ScalarFunction({LogicalType::VARCHAR, LogicalType::LIST(LogicalType::VARCHAR)},
	                               LogicalType::BOOLEAN, HasErrorKeywordListFunction));

	return set;
}

ScalarFunction GetClearCacheFunction(shared_ptr<RuleSetCache> cache) {
	ScalarFunction function("build_phases_clear_cache", {}, LogicalType::BIGINT, ClearCacheFunction);
	function.stability = FunctionStability::VOLATILE;
	function.function_info = make_shared_ptr<BuildPhasesScalarInfo>(std::move(cache));
	return function;
}

} // namespace duckdb
