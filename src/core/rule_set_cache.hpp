#pragma once

#include "core/phase_rule_set.hpp"
#include "duckdb/common/shared_ptr.hpp"
#include <mutex>
#include <string>
#include <unordered_map>

namespace duckdb {

/**
 * Compiled rule sets keyed by their JSON configuration text.
 * The empty key stands for the built-in default rule set.
 *
 * Owned by the extension and handed to the SQL functions that need it;
 * all operations are thread-safe.
 */
class RuleSetCache {
public:
	//! Return the compiled rule set for `config_json`, compiling and caching it on first use.
	//! Configuration errors propagate and nothing is cached.
	shared_ptr<const PhaseRuleSet> GetOrCompile(const std::string &config_json);

	//! Drop every cached rule set; returns the number of entries removed
	idx_t Clear();

	idx_t Size() const;

private:
	mutable std::mutex lock_;
	std::unordered_map<std::string, shared_ptr<const PhaseRuleSet>> entries_;
};

} // namespace duckdb
