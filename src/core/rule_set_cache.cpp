#include "rule_set_cache.hpp"
#include "core/trace.hpp"

namespace duckdb {

shared_ptr<const PhaseRuleSet> RuleSetCache::GetOrCompile(const std::string &config_json) {
	{
		std::lock_guard<std::mutex> guard(lock_);
		auto entry = entries_.find(config_json);
		if (entry != entries_.end()) {
			return entry->second;
		}
	}

	// Compile outside the lock; regex compilation can be slow
	unique_ptr<PhaseRuleSet> compiled =
	    config_json.empty() ? PhaseRuleSet::Default() : PhaseRuleSet::FromJson(config_json);
	shared_ptr<const PhaseRuleSet> rule_set(compiled.release());

	std::lock_guard<std::mutex> guard(lock_);
	auto inserted = entries_.emplace(config_json, rule_set);
	BUILD_PHASES_TRACE("rule set cache " << (inserted.second ? "stored" : "raced on") << " entry, size "
	                                     << entries_.size());
	return inserted.first->second;
}

idx_t RuleSetCache::Clear() {
	std::lock_guard<std::mutex> guard(lock_);
	idx_t removed = entries_.size();
	entries_.clear();
	BUILD_PHASES_TRACE("rule set cache cleared " << removed << " entries");
	return removed;
}

idx_t RuleSetCache::Size() const {
	std::lock_guard<std::mutex> guard(lock_);
	return entries_.size();
}

} // namespace duckdb
