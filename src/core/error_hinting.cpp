#include "error_hinting.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"

namespace duckdb {

const std::vector<std::string> &ErrorKeywordSet::DefaultKeywords() {
	static const std::vector<std::string> defaults = {"error", "failure", "exception", "fatal", "panic", "failed"};
	return defaults;
}

ErrorKeywordSet::ErrorKeywordSet() : keywords_(DefaultKeywords()) {
}

ErrorKeywordSet::ErrorKeywordSet(const std::vector<std::string> &keywords) {
	keywords_.reserve(keywords.size());
	for (const auto &keyword : keywords) {
		if (keyword.empty()) {
			throw InvalidInputException("Error identifiers must not contain an empty keyword");
		}
		keywords_.push_back(StringUtil::Lower(keyword));
	}
}

bool ErrorKeywordSet::Matches(const std::string &line) const {
	if (keywords_.empty() || line.empty()) {
		return false;
	}
	auto lower_line = StringUtil::Lower(line);
	for (const auto &keyword : keywords_) {
		if (lower_line.find(keyword) != std::string::npos) {
			return true;
		}
	}
	return false;
}

bool HasErrorKeyword(const std::string &line, const ErrorKeywordSet &keywords) {
	return keywords.Matches(line);
}

} // namespace duckdb
