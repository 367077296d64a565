#pragma once

#include "duckdb.hpp"
#include <string>
#include <vector>

namespace duckdb {

/**
 * Keywords that mark a log line as a potential error.
 * Stored lower-cased; matching is a case-insensitive substring test, not whole-word.
 * This is a triage signal only - flagged segments are re-scanned downstream.
 */
class ErrorKeywordSet {
public:
	//! The default identifiers: error, failure, exception, fatal, panic, failed
	ErrorKeywordSet();
	//! Throws InvalidInputException on an empty keyword
	explicit ErrorKeywordSet(const std::vector<std::string> &keywords);

	static const std::vector<std::string> &DefaultKeywords();

	bool Matches(const std::string &line) const;

	const std::vector<std::string> &GetKeywords() const {
		return keywords_;
	}

private:
	std::vector<std::string> keywords_;
};

//! True if `line` contains any of `keywords`, ignoring case
bool HasErrorKeyword(const std::string &line, const ErrorKeywordSet &keywords);

} // namespace duckdb
