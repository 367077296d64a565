#include "core/error_hinting.hpp"
#include "duckdb/common/exception.hpp"
#include <gtest/gtest.h>

using namespace duckdb;

TEST(ErrorKeywordSet, DefaultKeywords) {
	ErrorKeywordSet keywords;
	std::vector<std::string> expected = {"error", "failure", "exception", "fatal", "panic", "failed"};
	EXPECT_EQ(keywords.GetKeywords(), expected);
}

TEST(ErrorKeywordSet, MatchIgnoresCase) {
	ErrorKeywordSet keywords;
	EXPECT_TRUE(HasErrorKeyword("FATAL: out of memory", keywords));
	EXPECT_TRUE(HasErrorKeyword("Build Failed", keywords));
	EXPECT_FALSE(HasErrorKeyword("all good", keywords));
	EXPECT_FALSE(HasErrorKeyword("", keywords));
}

TEST(ErrorKeywordSet, SubstringNotWholeWord) {
	ErrorKeywordSet keywords;
	EXPECT_TRUE(HasErrorKeyword("0 errors found", keywords));
	EXPECT_TRUE(HasErrorKeyword("NullPointerException at line 3", keywords));
}

TEST(ErrorKeywordSet, CustomKeywordsAreLowerCased) {
	ErrorKeywordSet keywords(std::vector<std::string> {"OOMKilled", "crashed"});
	EXPECT_EQ(keywords.GetKeywords()[0], "oomkilled");
	EXPECT_TRUE(keywords.Matches("pod oomkilled"));
	EXPECT_TRUE(keywords.Matches("pod CRASHED"));
	EXPECT_FALSE(keywords.Matches("error: but not a custom keyword"));
}

TEST(ErrorKeywordSet, EmptyListNeverMatches) {
	ErrorKeywordSet keywords(std::vector<std::string> {});
	EXPECT_FALSE(keywords.Matches("error everywhere"));
}

TEST(ErrorKeywordSet, RejectsEmptyKeyword) {
	std::vector<std::string> keywords = {"error", ""};
	EXPECT_THROW(ErrorKeywordSet {keywords}, InvalidInputException);
}
