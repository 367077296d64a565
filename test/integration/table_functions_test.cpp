#include "duckdb.hpp"
#include "build_phases_extension.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>

using namespace duckdb;

namespace {

const char *PIPELINE_LOG = "Running step deploy-cluster\n"
                           "installing...\n"
                           "Running step workload_1\n"
                           "error: pod crashed\n"
                           "all good\n"
                           "Running step run-orion-check\n"
                           "done\n";

class BuildPhasesSqlTest : public ::testing::Test {
protected:
	BuildPhasesSqlTest() : db(nullptr), con(db) {
	}

	void SetUp() override {
		db.LoadStaticExtension<BuildPhasesExtension>();
	}

	unique_ptr<MaterializedQueryResult> Query(const std::string &sql) {
		auto result = con.Query(sql);
		EXPECT_FALSE(result->HasError()) << sql << "\n" << result->GetError();
		return result;
	}

	DuckDB db;
	Connection con;
};

} // namespace

TEST_F(BuildPhasesSqlTest, ParseBuildPhasesReturnsSegments) {
	auto result = Query(std::string("SELECT segment_index, phase, step_name, start_line, line_count, potential_error "
	                                "FROM parse_build_phases('") +
	                    PIPELINE_LOG + "') ORDER BY segment_index");
	ASSERT_EQ(result->RowCount(), 4u);

	EXPECT_EQ(result->GetValue(1, 0).ToString(), "CONFIG");
	EXPECT_TRUE(result->GetValue(2, 0).IsNull());
	EXPECT_EQ(result->GetValue(4, 0).GetValue<int64_t>(), 0);

	EXPECT_EQ(result->GetValue(1, 1).ToString(), "INSTALL");
	EXPECT_EQ(result->GetValue(1, 2).ToString(), "WORKLOAD");
	EXPECT_EQ(result->GetValue(2, 2).ToString(), "workload_1");
	EXPECT_EQ(result->GetValue(3, 2).GetValue<int64_t>(), 2);
	EXPECT_TRUE(result->GetValue(5, 2).GetValue<bool>());
	EXPECT_EQ(result->GetValue(1, 3).ToString(), "ORION");
	EXPECT_FALSE(result->GetValue(5, 3).GetValue<bool>());
}

TEST_F(BuildPhasesSqlTest, NamedParametersOverrideRuleSet) {
	auto result = Query(std::string("SELECT phase, potential_error FROM parse_build_phases('") + PIPELINE_LOG +
	                    "', initial_phase := 'BOOT', error_identifiers := ['installing']) ORDER BY segment_index");
	ASSERT_EQ(result->RowCount(), 4u);
	EXPECT_EQ(result->GetValue(0, 0).ToString(), "BOOT");
	EXPECT_TRUE(result->GetValue(1, 1).GetValue<bool>());
	EXPECT_FALSE(result->GetValue(1, 2).GetValue<bool>());
}

TEST_F(BuildPhasesSqlTest, CustomConfig) {
	auto result = Query("SELECT phase, step_name FROM parse_build_phases('== build\nok\n== test\nok', "
	                    "'{\"rules\": [{\"label\": \"STAGE\", \"pattern\": \"^== (\\\\w+)\"}]}') "
	                    "ORDER BY segment_index");
	ASSERT_EQ(result->RowCount(), 3u);
	EXPECT_EQ(result->GetValue(0, 1).ToString(), "STAGE");
	EXPECT_EQ(result->GetValue(1, 1).ToString(), "build");
	EXPECT_EQ(result->GetValue(1, 2).ToString(), "test");
}

TEST_F(BuildPhasesSqlTest, ReadBuildPhasesFromFile) {
	std::string path = ::testing::TempDir() + "build_phases_pipeline.log";
	{
		std::ofstream out(path);
		out << PIPELINE_LOG;
	}
	auto result = Query("SELECT count(*), sum(line_count) FROM read_build_phases('" + path + "')");
	EXPECT_EQ(result->GetValue(0, 0).GetValue<int64_t>(), 4);
	EXPECT_EQ(result->GetValue(1, 0).GetValue<int64_t>(), 7);
	std::remove(path.c_str());
}

TEST_F(BuildPhasesSqlTest, FileAndContentAgreeOnCarriageReturns) {
	std::string log = "boot\rRunning step deploy-x\rprogress 50%\rerror: disk full\r\nRunning step workload_1\r\ndone";
	std::string path = ::testing::TempDir() + "build_phases_carriage_returns.log";
	{
		std::ofstream out(path, std::ios::binary);
		out << log;
	}
	const char *columns = "SELECT phase, step_name, start_line, line_count, body, potential_error FROM ";
	auto from_file = Query(std::string(columns) + "read_build_phases('" + path + "') ORDER BY segment_index");
	auto from_content = Query(std::string(columns) + "parse_build_phases('" + log + "') ORDER BY segment_index");
	std::remove(path.c_str());

	ASSERT_EQ(from_file->RowCount(), 3u);
	ASSERT_EQ(from_content->RowCount(), from_file->RowCount());
	for (idx_t row = 0; row < from_file->RowCount(); row++) {
		for (idx_t col = 0; col < from_file->ColumnCount(); col++) {
			EXPECT_EQ(from_file->GetValue(col, row).ToString(), from_content->GetValue(col, row).ToString())
			    << "row " << row << " column " << col;
		}
	}
	EXPECT_EQ(from_file->GetValue(0, 1).ToString(), "INSTALL");
	EXPECT_EQ(from_file->GetValue(2, 1).GetValue<int64_t>(), 1);
	EXPECT_EQ(from_file->GetValue(3, 1).GetValue<int64_t>(), 3);
	EXPECT_TRUE(from_file->GetValue(5, 1).GetValue<bool>());
}

TEST_F(BuildPhasesSqlTest, EmptyFileGivesOneEmptySegment) {
	std::string path = ::testing::TempDir() + "build_phases_empty_input.log";
	{
		std::ofstream out(path);
	}
	auto result = Query("SELECT phase, line_count, body FROM read_build_phases('" + path + "')");
	std::remove(path.c_str());
	ASSERT_EQ(result->RowCount(), 1u);
	EXPECT_EQ(result->GetValue(0, 0).ToString(), "CONFIG");
	EXPECT_EQ(result->GetValue(1, 0).GetValue<int64_t>(), 0);
	EXPECT_EQ(result->GetValue(2, 0).ToString(), "");
}

TEST_F(BuildPhasesSqlTest, MissingFileIsAnError) {
	auto result = con.Query("SELECT * FROM read_build_phases('/nonexistent/build_phases/missing.log')");
	EXPECT_TRUE(result->HasError());
}

TEST_F(BuildPhasesSqlTest, ErrorReportsForFlaggedSegments) {
	auto result = Query(std::string("SELECT phase_kind, step_name, is_known_workload, error_count, "
	                                "error_lines[1].line_number, error_lines[1].content "
	                                "FROM parse_build_phase_errors('") +
	                    PIPELINE_LOG + "')");
	ASSERT_EQ(result->RowCount(), 1u);
	EXPECT_EQ(result->GetValue(0, 0).ToString(), "workload");
	EXPECT_EQ(result->GetValue(1, 0).ToString(), "workload_1");
	EXPECT_TRUE(result->GetValue(2, 0).GetValue<bool>());
	EXPECT_EQ(result->GetValue(3, 0).GetValue<int64_t>(), 1);
	EXPECT_EQ(result->GetValue(4, 0).GetValue<int64_t>(), 3);
	EXPECT_EQ(result->GetValue(5, 0).ToString(), "error: pod crashed");
}

TEST_F(BuildPhasesSqlTest, ErrorReportsWithContext) {
	auto result = Query(std::string("SELECT len(error_lines), error_count FROM parse_build_phase_errors('") +
	                    PIPELINE_LOG + "', context_lines := 1)");
	ASSERT_EQ(result->RowCount(), 1u);
	EXPECT_EQ(result->GetValue(0, 0).GetValue<int64_t>(), 3);
	EXPECT_EQ(result->GetValue(1, 0).GetValue<int64_t>(), 1);
}

TEST_F(BuildPhasesSqlTest, RulesListing) {
	auto result = Query("SELECT rule_index, label FROM build_phases_rules() ORDER BY rule_index");
	ASSERT_EQ(result->RowCount(), 3u);
	EXPECT_EQ(result->GetValue(1, 0).ToString(), "INSTALL");
	EXPECT_EQ(result->GetValue(1, 1).ToString(), "WORKLOAD");
	EXPECT_EQ(result->GetValue(1, 2).ToString(), "ORION");

	auto custom = Query("SELECT label, case_sensitive FROM build_phases_rules("
	                    "'{\"case_sensitive\": true, \"steps\": {\"STEP\": \"step (.*)\"}}')");
	ASSERT_EQ(custom->RowCount(), 1u);
	EXPECT_EQ(custom->GetValue(0, 0).ToString(), "STEP");
	EXPECT_TRUE(custom->GetValue(1, 0).GetValue<bool>());
}

TEST_F(BuildPhasesSqlTest, InvalidConfigurationIsAnError) {
	auto bad_rule = con.Query("SELECT * FROM build_phases_rules('{\"steps\": {\"X\": \"no group\"}}')");
	EXPECT_TRUE(bad_rule->HasError());

	auto bad_json = con.Query("SELECT * FROM parse_build_phases('text', '{oops')");
	EXPECT_TRUE(bad_json->HasError());

	auto null_content = con.Query("SELECT * FROM parse_build_phases(NULL)");
	EXPECT_TRUE(null_content->HasError());
}

TEST_F(BuildPhasesSqlTest, HasErrorKeywordScalar) {
	auto result = Query("SELECT build_phases_has_error_keyword('Build FAILED'), "
	                    "build_phases_has_error_keyword('all good'), "
	                    "build_phases_has_error_keyword('pod crashed', ['crash']), "
	                    "build_phases_has_error_keyword(NULL)");
	EXPECT_TRUE(result->GetValue(0, 0).GetValue<bool>());
	EXPECT_FALSE(result->GetValue(1, 0).GetValue<bool>());
	EXPECT_TRUE(result->GetValue(2, 0).GetValue<bool>());
	EXPECT_TRUE(result->GetValue(3, 0).IsNull());
}

TEST_F(BuildPhasesSqlTest, ClearCache) {
	Query("SELECT * FROM build_phases_rules()");
	Query("SELECT * FROM build_phases_rules('{\"context_lines\": 2}')");
	auto cleared = Query("SELECT build_phases_clear_cache()");
	EXPECT_EQ(cleared->GetValue(0, 0).GetValue<int64_t>(), 2);
	auto again = Query("SELECT build_phases_clear_cache()");
	EXPECT_EQ(again->GetValue(0, 0).GetValue<int64_t>(), 0);
}
