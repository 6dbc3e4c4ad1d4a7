#include "ingest_test_helpers.hpp"

#include "csv_source.h"
#include "exception.hpp"
#include "query_service.hpp"
#include "session.hpp"
#include "table_loader.hpp"

using namespace dsingest;
using namespace dsingest_test;

static bool HasWarning(const ImportResult &result, const std::string &text) {
	for (auto &warning : result.warnings) {
		if (warning.find(text) != std::string::npos) {
			return true;
		}
	}
	return false;
}

TEST_CASE("Delimiter validation", "[csv]") {
	REQUIRE(ParseDelimiter(",") == ',');
	REQUIRE(ParseDelimiter(";") == ';');
	REQUIRE(ParseDelimiter("|") == '|');
	REQUIRE(ParseDelimiter("\t") == '\t');
	REQUIRE(ParseDelimiter("\\t") == '\t');
	REQUIRE(ParseDelimiter("TAB") == '\t');
	REQUIRE_THROWS_AS(ParseDelimiter(""), ValidationException);
	REQUIRE_THROWS_AS(ParseDelimiter(",,"), ValidationException);
	REQUIRE_THROWS_AS(ParseDelimiter("\""), ValidationException);
	REQUIRE_THROWS_AS(ParseDelimiter("\n"), ValidationException);
}

TEST_CASE("Header normalization", "[csv]") {
	auto names = TableLoader::NormalizeHeaders({" id ", "", "Name", "name", "name", "_source_row_num"}, 7);
	REQUIRE(names == std::vector<std::string> {"id", "column_2", "Name", "name_1", "name_2", "_source_row_num_1",
	                                           "column_7"});
}

TEST_CASE("Empty rows are filtered on import", "[csv]") {
	TempDir dir;
	IngestSession session;
	auto result = session.ImportDelimited(WriteFile(dir, "orders.csv", "name,city,state\nAlice,LA,CA\n,,\n"));
	REQUIRE(result.source_type == "delimited-file");
	REQUIRE(result.row_count == 1);
	REQUIRE(result.columns.size() == 3);
	REQUIRE(HasWarning(result, "Skipped 1 empty rows"));
	REQUIRE(session.Source().row_count == 1);

	auto count = session.GetConnection().Query("SELECT COUNT(*) FROM imported_data WHERE name IS NULL");
	REQUIRE_NO_FAIL(count);
	REQUIRE(count->GetValue(0, 0).GetValue<int64_t>() == 0);
}

TEST_CASE("Blank lines are not rows", "[csv]") {
	TempDir dir;
	IngestSession session;
	auto result = session.ImportDelimited(WriteFile(dir, "people.csv", "name,city,state\nAlice,LA,CA\n\n"));
	REQUIRE(result.row_count == 1);
	REQUIRE(result.columns.size() == 3);
	REQUIRE(session.Source().row_count == 1);

	auto row = QueryService(session).GetRow(1);
	REQUIRE(row.values[0].second == duckdb::Value("Alice"));
	REQUIRE(row.checksum.size() == 64);
	REQUIRE(row.checksum.find_first_not_of("0123456789abcdef") == std::string::npos);
	REQUIRE_THROWS_AS(QueryService(session).GetRow(2), NotFoundException);
}

TEST_CASE("Column types are inferred over the whole file", "[csv]") {
	TempDir dir;
	IngestSession session;
	std::string content = "id,amount,flag,day,zip,code\n";
	for (int i = 1; i <= 2000; ++i) {
		content += std::to_string(i) + "," + std::to_string(i) + ".5,true,2024-01-15,02134," + std::to_string(i) + "\n";
	}
	// text far beyond any sampling window
	content += "2001,1,false,2024-02-01,02135,ABC\n";
	auto result = session.ImportDelimited(WriteFile(dir, "typed.csv", content));

	REQUIRE(result.row_count == 2001);
	REQUIRE(result.columns.size() == 6);
	REQUIRE(result.columns[0].type == ColumnType::Integer);
	REQUIRE(result.columns[1].type == ColumnType::Double);
	REQUIRE(result.columns[2].type == ColumnType::Boolean);
	REQUIRE(result.columns[3].type == ColumnType::Date);
	REQUIRE(result.columns[4].type == ColumnType::String);
	REQUIRE(result.columns[5].type == ColumnType::String);
	REQUIRE_FALSE(result.columns[5].warnings.empty());
	REQUIRE_FALSE(result.columns[0].nullable);

	auto zip = session.GetConnection().Query("SELECT zip FROM imported_data ORDER BY _source_row_num LIMIT 1");
	REQUIRE_NO_FAIL(zip);
	REQUIRE(zip->GetValue(0, 0).ToString() == "02134");
}

TEST_CASE("Null strings and ragged rows", "[csv]") {
	TempDir dir;
	IngestSession session;
	auto result = session.ImportDelimited(WriteFile(dir, "ragged.csv", "a,b\n1,NULL\n2\nnull,null\n3,x\n"));
	REQUIRE(result.row_count == 3);
	REQUIRE(result.columns.size() == 2);
	REQUIRE(result.columns[0].type == ColumnType::Integer);
	REQUIRE(HasWarning(result, "Skipped 1 empty rows"));

	auto nulls = session.GetConnection().Query("SELECT COUNT(*) FROM imported_data WHERE b IS NULL");
	REQUIRE_NO_FAIL(nulls);
	REQUIRE(nulls->GetValue(0, 0).GetValue<int64_t>() == 2);
}

TEST_CASE("Tab separated files and files without header", "[csv]") {
	TempDir dir;
	IngestSession session;

	DelimitedOptions tabs;
	tabs.delimiter = "\\t";
	auto result = session.ImportDelimited(WriteFile(dir, "data.tsv", "x\ty\n1\thello, world\n"), tabs);
	REQUIRE(result.row_count == 1);
	REQUIRE(result.columns[1].name == "y");
	auto value = session.GetConnection().Query("SELECT y FROM imported_data");
	REQUIRE(value->GetValue(0, 0).ToString() == "hello, world");

	DelimitedOptions headless;
	headless.header = false;
	result = session.ImportDelimited(WriteFile(dir, "plain.csv", "1,a\n2,b\n"), headless);
	REQUIRE(result.row_count == 2);
	REQUIRE(result.columns[0].name == "column_1");
	REQUIRE(result.columns[1].name == "column_2");
}

TEST_CASE("Quoted fields keep delimiters and line breaks", "[csv]") {
	TempDir dir;
	IngestSession session;
	auto result =
	    session.ImportDelimited(WriteFile(dir, "quoted.csv", "name,note\n\"Smith, J\",\"line one\nline two\"\n"));
	REQUIRE(result.row_count == 1);
	auto value = session.GetConnection().Query("SELECT name, note FROM imported_data");
	REQUIRE_NO_FAIL(value);
	REQUIRE(value->GetValue(0, 0).ToString() == "Smith, J");
	REQUIRE(value->GetValue(1, 0).ToString() == "line one\nline two");
}

TEST_CASE("UTF-16 files are converted to UTF-8", "[csv]") {
	TempDir dir;
	std::string text = "city\nK\xC3\xB6ln\n";
	std::string utf16 = "\xFF\xFE";
	// widen to UTF-16LE, U+00F6 is the only non-ASCII character
	for (size_t i = 0; i < text.size(); ++i) {
		if (text[i] == '\xC3') {
			utf16 += '\xF6';
			utf16 += '\0';
			++i;
			continue;
		}
		utf16 += text[i];
		utf16 += '\0';
	}
	auto path = WriteFile(dir, "cities.csv", utf16);
	REQUIRE(DelimitedFileAdapter::detect_charset(path) == "UTF-16LE");

	IngestSession session;
	auto result = session.ImportDelimited(path);
	REQUIRE(result.row_count == 1);
	REQUIRE(HasWarning(result, "converted to UTF-8"));
	auto value = session.GetConnection().Query("SELECT city FROM imported_data");
	REQUIRE_NO_FAIL(value);
	REQUIRE(value->GetValue(0, 0).ToString() == "K\xC3\xB6ln");
}

TEST_CASE("Missing and empty files", "[csv]") {
	TempDir dir;
	IngestSession session;
	REQUIRE_THROWS_AS(session.ImportDelimited(dir.Path("absent.csv")), NotFoundException);
	REQUIRE_FALSE(session.HasSource());

	auto result = session.ImportDelimited(WriteFile(dir, "empty.csv", ""));
	REQUIRE(result.row_count == 0);
	REQUIRE(result.columns.empty());
	REQUIRE(HasWarning(result, "File is empty"));

	DelimitedOptions bad;
	bad.delimiter = "ab";
	REQUIRE_THROWS_AS(session.ImportDelimited(WriteFile(dir, "x.csv", "a\n1\n"), bad), ValidationException);
}

TEST_CASE("Plain text files need no conversion", "[csv]") {
	TempDir dir;
	auto charset = DelimitedFileAdapter::detect_charset(WriteFile(dir, "ascii.csv", "a,b\n1,2\n"));
	REQUIRE((charset == "ASCII" || charset == "UTF-8"));
	REQUIRE(DelimitedFileAdapter::detect_charset(WriteFile(dir, "empty.csv", "")) == "ASCII");
}
