#include <catch2/catch.hpp>

#include <string>
#include <vector>

#include "inferrer.h"

using namespace dsingest;

static InferredColumn InferStrings(const std::vector<std::string> &values, bool month_first = true) {
	ColumnInferrer inferrer(month_first);
	for (auto &v : values) {
		inferrer.infer(CellRaw(v));
	}
	return inferrer.result("col");
}

TEST_CASE("Infer numeric columns", "[inferrer]") {
	REQUIRE(InferStrings({"1", "22", "-333"}).type == ColumnType::Integer);
	REQUIRE(InferStrings({"1", "3000000000"}).type == ColumnType::BigInteger);
	REQUIRE(InferStrings({"1", "2.5", "1e3"}).type == ColumnType::Double);
	// leading zeros are identifiers, not numbers
	REQUIRE(InferStrings({"007", "008"}).type == ColumnType::String);
	// more digits than a double holds
	REQUIRE(InferStrings({"1.2345678901234567"}).type == ColumnType::String);
}

TEST_CASE("Infer boolean columns", "[inferrer]") {
	REQUIRE(InferStrings({"true", "False", "YES", "no"}).type == ColumnType::Boolean);
	REQUIRE(InferStrings({"true", "maybe"}).type == ColumnType::String);
}

TEST_CASE("Mixed text and numbers infer as string with a warning", "[inferrer]") {
	auto col = InferStrings({"123", "ABC", "456"});
	REQUIRE(col.type == ColumnType::String);
	REQUIRE(col.warnings.size() == 1);
	REQUIRE(col.warnings[0].find("mixes text") != std::string::npos);

	auto text = InferStrings({"Alice", "Bob"});
	REQUIRE(text.type == ColumnType::String);
	REQUIRE(text.warnings.empty());
}

TEST_CASE("Empty cells are ignored by inference", "[inferrer]") {
	ColumnInferrer inferrer;
	inferrer.infer(CellRaw(std::string()));
	REQUIRE(inferrer.empty());
	REQUIRE(inferrer.result("c").type == ColumnType::String);

	inferrer.infer(CellRaw(std::string("42")));
	inferrer.infer(CellRaw(std::string()));
	REQUIRE_FALSE(inferrer.empty());
	REQUIRE(inferrer.result("c").type == ColumnType::Integer);
}

TEST_CASE("Infer dates and timestamps", "[inferrer]") {
	auto iso = InferStrings({"2024-01-15", "2024-12-31"});
	REQUIRE(iso.type == ColumnType::Date);
	REQUIRE(iso.format == "%Y-%m-%d");
	REQUIRE(iso.warnings.empty());

	auto ts = InferStrings({"2024-01-15 10:30:00", "2024-01-16 23:59:59"});
	REQUIRE(ts.type == ColumnType::Timestamp);

	auto named = InferStrings({"Jan 5, 2024", "Feb 14, 2024"});
	REQUIRE(named.type == ColumnType::Date);

	// time of day alone is not a date
	REQUIRE(InferStrings({"10:30", "11:45"}).type == ColumnType::String);
}

TEST_CASE("Ambiguous day and month order prefers US with a warning", "[inferrer]") {
	auto col = InferStrings({"01/02/2024", "03/04/2024"});
	REQUIRE(col.type == ColumnType::Date);
	REQUIRE(col.format == "%m/%d/%Y");
	REQUIRE(col.warnings.size() == 1);
	REQUIRE(col.warnings[0].find("ambiguous dates") != std::string::npos);

	auto eu = InferStrings({"01/02/2024", "03/04/2024"}, false);
	REQUIRE(eu.format == "%d/%m/%Y");

	// a day above 12 settles the order
	auto settled = InferStrings({"01/02/2024", "13/04/2024"});
	REQUIRE(settled.format == "%d/%m/%Y");
	REQUIRE(settled.warnings.empty());
}

TEST_CASE("Spreadsheet typed cells", "[inferrer]") {
	ColumnInferrer dates;
	dates.infer(CellRaw(CellRawDate {45306.0}));
	dates.infer(CellRaw(CellRawDate {45307.0}));
	REQUIRE(dates.result("d").type == ColumnType::Date);

	ColumnInferrer numbers;
	numbers.infer(CellRaw(int64_t(5)));
	numbers.infer(CellRaw(2.5));
	REQUIRE(numbers.result("n").type == ColumnType::Double);

	ColumnInferrer flags;
	flags.infer(CellRaw(true));
	flags.infer(CellRaw(std::string("false")));
	REQUIRE(flags.result("b").type == ColumnType::Boolean);
}

TEST_CASE("Classify single values", "[inferrer]") {
	REQUIRE(ClassifyValue("123") == ColumnType::Integer);
	REQUIRE(ClassifyValue("12.5") == ColumnType::Double);
	REQUIRE(ClassifyValue("yes") == ColumnType::Boolean);
	REQUIRE(ClassifyValue("2024-03-01") == ColumnType::Date);
	REQUIRE(ClassifyValue("hello") == ColumnType::String);
	REQUIRE(ClassifyValue("") == ColumnType::String);
}

TEST_CASE("Convert cells to column types", "[inferrer]") {
	duckdb::Value v;
	InferredColumn integer;
	integer.type = ColumnType::Integer;
	REQUIRE(ConvertCell(CellRaw(std::string("42")), integer, v));
	REQUIRE(v == duckdb::Value::INTEGER(42));
	REQUIRE(ConvertCell(CellRaw(std::string()), integer, v));
	REQUIRE(v.IsNull());
	REQUIRE_FALSE(ConvertCell(CellRaw(std::string("3000000000")), integer, v));
	REQUIRE_FALSE(ConvertCell(CellRaw(2.5), integer, v));

	InferredColumn date;
	date.type = ColumnType::Date;
	date.format = "%Y-%m-%d";
	REQUIRE(ConvertCell(CellRaw(std::string("2024-01-15")), date, v));
	REQUIRE(v.ToString() == "2024-01-15");
	REQUIRE(ConvertCell(CellRaw(CellRawDate {45306.0}), date, v));
	REQUIRE(v.ToString() == "2024-01-15");

	InferredColumn text;
	REQUIRE(ConvertCell(CellRaw(int64_t(7)), text, v));
	REQUIRE(v == duckdb::Value("7"));
}

TEST_CASE("Parse single dates with warnings", "[inferrer]") {
	auto serial = ParseDateWithWarnings("45306");
	REQUIRE(serial.value.ToString() == "2024-01-15");
	REQUIRE(serial.warning.empty());

	auto ambiguous = ParseDateWithWarnings("01/02/2024");
	REQUIRE(ambiguous.value.ToString() == "2024-01-02");
	REQUIRE(ambiguous.warning == "Date '01/02/2024' could be 2024-01-02 (US) or 2024-02-01 (EU). Using US format.");

	auto iso = ParseDateWithWarnings("2024-02-01");
	REQUIRE(iso.value.ToString() == "2024-02-01");
	REQUIRE(iso.warning.empty());

	auto bad = ParseDateWithWarnings("not a date");
	REQUIRE(bad.value == duckdb::Value("not a date"));
	REQUIRE(bad.warning.find("Could not parse date") != std::string::npos);
}

TEST_CASE("Column type names", "[inferrer]") {
	ColumnType type;
	REQUIRE(ParseColumnType("string", type));
	REQUIRE(type == ColumnType::String);
	REQUIRE(ParseColumnType("VARCHAR", type));
	REQUIRE(type == ColumnType::String);
	REQUIRE(ParseColumnType(" BigInt ", type));
	REQUIRE(type == ColumnType::BigInteger);
	REQUIRE(ParseColumnType("datetime", type));
	REQUIRE(type == ColumnType::Timestamp);
	REQUIRE_FALSE(ParseColumnType("blob", type));
	REQUIRE(std::string(ColumnTypeSql(ColumnType::Double)) == "DOUBLE");
	REQUIRE(std::string(ColumnTypeName(ColumnType::BigInteger)) == "big-integer");
}
