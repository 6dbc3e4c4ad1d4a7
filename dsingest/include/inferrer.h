#ifndef DSINGEST_INFERRER_H
#define DSINGEST_INFERRER_H

#include <stddef.h>
#include <stdint.h>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "duckdb.hpp"

namespace dsingest {

enum class ColumnType : uint8_t {
	Integer,
	BigInteger,
	Double,
	Date,
	Timestamp,
	Boolean,
	String
};

// "integer", "big-integer", ...
const char* ColumnTypeName(ColumnType type);
// INTEGER, BIGINT, DOUBLE, DATE, TIMESTAMP, BOOLEAN, VARCHAR
const char* ColumnTypeSql(ColumnType type);
duckdb::LogicalType ToLogicalType(ColumnType type);
bool FromLogicalType(const duckdb::LogicalType& type, ColumnType& result);
// Accepts enumeration names and SQL names, case-insensitive
bool ParseColumnType(const std::string& name, ColumnType& result);
std::string ValidColumnTypeList();

// Spreadsheet cell carrying a date style, value is an Excel serial number
struct CellRawDate {
	double d;
	bool operator== (const CellRawDate& other) const { return other.d == d; }
};
typedef std::variant<std::string, int64_t, bool, double, CellRawDate> CellRaw;
typedef std::vector<CellRaw> RowRaw;

bool cell_empty(const CellRaw& cell);
std::string cell_to_string(const CellRaw& cell);

struct InferredColumn
{
	ColumnType type = ColumnType::String;
	std::string format; // strptime format for text dates
	std::vector<std::string> warnings;
};

// Full-scan type inference for one column: every non-empty value is fed in, the
// narrowest type that fits all of them wins.
class ColumnInferrer
{
public:
	explicit ColumnInferrer(bool month_first = true);
	ColumnInferrer(ColumnInferrer&&) noexcept;
	ColumnInferrer& operator = (ColumnInferrer&&) noexcept;
	~ColumnInferrer();

	void infer(const CellRaw& cell);
	InferredColumn result(const std::string& column_name) const;
	bool empty() const;

private:
	friend ColumnType ClassifyValue(const std::string& value, bool month_first);
	struct Candidates;
	std::unique_ptr<Candidates> d;
};

// Type a single text value would get on its own
ColumnType ClassifyValue(const std::string& value, bool month_first = true);

// Converts a raw cell to the column type. Empty cells become NULL. Returns false if
// the value cannot be represented without loss.
bool ConvertCell(const CellRaw& cell, const InferredColumn& column, duckdb::Value& result);

struct ParsedDate
{
	duckdb::Value value; // DATE or TIMESTAMP when parsed, the original text otherwise
	std::string warning;
};

// Parses one date value: five-digit numbers are Excel serials, otherwise the month-first
// reading wins and an ambiguity warning names both readings.
ParsedDate ParseDateWithWarnings(const std::string& text, bool month_first = true);

}

#endif
