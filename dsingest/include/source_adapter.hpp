#ifndef DSINGEST_SOURCE_ADAPTER_HPP
#define DSINGEST_SOURCE_ADAPTER_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "duckdb.hpp"
#include "inferrer.h"

namespace dsingest {

//! Hidden column preserving source order in every imported table
extern const char *const SOURCE_ROW_COLUMN;

struct ColumnInfo {
	std::string name;
	ColumnType type = ColumnType::String;
	bool nullable = true;
	std::vector<std::string> warnings;
};

struct ImportResult {
	std::string source_type;
	int64_t row_count = 0;
	std::vector<ColumnInfo> columns;
	std::vector<std::string> warnings;
};

struct SourceMetadata {
	std::string source_type;
	int64_t row_count = 0;
	int64_t column_count = 0;
};

//! Reads one external source into a table of the local store. Source-specific parameters
//! are carried by the concrete adapter.
class SourceAdapter {
public:
	virtual ~SourceAdapter() = default;

	//! "delimited-file", "spreadsheet" or "remote-database"
	virtual std::string source_type() const = 0;
	//! Provenance shown to users, never contains credentials
	virtual std::string label() const = 0;
	//! Creates `table` (which must not exist) and fills it from the source
	virtual ImportResult import_data(duckdb::Connection &con, const std::string &table) = 0;
	virtual SourceMetadata get_metadata(duckdb::Connection &con, const std::string &table);

	//! Second pass removing rows whose user columns are all NULL, returns the number removed
	static int64_t DropEmptyRows(duckdb::Connection &con, const std::string &table);
	//! User columns of `table` in order, with nullability taken from the data
	static std::vector<ColumnInfo> DescribeColumns(duckdb::Connection &con, const std::string &table);
	static int64_t CountRows(duckdb::Connection &con, const std::string &table);
};

std::string QuoteIdentifier(const std::string &name);
std::string QuoteLiteral(const std::string &text);

//! Runs `sql`, a failing statement raises StoreException
duckdb::unique_ptr<duckdb::MaterializedQueryResult> RunQuery(duckdb::Connection &con, const std::string &sql);

} // namespace dsingest

#endif
