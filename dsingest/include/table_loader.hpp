#ifndef DSINGEST_TABLE_LOADER_HPP
#define DSINGEST_TABLE_LOADER_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "config.hpp"
#include "duckdb.hpp"
#include "inferrer.h"
#include "source_adapter.hpp"

namespace dsingest {

//! Collects raw rows of a file source, infers column types over all of them and writes a
//! typed table. Rows without any value are never written.
class TableLoader {
public:
	explicit TableLoader(const IngestConfig &config);

	//! Header cells of the source, normalized on load
	void SetHeader(const RowRaw &header);
	//! `source_row` is the 1-based row number in the source
	void AddRow(RowRaw row, int64_t source_row);

	int64_t SkippedRows() const {
		return skipped_rows;
	}
	bool HasRows() const {
		return !rows.empty();
	}

	ImportResult Load(duckdb::Connection &con, const std::string &table, const std::string &source_type);

	//! Trims names, replaces blanks with column_N and suffixes duplicates with _1, _2, ...
	static std::vector<std::string> NormalizeHeaders(const std::vector<std::string> &names, size_t width);

private:
	bool IsNullText(const std::string &text) const;

	const IngestConfig &config;
	std::vector<std::string> header;
	std::vector<RowRaw> rows;
	std::vector<int64_t> source_rows;
	int64_t skipped_rows = 0;
};

} // namespace dsingest

#endif
