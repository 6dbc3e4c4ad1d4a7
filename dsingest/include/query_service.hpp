#ifndef DSINGEST_QUERY_SERVICE_HPP
#define DSINGEST_QUERY_SERVICE_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "checksum.hpp"
#include "duckdb.hpp"

namespace dsingest {

class IngestSession;

struct RowResult {
	//! 1-based position in the source order
	int64_t row_number = 0;
	//! values with overrides applied
	RowData values;
	//! checksum of the stored values
	std::string checksum;
};

struct FilterResult {
	std::vector<RowResult> rows;
	int64_t total_count = 0;
	int64_t limit = 0;
	int64_t offset = 0;
};

struct QueryResultSet {
	std::vector<std::string> columns;
	std::vector<std::vector<duckdb::Value>> rows;
	bool truncated = false;
};

//! Read access to the imported data with type overrides applied
class QueryService {
public:
	explicit QueryService(IngestSession &session) : session(session) {
	}

	RowResult GetRow(int64_t row_number);
	//! `predicate` is a boolean SQL expression over the columns. A limit below 1 selects the
	//! default page size, larger limits are capped.
	FilterResult GetRowsByFilter(const std::string &predicate, int64_t limit = 0, int64_t offset = 0);
	//! Runs one read-only SELECT inside a transaction that is always rolled back
	QueryResultSet QueryData(const std::string &sql);

private:
	//! Select list over imported_data; with `stored` the raw values of overridden columns
	//! follow as hidden columns
	std::string Projection(bool stored) const;
	std::vector<RowResult> ReadRows(duckdb::MaterializedQueryResult &result, int64_t first_row, bool has_ordinal);

	IngestSession &session;
};

} // namespace dsingest

#endif
