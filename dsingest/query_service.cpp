#include "query_service.hpp"

#include <algorithm>

#include <boost/algorithm/string/join.hpp>

#include "duckdb/common/error_data.hpp"
#include "exception.hpp"
#include "logging.hpp"
#include "query_guard.hpp"
#include "schema_service.hpp"
#include "session.hpp"

namespace dsingest {

namespace {

const char *const ORDINAL_COLUMN = "_dsingest_ordinal";
const char *const STORED_PREFIX = "_dsingest_stored_";

//! Rolls the open transaction back when leaving scope
class TransactionRollback {
public:
	explicit TransactionRollback(duckdb::Connection &con) : con(con) {
	}
	~TransactionRollback() {
		try {
			auto result = con.Query("ROLLBACK");
			if (result->HasError()) {
				Log()->error("rollback failed: {}", result->GetError());
			}
		} catch (std::exception &ex) {
			Log()->error("rollback failed: {}", ex.what());
		}
	}
	TransactionRollback(const TransactionRollback &) = delete;
	TransactionRollback &operator=(const TransactionRollback &) = delete;

private:
	duckdb::Connection &con;
};

std::string ColumnList(const IngestSession &session) {
	std::vector<std::string> names;
	for (auto &column : session.Columns()) {
		names.push_back(column.name);
	}
	return "Available columns: " + boost::algorithm::join(names, ", ");
}

} // namespace

std::string QueryService::Projection(bool stored) const {
	std::string select;
	std::string hidden;
	auto &overrides = session.Overrides();
	auto &columns = session.Columns();
	for (size_t i = 0; i < columns.size(); ++i) {
		auto &column = columns[i];
		if (!select.empty()) {
			select += ", ";
		}
		auto it = overrides.find(column.name);
		if (it == overrides.end()) {
			select += QuoteIdentifier(column.name);
			continue;
		}
		select += OverrideExpression(column.name, column.type, it->second) + " AS " + QuoteIdentifier(column.name);
		if (stored) {
			hidden += ", " + QuoteIdentifier(column.name) + " AS " + QuoteIdentifier(STORED_PREFIX + std::to_string(i));
		}
	}
	return select + hidden;
}

std::vector<RowResult> QueryService::ReadRows(duckdb::MaterializedQueryResult &result, int64_t first_row,
                                              bool has_ordinal) {
	auto &overrides = session.Overrides();
	auto &columns = session.Columns();
	duckdb::idx_t base = has_ordinal ? 1 : 0;
	std::vector<RowResult> rows;
	rows.reserve(result.RowCount());
	for (duckdb::idx_t r = 0; r < result.RowCount(); ++r) {
		RowResult row;
		row.row_number = has_ordinal ? result.GetValue(0, r).GetValue<int64_t>() : first_row + (int64_t)r;
		RowData stored;
		duckdb::idx_t hidden = base + columns.size();
		for (size_t i = 0; i < columns.size(); ++i) {
			auto value = result.GetValue(base + i, r);
			row.values.emplace_back(columns[i].name, value);
			if (overrides.find(columns[i].name) != overrides.end()) {
				stored.emplace_back(columns[i].name, result.GetValue(hidden++, r));
			} else {
				stored.emplace_back(columns[i].name, std::move(value));
			}
		}
		row.checksum = ComputeRowChecksum(stored);
		rows.push_back(std::move(row));
	}
	return rows;
}

RowResult QueryService::GetRow(int64_t row_number) {
	std::lock_guard<std::recursive_mutex> guard(session.Mutex());
	int64_t total = session.Source().row_count;
	if (row_number < 1 || row_number > total) {
		throw NotFoundException("Row " + std::to_string(row_number) + " not found",
		                        total == 0 ? std::string("The data source has no rows")
		                                   : "Valid rows are 1 to " + std::to_string(total));
	}
	auto result = RunQuery(session.GetConnection(), "SELECT " + Projection(true) + " FROM " +
	                                                    QuoteIdentifier(IngestSession::TABLE_NAME) + " ORDER BY " +
	                                                    QuoteIdentifier(SOURCE_ROW_COLUMN) + " LIMIT 1 OFFSET " +
	                                                    std::to_string(row_number - 1));
	auto rows = ReadRows(*result, row_number, false);
	if (rows.empty()) {
		throw NotFoundException("Row " + std::to_string(row_number) + " not found");
	}
	return std::move(rows.front());
}

FilterResult QueryService::GetRowsByFilter(const std::string &predicate, int64_t limit, int64_t offset) {
	CheckFilterPredicate(predicate);
	std::lock_guard<std::recursive_mutex> guard(session.Mutex());
	session.Source();
	auto &config = session.Config();

	FilterResult res;
	res.limit = limit < 1 ? config.default_page_size : std::min(limit, config.max_page_size);
	res.offset = std::max<int64_t>(offset, 0);
	if (session.Columns().empty()) {
		return res;
	}

	auto &con = session.GetConnection();
	std::string filtered = "(SELECT row_number() OVER (ORDER BY " + QuoteIdentifier(SOURCE_ROW_COLUMN) + ") AS " +
	                       QuoteIdentifier(ORDINAL_COLUMN) + ", " + Projection(true) + " FROM " +
	                       QuoteIdentifier(IngestSession::TABLE_NAME) + ") AS filtered WHERE (" + predicate + ")";
	auto count = con.Query("SELECT COUNT(*) FROM " + filtered);
	if (count->HasError()) {
		throw ValidationException("Filter failed: " + count->GetError(), ColumnList(session));
	}
	res.total_count = count->GetValue(0, 0).GetValue<int64_t>();

	auto result = con.Query("SELECT * FROM " + filtered + " ORDER BY " + QuoteIdentifier(ORDINAL_COLUMN) + " LIMIT " +
	                        std::to_string(res.limit) + " OFFSET " + std::to_string(res.offset));
	if (result->HasError()) {
		throw ValidationException("Filter failed: " + result->GetError(), ColumnList(session));
	}
	res.rows = ReadRows(*result, 0, true);
	Log()->debug("filter matched {} rows, returned {}", res.total_count, res.rows.size());
	return res;
}

QueryResultSet QueryService::QueryData(const std::string &sql) {
	CheckImportedDataQuery(sql);
	std::lock_guard<std::recursive_mutex> guard(session.Mutex());
	session.Source();
	auto &con = session.GetConnection();
	const std::string hint = "Query the table imported_data. " + ColumnList(session);

	RunQuery(con, "BEGIN TRANSACTION");
	TransactionRollback rollback(con);
	if (!session.Columns().empty()) {
		// shadow the stored table with its override-applied view for this transaction only
		auto database = RunQuery(con, "SELECT current_database()")->GetValue(0, 0).ToString();
		RunQuery(con, "CREATE TEMP VIEW " + QuoteIdentifier(IngestSession::TABLE_NAME) + " AS SELECT " +
		                  Projection(false) + " FROM " + QuoteIdentifier(database) + ".main." +
		                  QuoteIdentifier(IngestSession::TABLE_NAME));
	}

	auto result = con.SendQuery(sql);
	if (result->HasError()) {
		throw ValidationException("Query failed: " + result->GetError(), hint);
	}
	QueryResultSet set;
	set.columns = result->names;
	auto max_rows = (size_t)std::max<int64_t>(session.Config().max_query_rows, 0);
	try {
		while (!set.truncated) {
			auto chunk = result->Fetch();
			if (!chunk) {
				break;
			}
			for (duckdb::idx_t r = 0; r < chunk->size(); ++r) {
				if (set.rows.size() >= max_rows) {
					set.truncated = true;
					break;
				}
				std::vector<duckdb::Value> row;
				row.reserve(chunk->ColumnCount());
				for (duckdb::idx_t c = 0; c < chunk->ColumnCount(); ++c) {
					row.push_back(chunk->GetValue(c, r));
				}
				set.rows.push_back(std::move(row));
			}
		}
	} catch (std::exception &ex) {
		throw ValidationException("Query failed: " + duckdb::ErrorData(ex).Message(), hint);
	}
	if (!set.truncated && result->HasError()) {
		throw ValidationException("Query failed: " + result->GetError(), hint);
	}
	if (set.truncated) {
		Log()->info("query result truncated to {} rows", max_rows);
	}
	return set;
}

} // namespace dsingest
