#include "source_adapter.hpp"

#include "duckdb/parser/keyword_helper.hpp"
#include "exception.hpp"
#include "logging.hpp"

namespace dsingest {

const char *const SOURCE_ROW_COLUMN = "_source_row_num";

std::string QuoteIdentifier(const std::string &name) {
	return duckdb::KeywordHelper::WriteQuoted(name, '"');
}

std::string QuoteLiteral(const std::string &text) {
	return duckdb::KeywordHelper::WriteQuoted(text, '\'');
}

duckdb::unique_ptr<duckdb::MaterializedQueryResult> RunQuery(duckdb::Connection &con, const std::string &sql) {
	auto result = con.Query(sql);
	if (result->HasError()) {
		Log()->debug("store statement failed: {}", result->GetError());
		throw StoreException(result->GetError());
	}
	return result;
}

SourceMetadata SourceAdapter::get_metadata(duckdb::Connection &con, const std::string &table) {
	SourceMetadata meta;
	meta.source_type = source_type();
	meta.row_count = CountRows(con, table);
	meta.column_count = (int64_t)DescribeColumns(con, table).size();
	return meta;
}

int64_t SourceAdapter::CountRows(duckdb::Connection &con, const std::string &table) {
	auto result = RunQuery(con, "SELECT COUNT(*) FROM " + QuoteIdentifier(table));
	return result->GetValue(0, 0).GetValue<int64_t>();
}

std::vector<ColumnInfo> SourceAdapter::DescribeColumns(duckdb::Connection &con, const std::string &table) {
	std::vector<ColumnInfo> columns;
	std::vector<duckdb::LogicalType> types;
	auto describe = RunQuery(con, "SELECT * FROM " + QuoteIdentifier(table) + " LIMIT 0");
	for (duckdb::idx_t i = 0; i < describe->ColumnCount(); ++i) {
		if (describe->names[i] == SOURCE_ROW_COLUMN) {
			continue;
		}
		ColumnInfo info;
		info.name = describe->names[i];
		if (!FromLogicalType(describe->types[i], info.type)) {
			info.type = ColumnType::String;
		}
		columns.push_back(std::move(info));
	}
	if (columns.empty()) {
		return columns;
	}

	std::string sql = "SELECT ";
	for (size_t i = 0; i < columns.size(); ++i) {
		if (i > 0) {
			sql += ", ";
		}
		sql += "COUNT(*) - COUNT(" + QuoteIdentifier(columns[i].name) + ")";
	}
	sql += " FROM " + QuoteIdentifier(table);
	auto nulls = RunQuery(con, sql);
	for (size_t i = 0; i < columns.size(); ++i) {
		columns[i].nullable = nulls->GetValue(i, 0).GetValue<int64_t>() > 0;
	}
	return columns;
}

int64_t SourceAdapter::DropEmptyRows(duckdb::Connection &con, const std::string &table) {
	auto columns = DescribeColumns(con, table);
	if (columns.empty()) {
		return 0;
	}
	std::string sql = "DELETE FROM " + QuoteIdentifier(table) + " WHERE ";
	for (size_t i = 0; i < columns.size(); ++i) {
		if (i > 0) {
			sql += " AND ";
		}
		sql += QuoteIdentifier(columns[i].name) + " IS NULL";
	}
	auto result = RunQuery(con, sql);
	return result->GetValue(0, 0).GetValue<int64_t>();
}

} // namespace dsingest
