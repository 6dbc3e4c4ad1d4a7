#include "table_loader.hpp"

#include <algorithm>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/unordered_set.hpp>

#include "duckdb/common/error_data.hpp"
#include "exception.hpp"
#include "logging.hpp"

namespace dsingest {

TableLoader::TableLoader(const IngestConfig &config) : config(config) {
}

bool TableLoader::IsNullText(const std::string &text) const {
	std::string value = boost::algorithm::trim_copy(text);
	if (value.empty()) {
		return true;
	}
	return std::find(config.null_strings.begin(), config.null_strings.end(), value) != config.null_strings.end();
}

void TableLoader::SetHeader(const RowRaw &cells) {
	header.clear();
	for (auto &cell : cells) {
		header.push_back(cell_to_string(cell));
	}
}

void TableLoader::AddRow(RowRaw row, int64_t source_row) {
	bool any_value = false;
	for (auto &cell : row) {
		auto text = std::get_if<std::string>(&cell);
		if (text && IsNullText(*text)) {
			cell = std::string();
		}
		any_value = any_value || !cell_empty(cell);
	}
	if (!any_value) {
		++skipped_rows;
		return;
	}
	rows.push_back(std::move(row));
	source_rows.push_back(source_row);
}

std::vector<std::string> TableLoader::NormalizeHeaders(const std::vector<std::string> &names, size_t width) {
	std::vector<std::string> result;
	boost::unordered_set<std::string> seen;
	// identifiers are case-insensitive in the store
	seen.insert(SOURCE_ROW_COLUMN);
	for (size_t i = 0; i < width; ++i) {
		std::string base = i < names.size() ? boost::algorithm::trim_copy(names[i]) : std::string();
		if (base.empty()) {
			base = "column_" + std::to_string(i + 1);
		}
		std::string name = base;
		for (int suffix = 1; seen.count(boost::algorithm::to_lower_copy(name)); ++suffix) {
			name = base + "_" + std::to_string(suffix);
		}
		seen.insert(boost::algorithm::to_lower_copy(name));
		result.push_back(std::move(name));
	}
	return result;
}

ImportResult TableLoader::Load(duckdb::Connection &con, const std::string &table, const std::string &source_type) {
	size_t width = header.size();
	for (auto &row : rows) {
		width = std::max(width, row.size());
	}
	std::vector<std::string> names = NormalizeHeaders(header, width);

	std::vector<ColumnInferrer> inferrers;
	for (size_t i = 0; i < width; ++i) {
		inferrers.emplace_back(config.month_first);
	}
	for (auto &row : rows) {
		for (size_t i = 0; i < row.size(); ++i) {
			inferrers[i].infer(row[i]);
		}
	}

	ImportResult result;
	result.source_type = source_type;
	std::vector<InferredColumn> columns;
	for (size_t i = 0; i < width; ++i) {
		columns.push_back(inferrers[i].result(names[i]));
	}

	// a value the inferred type cannot hold sends the column back to text
	duckdb::Value value;
	for (size_t i = 0; i < width; ++i) {
		InferredColumn &column = columns[i];
		if (column.type == ColumnType::String) {
			continue;
		}
		for (auto &row : rows) {
			if (i < row.size() && !ConvertCell(row[i], column, value)) {
				column.warnings.push_back("Column '" + names[i] + "' value '" + cell_to_string(row[i]) +
				                          "' does not fit " + ColumnTypeName(column.type) + "; stored as VARCHAR");
				column.type = ColumnType::String;
				column.format.clear();
				break;
			}
		}
	}

	std::string ddl = "CREATE TABLE " + QuoteIdentifier(table) + " (" + QuoteIdentifier(SOURCE_ROW_COLUMN) + " BIGINT";
	for (size_t i = 0; i < width; ++i) {
		ddl += ", " + QuoteIdentifier(names[i]) + " " + ColumnTypeSql(columns[i].type);
	}
	ddl += ")";
	RunQuery(con, ddl);

	try {
		duckdb::Appender appender(con, table);
		for (size_t r = 0; r < rows.size(); ++r) {
			const RowRaw &row = rows[r];
			appender.BeginRow();
			appender.Append<int64_t>(source_rows[r]);
			for (size_t i = 0; i < width; ++i) {
				if (i >= row.size() || !ConvertCell(row[i], columns[i], value)) {
					value = duckdb::Value(ToLogicalType(columns[i].type));
				}
				appender.Append<duckdb::Value>(value);
			}
			appender.EndRow();
		}
		appender.Close();
	} catch (std::exception &ex) {
		throw StoreException("Failed to load rows: " + duckdb::ErrorData(ex).Message());
	}

	skipped_rows += SourceAdapter::DropEmptyRows(con, table);
	if (skipped_rows > 0) {
		result.warnings.push_back("Skipped " + std::to_string(skipped_rows) + " empty rows");
	}

	result.columns = SourceAdapter::DescribeColumns(con, table);
	for (size_t i = 0; i < result.columns.size() && i < columns.size(); ++i) {
		result.columns[i].type = columns[i].type;
		result.columns[i].warnings = columns[i].warnings;
		result.warnings.insert(result.warnings.end(), columns[i].warnings.begin(), columns[i].warnings.end());
	}
	result.row_count = SourceAdapter::CountRows(con, table);
	for (auto &warning : result.warnings) {
		Log()->warn("{}", warning);
	}
	return result;
}

} // namespace dsingest
