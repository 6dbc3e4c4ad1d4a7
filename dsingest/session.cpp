#include "session.hpp"

#include "checksum.hpp"
#include "duckdb/common/error_data.hpp"
#include "duckdb/common/types/timestamp.hpp"
#include "exception.hpp"
#include "logging.hpp"
#include "xls_source.h"

namespace dsingest {

IngestSession::IngestSession(IngestConfig config_p) : config(std::move(config_p)) {
	duckdb::DBConfig db_config;
	try {
		if (!config.memory_limit.empty()) {
			db_config.SetOptionByName("memory_limit", duckdb::Value(config.memory_limit));
		}
		if (config.threads > 0) {
			db_config.SetOptionByName("threads", duckdb::Value::UBIGINT(config.threads));
		}
		db = std::make_unique<duckdb::DuckDB>(nullptr, &db_config);
	} catch (std::exception &ex) {
		throw ValidationException("Invalid store settings: " + duckdb::ErrorData(ex).Message(),
		                          "Check memory_limit and threads in the configuration");
	}
	con = std::make_unique<duckdb::Connection>(*db);
}

IngestSession::~IngestSession() = default;

void IngestSession::DropTable(const std::string &table) noexcept {
	try {
		auto result = con->Query("DROP TABLE IF EXISTS " + QuoteIdentifier(table));
		if (result->HasError()) {
			Log()->error("dropping {} failed: {}", table, result->GetError());
		}
	} catch (std::exception &ex) {
		Log()->error("dropping {} failed: {}", table, ex.what());
	}
}

ImportResult IngestSession::Import(std::unique_ptr<SourceAdapter> adapter) {
	if (!adapter) {
		throw ValidationException("No source given", "Pass a delimited file, spreadsheet or database adapter");
	}
	std::lock_guard<std::recursive_mutex> guard(lock);
	DropTable(STAGING_TABLE_NAME);

	ImportResult result;
	try {
		result = adapter->import_data(*con, STAGING_TABLE_NAME);
	} catch (std::exception &ex) {
		Log()->warn("import of {} failed: {}", adapter->source_type(), ex.what());
		DropTable(STAGING_TABLE_NAME);
		throw;
	}

	// swap staging in, the previous dataset survives any failure up to COMMIT
	RunQuery(*con, "BEGIN TRANSACTION");
	for (auto &sql : {"DROP TABLE IF EXISTS " + QuoteIdentifier(TABLE_NAME),
	                  "ALTER TABLE " + QuoteIdentifier(STAGING_TABLE_NAME) + " RENAME TO " + QuoteIdentifier(TABLE_NAME),
	                  std::string("COMMIT")}) {
		auto step = con->Query(sql);
		if (step->HasError()) {
			std::string error = step->GetError();
			auto rollback = con->Query("ROLLBACK");
			if (rollback->HasError()) {
				Log()->error("rollback failed: {}", rollback->GetError());
			}
			DropTable(STAGING_TABLE_NAME);
			throw StoreException("Could not replace the imported data: " + error);
		}
	}

	DataSource data;
	data.source_type = adapter->source_type();
	data.label = adapter->label();
	data.row_count = result.row_count;
	data.column_count = (int64_t)result.columns.size();
	data.created_at = duckdb::Timestamp::ToString(duckdb::Timestamp::GetCurrentTimestamp());
	source = data;
	columns = result.columns;
	overrides.clear();
	Log()->info("active source is now {} {}: {} rows, {} columns", data.source_type, data.label, data.row_count,
	            data.column_count);
	return result;
}

ImportResult IngestSession::ImportDelimited(const std::string &path, const DelimitedOptions &options) {
	return Import(std::make_unique<DelimitedFileAdapter>(config, path, options));
}

ImportResult IngestSession::ImportSpreadsheet(const std::string &path, const std::string &sheet, bool header) {
	return Import(std::make_unique<SpreadsheetAdapter>(config, path, sheet, header));
}

ImportResult IngestSession::ImportDatabase(const std::string &connection_string, const std::string &query,
                                           const std::string &schema) {
	return Import(std::make_unique<DatabaseAdapter>(config, connection_string, query, schema));
}

std::vector<std::string> IngestSession::ListSheets(const std::string &path) {
	return SpreadsheetAdapter::list_sheets(path);
}

std::vector<RemoteTableInfo> IngestSession::ListTables(const std::string &connection_string,
                                                       const std::string &schema) {
	DatabaseAdapter adapter(config, connection_string, std::string(), schema);
	return ListTables(adapter);
}

std::vector<RemoteTableInfo> IngestSession::ListTables(DatabaseAdapter &adapter) {
	std::lock_guard<std::recursive_mutex> guard(lock);
	return adapter.list_tables(*con);
}

void IngestSession::ClearSource() {
	std::lock_guard<std::recursive_mutex> guard(lock);
	RunQuery(*con, "DROP TABLE IF EXISTS " + QuoteIdentifier(TABLE_NAME));
	source.reset();
	columns.clear();
	overrides.clear();
	Log()->info("source cleared");
}

SourceInfo IngestSession::GetSourceInfo() {
	std::lock_guard<std::recursive_mutex> guard(lock);
	SourceInfo info;
	if (!source) {
		return info;
	}
	info.active = true;
	info.source_type = source->source_type;
	info.label = source->label;
	info.row_count = source->row_count;
	info.columns = columns;
	info.signature = ComputeSchemaSignature(columns);
	info.created_at = source->created_at;
	return info;
}

bool IngestSession::HasSource() const {
	return static_cast<bool>(source);
}

const DataSource &IngestSession::Source() const {
	if (!source) {
		throw NotFoundException("No data source imported",
		                        "Import a delimited file, spreadsheet or database query first");
	}
	return *source;
}

const ColumnInfo *IngestSession::FindColumn(const std::string &name) const {
	for (auto &column : columns) {
		if (column.name == name) {
			return &column;
		}
	}
	return nullptr;
}

void IngestSession::SetOverride(const std::string &column, ColumnType type) {
	overrides[column] = type;
}

void IngestSession::RemoveOverride(const std::string &column) {
	overrides.erase(column);
}

} // namespace dsingest
