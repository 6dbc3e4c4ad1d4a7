#ifndef DSINGEST_SESSION_HPP
#define DSINGEST_SESSION_HPP

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/unordered_map.hpp>

#include "config.hpp"
#include "csv_source.h"
#include "db_source.h"
#include "duckdb.hpp"
#include "source_adapter.hpp"

namespace dsingest {

//! The imported dataset currently held by a session
struct DataSource {
	std::string source_type;
	//! file path, path[sheet] or remote family and query
	std::string label;
	int64_t row_count = 0;
	int64_t column_count = 0;
	//! UTC, ISO 8601
	std::string created_at;
};

struct SourceInfo {
	bool active = false;
	std::string source_type;
	std::string label;
	int64_t row_count = 0;
	std::vector<ColumnInfo> columns;
	//! SHA-256 over the schema, equal for sources of the same shape
	std::string signature;
	std::string created_at;
};

//! One in-memory DuckDB store holding at most one imported dataset (the table
//! `imported_data`) plus the session's type overrides. Public operations are serialized.
class IngestSession {
public:
	static constexpr const char *TABLE_NAME = "imported_data";
	static constexpr const char *STAGING_TABLE_NAME = "_dsingest_staging";

	explicit IngestSession(IngestConfig config = IngestConfig());
	~IngestSession();
	IngestSession(const IngestSession &) = delete;
	IngestSession &operator=(const IngestSession &) = delete;

	//! Loads the adapter's source into staging and swaps it in as the active dataset. On
	//! failure the previous dataset is kept.
	ImportResult Import(std::unique_ptr<SourceAdapter> adapter);
	ImportResult ImportDelimited(const std::string &path, const DelimitedOptions &options = DelimitedOptions());
	ImportResult ImportSpreadsheet(const std::string &path, const std::string &sheet = std::string(),
	                               bool header = true);
	ImportResult ImportDatabase(const std::string &connection_string, const std::string &query,
	                            const std::string &schema = std::string());

	std::vector<std::string> ListSheets(const std::string &path);
	std::vector<RemoteTableInfo> ListTables(const std::string &connection_string,
	                                        const std::string &schema = std::string());
	std::vector<RemoteTableInfo> ListTables(DatabaseAdapter &adapter);

	void ClearSource();
	SourceInfo GetSourceInfo();

	bool HasSource() const;
	//! Raises NotFoundException when nothing is imported
	const DataSource &Source() const;
	const std::vector<ColumnInfo> &Columns() const {
		return columns;
	}
	const ColumnInfo *FindColumn(const std::string &name) const;

	const boost::unordered_map<std::string, ColumnType> &Overrides() const {
		return overrides;
	}
	void SetOverride(const std::string &column, ColumnType type);
	void RemoveOverride(const std::string &column);

	const IngestConfig &Config() const {
		return config;
	}
	duckdb::Connection &GetConnection() {
		return *con;
	}
	std::recursive_mutex &Mutex() {
		return lock;
	}

private:
	void DropTable(const std::string &table) noexcept;

	IngestConfig config;
	std::unique_ptr<duckdb::DuckDB> db;
	std::unique_ptr<duckdb::Connection> con;
	std::recursive_mutex lock;

	boost::optional<DataSource> source;
	std::vector<ColumnInfo> columns;
	boost::unordered_map<std::string, ColumnType> overrides;
};

} // namespace dsingest

#endif
