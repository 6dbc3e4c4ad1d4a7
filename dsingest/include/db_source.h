#ifndef DSINGEST_DB_SOURCE_H
#define DSINGEST_DB_SOURCE_H

#include <cstdint>
#include <string>
#include <vector>

#include "config.hpp"
#include "source_adapter.hpp"

namespace dsingest {

enum class RemoteFamily { Postgres, MySQL };

// "postgres" or "mysql", also the DuckDB extension and ATTACH type
const char* RemoteFamilyName(RemoteFamily family);

// Parsed connection URL. `url` and `password` are secrets and never leave this module.
struct ConnectionInfo
{
	RemoteFamily family = RemoteFamily::Postgres;
	std::string url;
	std::string user;
	std::string password;
	std::string host;
	std::string port;
	std::string database;
};

// Accepts postgresql://, postgres:// and mysql:// URLs, anything else raises ValidationException
ConnectionInfo ParseConnectionString(const std::string& connection_string);

// Removes the URL and password from a message
std::string RedactSecrets(const std::string& text, const ConnectionInfo& info);

struct RemoteTableInfo
{
	std::string name;
	int64_t row_count = -1; // -1 when the count failed
	bool requires_filter = false;
};

// Keeps a remote database attached read-only for the lifetime of the object
class RemoteAttachment
{
public:
	RemoteAttachment(duckdb::Connection& con, const ConnectionInfo& info, const std::string& alias, const std::string& attach_sql);
	~RemoteAttachment();
	RemoteAttachment(const RemoteAttachment&) = delete;
	RemoteAttachment& operator = (const RemoteAttachment&) = delete;

	const std::string& alias() const { return m_alias; }

private:
	duckdb::Connection& m_con;
	std::string m_alias;
};

// Snapshot import from Postgres or MySQL through the DuckDB scanner extensions. The remote
// database is attached only for the duration of one call.
class DatabaseAdapter : public SourceAdapter
{
public:
	// An empty schema means "public" for Postgres and the URL's database for MySQL
	DatabaseAdapter(const IngestConfig& config, const std::string& connection_string, std::string query,
		std::string schema = std::string());

	std::string source_type() const override;
	std::string label() const override;
	ImportResult import_data(duckdb::Connection& con, const std::string& table) override;

	std::vector<RemoteTableInfo> list_tables(duckdb::Connection& con);
	const std::string& schema() const { return m_schema; }

protected:
	// Loads the scanner extension of the family
	virtual void prepare_connection(duckdb::Connection& con) const;
	// ATTACH statement for the remote database under `alias`
	virtual std::string attach_statement(const std::string& alias) const;

	const ConnectionInfo& connection() const { return m_info; }

private:
	std::vector<std::string> remote_tables(duckdb::Connection& con, const std::string& alias, const std::string& schema);
	int64_t remote_count(duckdb::Connection& con, const std::string& alias, const std::string& schema, const std::string& table);
	std::vector<std::string> normalize_types(duckdb::Connection& con, const std::string& table);

	IngestConfig m_config;
	ConnectionInfo m_info;
	std::string m_query;
	std::string m_schema;
};

}

#endif
