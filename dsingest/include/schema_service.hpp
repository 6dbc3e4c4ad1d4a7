#ifndef DSINGEST_SCHEMA_SERVICE_HPP
#define DSINGEST_SCHEMA_SERVICE_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "inferrer.h"

namespace dsingest {

class IngestSession;

struct SchemaColumn {
	std::string name;
	ColumnType inferred_type = ColumnType::String;
	//! inferred type or the active override
	ColumnType type = ColumnType::String;
	bool overridden = false;
	bool nullable = true;
	std::vector<std::string> warnings;
};

struct SchemaInfo {
	std::string source_type;
	int64_t row_count = 0;
	std::vector<SchemaColumn> columns;
	//! active overrides in column order
	std::vector<std::pair<std::string, ColumnType>> overrides;
};

struct OverrideResult {
	std::string column;
	ColumnType original_type = ColumnType::String;
	ColumnType new_type = ColumnType::String;
	//! stored non-null values that read as NULL under the new type
	int64_t incompatible_count = 0;
};

//! SQL expression reading a stored column as `requested`. Values that do not convert become
//! NULL.
std::string OverrideExpression(const std::string &column, ColumnType stored, ColumnType requested);

class SchemaService {
public:
	explicit SchemaService(IngestSession &session) : session(session) {
	}

	SchemaInfo GetSchema();
	//! Records a query-time type for a column, stored rows are never changed. Requesting the
	//! inferred type removes the override.
	OverrideResult OverrideColumnType(const std::string &column_name, const std::string &requested_type);

private:
	IngestSession &session;
};

} // namespace dsingest

#endif
