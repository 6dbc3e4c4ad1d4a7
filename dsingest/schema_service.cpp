#include "schema_service.hpp"

#include <boost/algorithm/string/join.hpp>

#include "exception.hpp"
#include "logging.hpp"
#include "session.hpp"

namespace dsingest {

static bool IsTemporal(ColumnType type) {
	return type == ColumnType::Date || type == ColumnType::Timestamp;
}

std::string OverrideExpression(const std::string &column, ColumnType stored, ColumnType requested) {
	std::string ref = QuoteIdentifier(column);
	if (stored == requested) {
		return ref;
	}
	if (requested == ColumnType::String) {
		return "CAST(" + ref + " AS VARCHAR)";
	}
	// no direct cast between temporal and numeric or boolean values, go through text
	if (IsTemporal(stored) != IsTemporal(requested) && stored != ColumnType::String) {
		ref = "CAST(" + ref + " AS VARCHAR)";
	}
	return "TRY_CAST(" + ref + " AS " + ColumnTypeSql(requested) + ")";
}

SchemaInfo SchemaService::GetSchema() {
	std::lock_guard<std::recursive_mutex> guard(session.Mutex());
	auto &source = session.Source();
	SchemaInfo info;
	info.source_type = source.source_type;
	info.row_count = source.row_count;
	for (auto &column : session.Columns()) {
		SchemaColumn entry;
		entry.name = column.name;
		entry.inferred_type = entry.type = column.type;
		entry.nullable = column.nullable;
		entry.warnings = column.warnings;
		auto it = session.Overrides().find(column.name);
		if (it != session.Overrides().end()) {
			entry.type = it->second;
			entry.overridden = true;
			info.overrides.emplace_back(column.name, it->second);
		}
		info.columns.push_back(std::move(entry));
	}
	return info;
}

OverrideResult SchemaService::OverrideColumnType(const std::string &column_name, const std::string &requested_type) {
	std::lock_guard<std::recursive_mutex> guard(session.Mutex());
	session.Source();
	auto column = session.FindColumn(column_name);
	if (!column) {
		std::vector<std::string> names;
		for (auto &c : session.Columns()) {
			names.push_back(c.name);
		}
		throw NotFoundException("Column '" + column_name + "' not found",
		                        "Available columns: " + boost::algorithm::join(names, ", "));
	}
	ColumnType requested;
	if (!ParseColumnType(requested_type, requested)) {
		throw ValidationException("Invalid type '" + requested_type + "'", "Valid types: " + ValidColumnTypeList());
	}

	OverrideResult result;
	result.column = column->name;
	result.original_type = column->type;
	result.new_type = requested;
	if (requested == column->type) {
		session.RemoveOverride(column->name);
		Log()->info("override of column {} removed", column->name);
		return result;
	}

	auto count = RunQuery(session.GetConnection(),
	                      "SELECT COUNT(*) FROM " + QuoteIdentifier(IngestSession::TABLE_NAME) + " WHERE " +
	                          QuoteIdentifier(column->name) + " IS NOT NULL AND " +
	                          OverrideExpression(column->name, column->type, requested) + " IS NULL");
	result.incompatible_count = count->GetValue(0, 0).GetValue<int64_t>();
	session.SetOverride(column->name, requested);
	Log()->info("column {} overridden from {} to {}, {} incompatible values", column->name,
	            ColumnTypeName(column->type), ColumnTypeName(requested), result.incompatible_count);
	return result;
}

} // namespace dsingest
