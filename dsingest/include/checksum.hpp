#ifndef DSINGEST_CHECKSUM_HPP
#define DSINGEST_CHECKSUM_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "duckdb.hpp"

namespace dsingest {

class IngestSession;
struct ColumnInfo;

//! Column name and stored value of one row
using RowData = std::vector<std::pair<std::string, duckdb::Value>>;

//! SHA-256 (lowercase hex) of the row serialized as JSON with sorted keys. Independent of
//! column order.
std::string ComputeRowChecksum(const RowData &row);

//! SHA-256 (lowercase hex) of arbitrary bytes
std::string Sha256Hex(const std::string &data);

//! SHA-256 over "name:TYPE:nullable|..." for a schema
std::string ComputeSchemaSignature(const std::vector<ColumnInfo> &columns);

struct RowChecksum {
	int64_t row_number;
	std::string checksum;
};

struct ChecksumVerification {
	int64_t row_number;
	std::string expected;
	std::string actual;
	bool matches;
};

class ChecksumEngine {
public:
	explicit ChecksumEngine(IngestSession &session) : session(session) {
	}

	//! Checksums for rows start_row..end_row (1-based, inclusive), clamped to the data. end_row < 1
	//! means the last row.
	std::vector<RowChecksum> ComputeChecksums(int64_t start_row = 1, int64_t end_row = 0);
	ChecksumVerification VerifyChecksum(int64_t row_number, const std::string &expected);

private:
	IngestSession &session;
};

} // namespace dsingest

#endif
