#include "checksum.hpp"

#include <cmath>

#include <nlohmann/json.hpp>
#include <openssl/evp.h>

#include "exception.hpp"
#include "session.hpp"
#include "source_adapter.hpp"

namespace dsingest {

namespace {

struct CEVPContext {
	CEVPContext() : m_pointer(EVP_MD_CTX_new()) {
	}
	~CEVPContext() {
		EVP_MD_CTX_free(m_pointer);
	}
	CEVPContext(const CEVPContext &) = delete;
	CEVPContext &operator=(const CEVPContext &) = delete;
	operator EVP_MD_CTX *() {
		return m_pointer;
	}
	EVP_MD_CTX *m_pointer;
};

nlohmann::json ToJson(const duckdb::Value &value) {
	if (value.IsNull()) {
		return nullptr;
	}
	switch (value.type().id()) {
	case duckdb::LogicalTypeId::BOOLEAN:
		return value.GetValue<bool>();
	case duckdb::LogicalTypeId::TINYINT:
	case duckdb::LogicalTypeId::SMALLINT:
	case duckdb::LogicalTypeId::INTEGER:
	case duckdb::LogicalTypeId::BIGINT:
	case duckdb::LogicalTypeId::UTINYINT:
	case duckdb::LogicalTypeId::USMALLINT:
	case duckdb::LogicalTypeId::UINTEGER:
		return value.GetValue<int64_t>();
	case duckdb::LogicalTypeId::UBIGINT:
		return value.GetValue<uint64_t>();
	case duckdb::LogicalTypeId::FLOAT:
	case duckdb::LogicalTypeId::DOUBLE: {
		double d = value.GetValue<double>();
		if (!std::isfinite(d)) {
			return value.ToString();
		}
		return d;
	}
	default:
		return value.ToString();
	}
}

} // namespace

std::string Sha256Hex(const std::string &data) {
	static const char hex[] = "0123456789abcdef";
	unsigned char digest[EVP_MAX_MD_SIZE];
	unsigned int digest_len = 0;

	CEVPContext ctx;
	if (!ctx.m_pointer) {
		throw StoreException("OpenSSL: EVP_MD_CTX_new failed");
	}
	if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1 || EVP_DigestUpdate(ctx, data.data(), data.size()) != 1 ||
	    EVP_DigestFinal_ex(ctx, digest, &digest_len) != 1) {
		throw StoreException("OpenSSL: SHA-256 digest failed");
	}

	std::string result;
	result.reserve(digest_len * 2);
	for (unsigned int i = 0; i < digest_len; ++i) {
		result += hex[digest[i] >> 4];
		result += hex[digest[i] & 0x0f];
	}
	return result;
}

std::string ComputeRowChecksum(const RowData &row) {
	// json objects keep their keys sorted, so the dump is independent of column order
	nlohmann::json doc = nlohmann::json::object();
	for (auto &entry : row) {
		doc[entry.first] = ToJson(entry.second);
	}
	return Sha256Hex(doc.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

std::string ComputeSchemaSignature(const std::vector<ColumnInfo> &columns) {
	std::string text;
	for (auto &column : columns) {
		if (!text.empty()) {
			text += '|';
		}
		text += column.name;
		text += ':';
		text += ColumnTypeSql(column.type);
		text += column.nullable ? ":1" : ":0";
	}
	return Sha256Hex(text);
}

std::vector<RowChecksum> ChecksumEngine::ComputeChecksums(int64_t start_row, int64_t end_row) {
	std::lock_guard<std::recursive_mutex> guard(session.Mutex());
	int64_t total = session.Source().row_count;
	if (end_row >= 1 && start_row > end_row) {
		throw ValidationException("start_row " + std::to_string(start_row) + " is after end_row " +
		                              std::to_string(end_row),
		                          "Use start_row <= end_row");
	}
	if (start_row < 1) {
		start_row = 1;
	}
	if (end_row < 1 || end_row > total) {
		end_row = total;
	}
	std::vector<RowChecksum> checksums;
	if (start_row > end_row) {
		return checksums;
	}

	auto result = RunQuery(session.GetConnection(),
	                       "SELECT * EXCLUDE (" + QuoteIdentifier(SOURCE_ROW_COLUMN) + ") FROM " +
	                           QuoteIdentifier(IngestSession::TABLE_NAME) + " ORDER BY " +
	                           QuoteIdentifier(SOURCE_ROW_COLUMN) + " LIMIT " +
	                           std::to_string(end_row - start_row + 1) + " OFFSET " + std::to_string(start_row - 1));
	checksums.reserve(result->RowCount());
	for (duckdb::idx_t r = 0; r < result->RowCount(); ++r) {
		RowData row;
		for (duckdb::idx_t c = 0; c < result->ColumnCount(); ++c) {
			row.emplace_back(result->names[c], result->GetValue(c, r));
		}
		checksums.push_back(RowChecksum {start_row + (int64_t)r, ComputeRowChecksum(row)});
	}
	return checksums;
}

ChecksumVerification ChecksumEngine::VerifyChecksum(int64_t row_number, const std::string &expected) {
	std::lock_guard<std::recursive_mutex> guard(session.Mutex());
	int64_t total = session.Source().row_count;
	if (row_number < 1 || row_number > total) {
		throw NotFoundException("Row " + std::to_string(row_number) + " not found",
		                        "Valid rows are 1 to " + std::to_string(total));
	}
	auto checksums = ComputeChecksums(row_number, row_number);
	ChecksumVerification verification;
	verification.row_number = row_number;
	verification.expected = expected;
	verification.actual = checksums.empty() ? std::string() : checksums.front().checksum;
	verification.matches = verification.actual == expected;
	return verification;
}

} // namespace dsingest
