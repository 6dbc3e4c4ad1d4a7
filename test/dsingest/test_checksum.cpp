#include "ingest_test_helpers.hpp"

#include "checksum.hpp"
#include "exception.hpp"
#include "session.hpp"

using namespace dsingest;
using namespace dsingest_test;
using duckdb::Value;

static const char *const DIGEST_A1_B2 = "43258cff783fe7036d8a43033f830adfc60ec037382473548ac742b888292777";

TEST_CASE("SHA-256 hex digests", "[checksum]") {
	REQUIRE(Sha256Hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
	REQUIRE(Sha256Hex("{\"a\":1,\"b\":2}") == DIGEST_A1_B2);
}

TEST_CASE("Row checksums are independent of column order", "[checksum]") {
	RowData forward {{"a", Value::INTEGER(1)}, {"b", Value::INTEGER(2)}};
	RowData backward {{"b", Value::INTEGER(2)}, {"a", Value::INTEGER(1)}};
	REQUIRE(ComputeRowChecksum(forward) == DIGEST_A1_B2);
	REQUIRE(ComputeRowChecksum(backward) == DIGEST_A1_B2);

	RowData mixed {{"d", Value::DOUBLE(1.5)}, {"c", Value::BOOLEAN(true)}, {"b", Value("x")}, {"a", Value()}};
	auto checksum = ComputeRowChecksum(mixed);
	REQUIRE(checksum == "bd39f395c553d8181cd8a088c84d8a0f4b772d7b8dff1c8efb20bbbfcda4b157");
	REQUIRE(checksum.size() == 64);
	REQUIRE(checksum.find_first_not_of("0123456789abcdef") == std::string::npos);

	RowData changed {{"a", Value::INTEGER(1)}, {"b", Value::INTEGER(3)}};
	REQUIRE(ComputeRowChecksum(changed) != DIGEST_A1_B2);
	// the text "1" and the number 1 are different values
	RowData text {{"a", Value("1")}, {"b", Value::INTEGER(2)}};
	REQUIRE(ComputeRowChecksum(text) != DIGEST_A1_B2);
}

TEST_CASE("Schema signatures follow names and types", "[checksum]") {
	std::vector<ColumnInfo> first {{"id", ColumnType::Integer, false, {}}, {"name", ColumnType::String, true, {}}};
	std::vector<ColumnInfo> same = first;
	same[1].warnings.push_back("ignored");
	std::vector<ColumnInfo> other = first;
	other[0].type = ColumnType::BigInteger;

	REQUIRE(ComputeSchemaSignature(first) == ComputeSchemaSignature(same));
	REQUIRE(ComputeSchemaSignature(first) != ComputeSchemaSignature(other));
	REQUIRE(ComputeSchemaSignature(first) == Sha256Hex("id:INTEGER:0|name:VARCHAR:1"));
}

TEST_CASE("Checksum engine over imported rows", "[checksum]") {
	TempDir dir;
	IngestSession session;
	ChecksumEngine engine(session);

	REQUIRE_THROWS_AS(engine.ComputeChecksums(), NotFoundException);

	session.ImportDelimited(WriteFile(dir, "pairs.csv", "a,b\n1,2\n3,4\n5,6\n"));

	auto all = engine.ComputeChecksums();
	REQUIRE(all.size() == 3);
	REQUIRE(all[0].row_number == 1);
	REQUIRE(all[0].checksum == DIGEST_A1_B2);
	REQUIRE(all[2].row_number == 3);

	auto middle = engine.ComputeChecksums(2, 2);
	REQUIRE(middle.size() == 1);
	REQUIRE(middle[0].checksum == all[1].checksum);

	// ranges are clamped to the data
	REQUIRE(engine.ComputeChecksums(2, 100).size() == 2);
	REQUIRE(engine.ComputeChecksums(0, 1).size() == 1);
	REQUIRE(engine.ComputeChecksums(7).empty());
	REQUIRE_THROWS_AS(engine.ComputeChecksums(3, 2), ValidationException);

	auto ok = engine.VerifyChecksum(1, DIGEST_A1_B2);
	REQUIRE(ok.matches);
	REQUIRE(ok.actual == DIGEST_A1_B2);

	auto bad = engine.VerifyChecksum(2, DIGEST_A1_B2);
	REQUIRE_FALSE(bad.matches);
	REQUIRE(bad.expected == DIGEST_A1_B2);
	REQUIRE(bad.actual == all[1].checksum);

	REQUIRE_THROWS_AS(engine.VerifyChecksum(0, DIGEST_A1_B2), NotFoundException);
	REQUIRE_THROWS_AS(engine.VerifyChecksum(4, DIGEST_A1_B2), NotFoundException);
}

TEST_CASE("Checksums are stable across re-import", "[checksum]") {
	TempDir dir;
	auto path = WriteFile(dir, "people.csv", "name,age,joined\nAlice,30,2024-01-15\nBob,,2023-12-01\n");

	IngestSession first;
	first.ImportDelimited(path);
	auto before = ChecksumEngine(first).ComputeChecksums();

	IngestSession second;
	second.ImportDelimited(path);
	auto after = ChecksumEngine(second).ComputeChecksums();

	REQUIRE(before.size() == 2);
	REQUIRE(after.size() == 2);
	REQUIRE(before[0].checksum == after[0].checksum);
	REQUIRE(before[1].checksum == after[1].checksum);
	REQUIRE(before[0].checksum != before[1].checksum);
}
