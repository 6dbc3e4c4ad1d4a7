#include <catch2/catch.hpp>

#include "exception.hpp"
#include "query_guard.hpp"

using namespace dsingest;

TEST_CASE("String literals are blanked", "[guard]") {
	REQUIRE(StripStringLiterals("SELECT 'DROP' AS x") == "SELECT '    ' AS x");
	REQUIRE(StripStringLiterals("WHERE a = 'it''s'") == "WHERE a = '     '");
	REQUIRE(StripStringLiterals("SELECT 1") == "SELECT 1");
}

TEST_CASE("Read-only SELECT statements pass", "[guard]") {
	REQUIRE_NOTHROW(CheckReadOnlyQuery("SELECT * FROM imported_data"));
	REQUIRE_NOTHROW(CheckReadOnlyQuery("select state, count(*) from imported_data group by state order by 2 desc"));
	REQUIRE_NOTHROW(CheckReadOnlyQuery("WITH t AS (SELECT 1 AS x) SELECT x FROM t"));
	// forbidden words inside literals are data
	REQUIRE_NOTHROW(CheckReadOnlyQuery("SELECT * FROM imported_data WHERE note = 'please DELETE me; DROP all'"));
	// identifiers that merely contain a verb
	REQUIRE_NOTHROW(CheckReadOnlyQuery("SELECT created_at, updated_by FROM imported_data"));
}

TEST_CASE("Mutating statements are refused", "[guard]") {
	const char *queries[] = {
	    "DROP TABLE imported_data",
	    "DELETE FROM imported_data",
	    "UPDATE imported_data SET a = 1",
	    "INSERT INTO imported_data VALUES (1)",
	    "ALTER TABLE imported_data ADD COLUMN x INTEGER",
	    "CREATE TABLE x AS SELECT 1",
	    "TRUNCATE imported_data",
	    "ATTACH 'other.db' AS other",
	    "COPY imported_data TO 'out.csv'",
	    "PRAGMA table_info('imported_data')",
	    "SET threads = 1",
	    "drop table imported_data",
	};
	for (auto sql : queries) {
		INFO(sql);
		REQUIRE_THROWS_AS(CheckReadOnlyQuery(sql), SecurityException);
	}
}

TEST_CASE("File reading functions are refused", "[guard]") {
	REQUIRE_THROWS_AS(CheckReadOnlyQuery("SELECT * FROM read_csv('/etc/passwd')"), SecurityException);
	REQUIRE_THROWS_AS(CheckReadOnlyQuery("SELECT * FROM read_csv_auto ('x.csv')"), SecurityException);
	REQUIRE_THROWS_AS(CheckReadOnlyQuery("SELECT * FROM read_parquet('x.parquet')"), SecurityException);
	REQUIRE_THROWS_AS(CheckReadOnlyQuery("SELECT * FROM glob('*')"), SecurityException);
	// the path itself is only text
	REQUIRE_NOTHROW(CheckReadOnlyQuery("SELECT 'read_csv(x)' AS s"));
}

TEST_CASE("Only one statement is allowed", "[guard]") {
	REQUIRE_THROWS_AS(CheckReadOnlyQuery("SELECT 1; SELECT 2"), SecurityException);
	REQUIRE_THROWS_AS(CheckReadOnlyQuery("SELECT 1; DROP TABLE imported_data"), SecurityException);
	REQUIRE_THROWS_AS(CheckReadOnlyQuery("EXPLAIN SELECT 1"), SecurityException);
}

TEST_CASE("Malformed and empty queries are validation errors", "[guard]") {
	REQUIRE_THROWS_AS(CheckReadOnlyQuery(""), ValidationException);
	REQUIRE_THROWS_AS(CheckReadOnlyQuery("   "), ValidationException);
	REQUIRE_THROWS_AS(CheckReadOnlyQuery("SELECT FROM WHERE"), ValidationException);
	try {
		CheckReadOnlyQuery("DROP TABLE imported_data");
		FAIL("expected a security error");
	} catch (SecurityException &ex) {
		REQUIRE(ex.Type() == IngestErrorType::Security);
		REQUIRE_FALSE(ex.Suggestion().empty());
	}
}

TEST_CASE("Filter predicates", "[guard]") {
	REQUIRE_NOTHROW(CheckFilterPredicate("state = 'CA'"));
	REQUIRE_NOTHROW(CheckFilterPredicate("weight > 5 AND note = 'a;b'"));
	REQUIRE_THROWS_AS(CheckFilterPredicate(""), ValidationException);
	REQUIRE_THROWS_AS(CheckFilterPredicate("1=1; DROP TABLE imported_data"), ValidationException);
	REQUIRE_THROWS_AS(CheckFilterPredicate("1=1 -- comment"), ValidationException);
	REQUIRE_THROWS_AS(CheckFilterPredicate("1=1 /* comment */"), ValidationException);
	REQUIRE_THROWS_AS(CheckFilterPredicate("id IN (SELECT 1 FROM read_csv('x.csv'))"), SecurityException);
}

TEST_CASE("Tables read by a query", "[guard]") {
	auto tables = CheckReadOnlyQuery("SELECT o.id, EXTRACT(year FROM o.created_at), TRIM(BOTH ' ' FROM c.name) "
	                                 "FROM orders o JOIN sales.customers c ON o.customer_id = c.id "
	                                 "WHERE o.id IN (SELECT order_id FROM refunds)");
	REQUIRE(tables.size() == 3);
	REQUIRE(tables[0].table == "orders");
	REQUIRE(tables[0].schema.empty());
	REQUIRE(tables[1].schema == "sales");
	REQUIRE(tables[1].table == "customers");
	REQUIRE(tables[2].table == "refunds");

	// common table expressions are not tables
	tables = CheckReadOnlyQuery("WITH recent AS (SELECT * FROM orders) SELECT * FROM recent UNION ALL SELECT * FROM old");
	REQUIRE(tables.size() == 2);
	REQUIRE(tables[0].table == "orders");
	REQUIRE(tables[1].table == "old");

	REQUIRE(CheckReadOnlyQuery("SELECT 1").empty());
	REQUIRE_THROWS_AS(CheckReadOnlyQuery("SELECT * FROM range(10)"), SecurityException);
}

TEST_CASE("Queries over the imported data read nothing else", "[guard]") {
	REQUIRE_NOTHROW(CheckImportedDataQuery("SELECT * FROM imported_data"));
	REQUIRE_NOTHROW(CheckImportedDataQuery("WITH t AS (SELECT id FROM imported_data) SELECT COUNT(*) FROM t"));
	REQUIRE_NOTHROW(CheckImportedDataQuery("SELECT a.id FROM imported_data a JOIN imported_data b ON a.id = b.id"));

	// quoted paths in FROM are read as files by the engine
	REQUIRE_THROWS_AS(CheckImportedDataQuery("SELECT * FROM '/etc/passwd'"), SecurityException);
	REQUIRE_THROWS_AS(CheckImportedDataQuery("SELECT * FROM 'exports/secret.parquet'"), SecurityException);
	REQUIRE_THROWS_AS(CheckImportedDataQuery("SELECT * FROM imported_data WHERE id IN (SELECT 1 FROM 'x.parquet')"),
	                  SecurityException);
	REQUIRE_THROWS_AS(CheckImportedDataQuery("SELECT * FROM information_schema.tables"), SecurityException);
	REQUIRE_THROWS_AS(CheckImportedDataQuery("SELECT * FROM main.imported_data"), SecurityException);
	REQUIRE_THROWS_AS(CheckImportedDataQuery("SELECT * FROM duckdb_settings()"), SecurityException);

	REQUIRE_THROWS_AS(CheckFilterPredicate("id IN (SELECT 1 FROM '/etc/passwd')"), SecurityException);
	REQUIRE_THROWS_AS(CheckFilterPredicate("EXISTS (SELECT * FROM 'x.parquet')"), SecurityException);
}
