#ifndef DSINGEST_CONFIG_HPP
#define DSINGEST_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace dsingest {

struct IngestConfig {
	//! remote tables above this many rows can only be imported with a WHERE clause
	int64_t large_table_threshold = 10000;
	int64_t max_page_size = 1000;
	int64_t default_page_size = 100;
	//! row cap for query_data results
	int64_t max_query_rows = 10000;
	//! cell texts treated as null on import
	std::vector<std::string> null_strings {"NULL", "null"};
	//! prefer MM/DD over DD/MM when both parse
	bool month_first = true;

	std::string log_level = "info";
	std::string log_file;

	//! forwarded to duckdb::DBConfig, empty or 0 keeps the DuckDB default
	std::string memory_limit;
	uint64_t threads = 0;

	//! Reads a JSON document, keys that are absent keep their defaults
	static IngestConfig Load(const std::string &path);
	static IngestConfig FromJson(const nlohmann::json &doc);
};

} // namespace dsingest

#endif
