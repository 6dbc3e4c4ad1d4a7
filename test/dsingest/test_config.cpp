#include "ingest_test_helpers.hpp"

#include <nlohmann/json.hpp>

#include "config.hpp"
#include "exception.hpp"
#include "logging.hpp"

using namespace dsingest;
using namespace dsingest_test;

TEST_CASE("Default configuration", "[config]") {
	IngestConfig config;
	REQUIRE(config.large_table_threshold == 10000);
	REQUIRE(config.default_page_size <= config.max_page_size);
	REQUIRE(config.month_first);
	REQUIRE(config.log_level == "info");
}

TEST_CASE("Configuration from JSON", "[config]") {
	auto doc = nlohmann::json::parse(R"({
		"large_table_threshold": 500,
		"max_page_size": 50,
		"default_page_size": 10,
		"null_strings": ["NA", "-"],
		"month_first": false,
		"logging": {"level": "debug"}
	})");
	auto config = IngestConfig::FromJson(doc);
	REQUIRE(config.large_table_threshold == 500);
	REQUIRE(config.max_page_size == 50);
	REQUIRE(config.default_page_size == 10);
	REQUIRE(config.null_strings == std::vector<std::string> {"NA", "-"});
	REQUIRE_FALSE(config.month_first);
	REQUIRE(config.log_level == "debug");
	// absent keys keep their defaults
	REQUIRE(config.max_query_rows == IngestConfig().max_query_rows);
}

TEST_CASE("Invalid configuration is rejected", "[config]") {
	REQUIRE_THROWS_AS(IngestConfig::FromJson(nlohmann::json::array()), ValidationException);
	REQUIRE_THROWS_AS(IngestConfig::FromJson(nlohmann::json::parse(R"({"max_page_size": 0})")), ValidationException);
	REQUIRE_THROWS_AS(IngestConfig::FromJson(nlohmann::json::parse(R"({"large_table_threshold": "many"})")),
	                  ValidationException);
	REQUIRE_THROWS_AS(IngestConfig::FromJson(nlohmann::json::parse(R"({"default_page_size": 200, "max_page_size": 100})")),
	                  ValidationException);
}

TEST_CASE("Configuration files", "[config]") {
	TempDir dir;
	REQUIRE_THROWS_AS(IngestConfig::Load(dir.Path("missing.json")), NotFoundException);
	REQUIRE_THROWS_AS(IngestConfig::Load(WriteFile(dir, "broken.json", "{\"max_page_size\": ")), ValidationException);

	auto config = IngestConfig::Load(WriteFile(dir, "ok.json", "{\"max_query_rows\": 25}"));
	REQUIRE(config.max_query_rows == 25);
}

TEST_CASE("Logging configuration", "[config]") {
	TempDir dir;
	IngestConfig config;
	config.log_level = "loud";
	REQUIRE_THROWS_AS(ConfigureLogging(config), ValidationException);

	config.log_level = "warn";
	config.log_file = dir.Path("ingest.log");
	REQUIRE_NOTHROW(ConfigureLogging(config));
	REQUIRE(Log()->level() == spdlog::level::warn);

	// restore the console logger for the remaining tests
	ConfigureLogging(IngestConfig());
	REQUIRE(Log()->level() == spdlog::level::info);
}
