#include <fstream>

#include <nlohmann/json.hpp>

#include "config.hpp"
#include "exception.hpp"

namespace dsingest {

namespace {

template <class T>
void read_key(const nlohmann::json &doc, const char *key, T &target)
{
	auto it = doc.find(key);
	if (it == doc.end() || it->is_null())
		return;
	try
	{
		target = it->get<T>();
	}
	catch (const nlohmann::json::exception &ex)
	{
		throw ValidationException(std::string("Invalid value for configuration key '") + key + "': " + ex.what(),
		                          "Check the type of the value in the configuration file");
	}
}

void require_positive(int64_t value, const char *key)
{
	if (value <= 0)
		throw ValidationException(std::string("Configuration key '") + key + "' must be positive",
		                          "Use a value greater than zero");
}

}

IngestConfig IngestConfig::FromJson(const nlohmann::json &doc)
{
	if (!doc.is_object())
		throw ValidationException("Configuration must be a JSON object", "Wrap the settings in { }");

	IngestConfig config;
	read_key(doc, "large_table_threshold", config.large_table_threshold);
	read_key(doc, "max_page_size", config.max_page_size);
	read_key(doc, "default_page_size", config.default_page_size);
	read_key(doc, "max_query_rows", config.max_query_rows);
	read_key(doc, "null_strings", config.null_strings);
	read_key(doc, "month_first", config.month_first);
	read_key(doc, "memory_limit", config.memory_limit);
	read_key(doc, "threads", config.threads);

	auto log = doc.find("logging");
	if (log != doc.end() && log->is_object())
	{
		read_key(*log, "level", config.log_level);
		read_key(*log, "file", config.log_file);
	}

	require_positive(config.large_table_threshold, "large_table_threshold");
	require_positive(config.max_page_size, "max_page_size");
	require_positive(config.default_page_size, "default_page_size");
	require_positive(config.max_query_rows, "max_query_rows");
	if (config.default_page_size > config.max_page_size)
		throw ValidationException("default_page_size exceeds max_page_size",
		                          "Lower default_page_size or raise max_page_size");
	return config;
}

IngestConfig IngestConfig::Load(const std::string &path)
{
	std::ifstream file(path);
	if (!file.is_open())
		throw NotFoundException("Configuration file not found: " + path);

	nlohmann::json doc;
	try
	{
		file >> doc;
	}
	catch (const nlohmann::json::parse_error &ex)
	{
		throw ValidationException("Configuration file is not valid JSON: " + std::string(ex.what()),
		                          "Fix the syntax error at the reported position");
	}
	return FromJson(doc);
}

}
