#include <mutex>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "config.hpp"
#include "exception.hpp"
#include "logging.hpp"

namespace dsingest {

static const char *LOGGER_NAME = "dsingest";
static const char *LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

static std::mutex _log_mutex;

static std::shared_ptr<spdlog::logger> make_logger(std::vector<spdlog::sink_ptr> sinks)
{
	auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
	logger->set_pattern(LOG_PATTERN);
	spdlog::drop(LOGGER_NAME);
	spdlog::register_logger(logger);
	return logger;
}

std::shared_ptr<spdlog::logger> Log()
{
	std::lock_guard<std::mutex> lock(_log_mutex);
	auto logger = spdlog::get(LOGGER_NAME);
	if (!logger)
	{
		logger = make_logger({std::make_shared<spdlog::sinks::stderr_color_sink_mt>()});
		logger->set_level(spdlog::level::info);
	}
	return logger;
}

void ConfigureLogging(const IngestConfig &config)
{
	spdlog::level::level_enum level = spdlog::level::from_str(config.log_level);
	// from_str maps unknown names to "off"
	if (level == spdlog::level::off && config.log_level != "off")
		throw ValidationException("Unknown log level '" + config.log_level + "'",
		                          "Use one of trace, debug, info, warn, error, critical, off");

	std::vector<spdlog::sink_ptr> sinks {std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
	if (!config.log_file.empty())
	{
		try
		{
			sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file));
		}
		catch (const spdlog::spdlog_ex &ex)
		{
			throw ValidationException("Cannot open log file: " + std::string(ex.what()),
			                          "Check that the log directory exists and is writable");
		}
	}

	std::lock_guard<std::mutex> lock(_log_mutex);
	auto logger = make_logger(std::move(sinks));
	logger->set_level(level);
	logger->flush_on(spdlog::level::warn);
}

}
