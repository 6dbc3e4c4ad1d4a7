#ifndef DSINGEST_LOGGING_HPP
#define DSINGEST_LOGGING_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace dsingest {

struct IngestConfig;

//! The "dsingest" logger, created with console output on first use
std::shared_ptr<spdlog::logger> Log();

//! Rebuilds the logger sinks and level from the configuration. The logger is process-wide,
//! the host calls this once at startup and sessions never do.
void ConfigureLogging(const IngestConfig &config);

}

#endif
