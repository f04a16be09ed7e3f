#pragma once

#include <string>

#include <spdlog/logger.h>

using Logger = spdlog::logger;

// Sets the default root log level, and the level for any logger subsequently created by logger_for.
// Only worth calling before any Loggers are created (e.g. in main()).
void set_log_level(spdlog::level::level_enum level);
// Creates a named logger. All loggers share a single coloured console sink.
Logger logger_for(std::string name);
