/// \file logging.h
/// \brief Logging initialization and utilities.

#pragma once

#include "export.h"

#include <spdlog/spdlog.h>

#include <string>

namespace MapBearing {

/// Initializes the global logger with default format, level, and color sink.
/// Output goes to stderr so stdout stays reserved for reports.
/// Call once at the start of main() before any logging.
/// \param level Log level (default: info)
MAPBEARING_API void InitLogging(spdlog::level::level_enum level = spdlog::level::info);

/// Parses a log level string to spdlog level enum.
/// \param str Log level string ("trace", "debug", "info", "warn", "error", "off")
/// \return Parsed log level, or spdlog::level::info if unrecognized
MAPBEARING_API spdlog::level::level_enum ParseLogLevel(const std::string& str);

} // namespace MapBearing
