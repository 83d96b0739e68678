#pragma once

#include <boost/log/trivial.hpp>
#include <string>

namespace olr {

/// @brief Converts a level name (trace, debug, info, warning, error, fatal).
/// @throw ConfigurationError if the name is unknown.
auto parse_severity(const std::string &name)
    -> boost::log::trivial::severity_level;

/// @brief Sets the minimum severity of the records kept by every sink.
auto set_logging_level(boost::log::trivial::severity_level level) -> void;

/// @brief Configures logging for the command line tool.
///
/// Records go to the console. When a directory is given, they are also
/// written to olr_<YYYYmmdd_HHMMSS>.log in that directory, which is created
/// if needed.
///
/// @param[in] level Minimum severity of the records.
/// @param[in] directory Directory of the log file, or an empty string.
/// @return The path of the log file, or an empty string.
auto init_logging(boost::log::trivial::severity_level level,
                  const std::string &directory = {}) -> std::string;

/// @brief Flushes the file sink, if any.
auto flush_logs() -> void;

}  // namespace olr
