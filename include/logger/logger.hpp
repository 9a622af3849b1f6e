#ifndef GRIDSTORE_LOGGER_HPP
#define GRIDSTORE_LOGGER_HPP

#include <optional>
#include <string>
#include <boost/log/trivial.hpp>

namespace gridstore {
namespace logging {

using severity_level = boost::log::trivial::severity_level;

// Replaces all sinks with a synchronous text file sink writing
// "timestamp [severity] message" lines, flushed after every record
void init_logging(const std::string& log_file, severity_level min_level = boost::log::trivial::info);

// Replaces all sinks with a console (stderr) sink
void init_console_logging(severity_level min_level = boost::log::trivial::warning);

// Sets the minimum severity of the core filter
void set_log_level(severity_level level);

// Parses "trace", "debug", "info", "warning", "error" or "fatal"
std::optional<severity_level> parse_log_level(const std::string& name);

} // namespace logging
} // namespace gridstore

#endif // GRIDSTORE_LOGGER_HPP
