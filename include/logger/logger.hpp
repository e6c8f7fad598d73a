#ifndef MAILCHUNK_LOGGER_HPP
#define MAILCHUNK_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace mailchunk {
namespace logging {

using severity_level = boost::log::trivial::severity_level;

// Records below this level are dropped unless configured otherwise
inline constexpr severity_level DEFAULT_LEVEL = boost::log::trivial::warning;

// Replaces all sinks with a timestamped file sink
void init_logging(const std::string& log_file = "mailchunk.log",
                  severity_level min_level = DEFAULT_LEVEL);
// Replaces all sinks with a console sink on stderr
void init_console_logging(severity_level min_level = DEFAULT_LEVEL);

void set_log_level(severity_level min_level);

// "trace", "debug", "info", "warning", "error" or "fatal".
// Throws config::ConfigurationError for anything else.
severity_level parse_severity(const std::string& name);

} // namespace logging
} // namespace mailchunk

#endif // MAILCHUNK_LOGGER_HPP
