#ifndef FDFS_LOGGER_HPP
#define FDFS_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace fdfs {
namespace logger {

using severity_level = boost::log::trivial::severity_level;

// Replaces all sinks with a text file sink
void init_logging(const std::string& log_file = "fdfs_client.log",
                  severity_level min_level = boost::log::trivial::info);

// Replaces all sinks with a console sink on std::clog
void init_console_logging(severity_level min_level = boost::log::trivial::warning);

void set_log_level(severity_level min_level);

// "trace" .. "fatal", case insensitive; throws ConfigError otherwise
severity_level parse_severity(const std::string& text);

} // namespace logger
} // namespace fdfs

#endif // FDFS_LOGGER_HPP
