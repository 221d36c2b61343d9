#ifndef XDF_LOGGER_HPP
#define XDF_LOGGER_HPP

#include <optional>
#include <string>
#include <boost/log/trivial.hpp>

namespace xdf {
namespace logging {

using severity_level = boost::log::trivial::severity_level;

// Maps ERROR, WARN, WARNING, INFO, DEBUG, TRACE, SUPERVERBOSE and NOTSET
// (case-insensitive) to a severity level
std::optional<severity_level> parse_severity(const std::string& name);

// Installs a console sink on stderr and, when log_file is not empty, a text
// file sink. Replaces sinks from a previous call.
void init_logging(severity_level min_level = severity_level::info,
                  const std::string& log_file = "");

// Changes the global severity filter
void set_log_level(severity_level min_level);

} // namespace logging
} // namespace xdf

#endif // XDF_LOGGER_HPP
