#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>

namespace xdf {
namespace logging {

namespace {

auto log_format() {
  namespace expr = boost::log::expressions;
  return expr::stream
      << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
      << " [" << boost::log::trivial::severity << "] "
      << expr::smessage;
}

} // namespace

std::optional<severity_level> parse_severity(const std::string& name) {
  std::string upper(name);
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  if (upper == "ERROR") return severity_level::error;
  if (upper == "WARN" || upper == "WARNING") return severity_level::warning;
  if (upper == "INFO") return severity_level::info;
  if (upper == "DEBUG") return severity_level::debug;
  if (upper == "TRACE" || upper == "SUPERVERBOSE" || upper == "NOTSET") return severity_level::trace;
  return std::nullopt;
}

void init_logging(severity_level min_level, const std::string& log_file) {
  namespace keywords = boost::log::keywords;

  try {
    // Clear any existing sinks
    boost::log::core::get()->remove_all_sinks();
    boost::log::add_common_attributes();

    boost::log::add_console_log(
      std::clog,
      keywords::format = log_format(),
      keywords::auto_flush = true
    );

    if (!log_file.empty()) {
      const std::filesystem::path log_path = std::filesystem::absolute(log_file);
      boost::log::add_file_log(
        keywords::file_name = log_path.string(),
        keywords::format = log_format(),
        keywords::open_mode = std::ios::out | std::ios::app,
        keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
        keywords::auto_flush = true
      );
    }

    set_log_level(min_level);
    boost::log::core::get()->set_logging_enabled(true);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void set_log_level(severity_level min_level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

} // namespace logging
} // namespace xdf
