#include <gtest/gtest.h>
#include <filesystem>
#include "logger/logger.hpp"
#include "test_utils.hpp"

namespace fs = std::filesystem;
using xdf::logging::parse_severity;
using xdf::logging::severity_level;

TEST(LoggerTest, ParsesSeverityNames) {
  EXPECT_EQ(parse_severity("ERROR"), severity_level::error);
  EXPECT_EQ(parse_severity("warn"), severity_level::warning);
  EXPECT_EQ(parse_severity("Warning"), severity_level::warning);
  EXPECT_EQ(parse_severity("INFO"), severity_level::info);
  EXPECT_EQ(parse_severity("debug"), severity_level::debug);
  EXPECT_EQ(parse_severity("TRACE"), severity_level::trace);
  EXPECT_EQ(parse_severity("SUPERVERBOSE"), severity_level::trace);
  EXPECT_EQ(parse_severity("NOTSET"), severity_level::trace);
  EXPECT_FALSE(parse_severity("LOUD").has_value());
  EXPECT_FALSE(parse_severity("").has_value());
}

TEST(LoggerTest, WritesToLogFile) {
  const fs::path dir = make_temp_dir("logger_test");
  const fs::path log_path = dir / "run.log";

  xdf::logging::init_logging(severity_level::info, log_path.string());
  BOOST_LOG_TRIVIAL(debug) << "filtered out";
  BOOST_LOG_TRIVIAL(warning) << "LoggerTest: file sink works";
  boost::log::core::get()->remove_all_sinks();

  const std::string text = read_file(log_path);
  EXPECT_NE(text.find("LoggerTest: file sink works"), std::string::npos);
  EXPECT_NE(text.find("[warning]"), std::string::npos);
  EXPECT_EQ(text.find("filtered out"), std::string::npos);

  init_logging();
  fs::remove_all(dir);
}

TEST(LoggerTest, LevelCanBeChanged) {
  init_logging();
  LogCapture capture;

  xdf::logging::set_log_level(severity_level::error);
  BOOST_LOG_TRIVIAL(warning) << "hidden";
  xdf::logging::set_log_level(severity_level::info);
  BOOST_LOG_TRIVIAL(warning) << "visible";

  EXPECT_EQ(capture.text().find("hidden"), std::string::npos);
  EXPECT_NE(capture.text().find("visible"), std::string::npos);
}
