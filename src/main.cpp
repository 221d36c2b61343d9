#include "cli/cli.hpp"
#include "logger/logger.hpp"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
  const std::string program_name = argc > 0 ? argv[0] : "xdftag";
  const std::vector<std::string> args(argc > 1 ? argv + 1 : argv + argc, argv + argc);

  xdf::cli::TaggerOptions options;
  try {
    options = xdf::cli::parse_command_line(args);
  } catch (const xdf::cli::UsageError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    xdf::cli::print_usage(std::cerr, program_name);
    return 2;
  }

  if (options.help) {
    xdf::cli::print_usage(std::cout, program_name);
    return 0;
  }

  try {
    const auto level = xdf::logging::parse_severity(options.loglevel);
    xdf::logging::init_logging(level.value_or(xdf::logging::severity_level::info), options.logfile);

    xdf::cli::CLI cli(options, std::cout);
    return cli.run();
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }
}
