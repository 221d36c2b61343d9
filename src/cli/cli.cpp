#include "cli/cli.hpp"
#include "logger/logger.hpp"
#include "tagger/file_processor.hpp"
#include <boost/log/trivial.hpp>
#include <glob.h>
#include <unordered_map>

namespace xdf {
namespace cli {

namespace fs = std::filesystem;

namespace {

constexpr const char* XDF_EXTENSION = ".xdf";

enum class Flag { SET, CLEAR, SHOW, SUFFIX, INPLACE, PROCESS_SUFFIXED, OVERWRITE, JOBS, LOGLEVEL, LOGFILE, HELP };

const std::unordered_map<std::string, Flag> flag_map = {
  {"--set", Flag::SET},
  {"--clear", Flag::CLEAR},
  {"--show", Flag::SHOW},
  {"--suffix", Flag::SUFFIX},
  {"--inplace", Flag::INPLACE},
  {"--process-suffixed", Flag::PROCESS_SUFFIXED},
  {"--overwrite", Flag::OVERWRITE},
  {"-j", Flag::JOBS},
  {"--jobs", Flag::JOBS},
  {"--loglevel", Flag::LOGLEVEL},
  {"--logfile", Flag::LOGFILE},
  {"-h", Flag::HELP},
  {"--help", Flag::HELP}
};

bool takes_value(Flag flag) {
  return flag != Flag::INPLACE && flag != Flag::PROCESS_SUFFIXED && flag != Flag::OVERWRITE && flag != Flag::HELP;
}

std::pair<std::string, std::string> split_assignment(const std::string& assignment) {
  const auto eq = assignment.find('=');
  if (eq == std::string::npos || eq == 0) {
    throw UsageError("--set expects name=value, got '" + assignment + "'");
  }
  return {assignment.substr(0, eq), assignment.substr(eq + 1)};
}

std::size_t parse_jobs(const std::string& value) {
  try {
    std::size_t used = 0;
    const long jobs = std::stol(value, &used);
    if (used == value.size() && jobs >= 1) {
      return static_cast<std::size_t>(jobs);
    }
  } catch (const std::exception&) {
    // reported below
  }
  throw UsageError("Invalid number of jobs: " + value);
}

} // namespace

//==============================================
// COMMAND LINE
//==============================================

TaggerOptions parse_command_line(const std::vector<std::string>& args) {
  TaggerOptions options;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];

    // Accept --flag=value as well as --flag value
    std::string name = arg;
    std::optional<std::string> inline_value;
    if (arg.rfind("--", 0) == 0) {
      const auto eq = arg.find('=');
      if (eq != std::string::npos) {
        name = arg.substr(0, eq);
        inline_value = arg.substr(eq + 1);
      }
    }

    if (name.empty() || name[0] != '-' || name == "-") {
      options.paths.push_back(arg);
      continue;
    }

    const auto it = flag_map.find(name);
    if (it == flag_map.end()) {
      throw UsageError("Unknown argument: " + arg);
    }
    const Flag flag = it->second;

    std::string value;
    if (takes_value(flag)) {
      if (inline_value) {
        value = *inline_value;
      } else if (i + 1 < args.size()) {
        value = args[++i];
      } else {
        throw UsageError("Missing value for " + name);
      }
    } else if (inline_value) {
      throw UsageError(name + " does not take a value");
    }

    switch (flag) {
      case Flag::SET: options.directives.to_set.push_back(split_assignment(value)); break;
      case Flag::CLEAR: options.directives.to_clear.push_back(value); break;
      case Flag::SHOW: options.directives.to_show.push_back(value); break;
      case Flag::SUFFIX: options.suffix = value; break;
      case Flag::INPLACE: options.inplace = true; break;
      case Flag::PROCESS_SUFFIXED: options.process_suffixed = true; break;
      case Flag::OVERWRITE: options.overwrite = true; break;
      case Flag::JOBS: options.jobs = parse_jobs(value); break;
      case Flag::LOGLEVEL:
        if (!logging::parse_severity(value)) {
          throw UsageError("Invalid log level: " + value);
        }
        options.loglevel = value;
        break;
      case Flag::LOGFILE: options.logfile = value; break;
      case Flag::HELP: options.help = true; break;
    }
  }

  if (!options.help && options.paths.empty()) {
    throw UsageError("At least one file path is required");
  }
  return options;
}

void print_usage(std::ostream& out, const std::string& program_name) {
  out << "Usage: " << program_name << " [options] PATH...\n"
      << "Manage XDF tags. Tags are written into a stream named Metadata, of type\n"
      << "Metadata, which is created if not already present. --set and --clear may\n"
      << "be given several times to edit several tags in one run.\n\n"
      << "Options:\n"
      << "  --set name=value     Set or override the given tag\n"
      << "  --clear name         Clear the tag of the given name. A file without a\n"
      << "                       Metadata stream gets none if nothing else changes\n"
      << "  --show name          Show the value of the given tag\n"
      << "  --suffix S           Suffix spliced in before the .xdf ending\n"
      << "                       (default .processed, ignored with --inplace)\n"
      << "  --inplace            Process files in place\n"
      << "  --process-suffixed   Also process files that already have the suffix\n"
      << "  --overwrite          Allow overwriting existing output files\n"
      << "  -j, --jobs N         Number of files processed in parallel (default 1)\n"
      << "  --loglevel LEVEL     ERROR, WARN, INFO, DEBUG or TRACE (default INFO)\n"
      << "  --logfile PATH       Also write the log to PATH\n"
      << "  -h, --help           Show this message\n\n"
      << "Example:\n"
      << "  " << program_name << " --set subject.name=\"My Name\" --set subject.id=subj001 \\\n"
      << "      --clear subject.handedness --show subject.age *.xdf\n";
}


//==============================================
// PATHS
//==============================================

std::vector<std::string> expand_paths(const std::vector<std::string>& patterns) {
  std::vector<std::string> results;

  for (const auto& pattern : patterns) {
    glob_t matches{};
    const int rc = ::glob(pattern.c_str(), 0, nullptr, &matches);
    if (rc == 0) {
      for (std::size_t i = 0; i < matches.gl_pathc; ++i) {
        results.emplace_back(matches.gl_pathv[i]);
      }
    } else if (rc == GLOB_NOMATCH) {
      results.push_back(pattern);
    } else {
      BOOST_LOG_TRIVIAL(error) << "CLI: Failed to expand pattern " << pattern << " (glob error " << rc << ")";
      results.push_back(pattern);
    }
    ::globfree(&matches);
  }
  return results;
}

bool has_processed_suffix(const fs::path& path, const std::string& suffix) {
  if (suffix.empty()) {
    return false;
  }
  const std::string tail = suffix + XDF_EXTENSION;
  const std::string name = path.filename().string();
  return name.size() >= tail.size() && name.compare(name.size() - tail.size(), tail.size(), tail) == 0;
}

std::optional<fs::path> output_path_for(const fs::path& inpath, const TaggerOptions& options) {
  if (!options.directives.modifies()) {
    return std::nullopt;
  }
  if (options.inplace || options.suffix.empty()) {
    return inpath;
  }
  fs::path outpath = inpath;
  outpath.replace_filename(inpath.stem().string() + options.suffix + inpath.extension().string());
  return outpath;
}


//==============================================
// CLI
//==============================================

CLI::CLI(TaggerOptions options, std::ostream& out)
  : options_(std::move(options))
  , out_(out) {}

std::vector<tagger::FileJob> CLI::plan_jobs() const {
  std::vector<tagger::FileJob> jobs;

  for (const auto& path : expand_paths(options_.paths)) {
    // skip files that have our suffix
    if (!options_.process_suffixed && has_processed_suffix(path, options_.suffix)) {
      BOOST_LOG_TRIVIAL(debug) << "CLI: Skipping already processed file " << path;
      continue;
    }
    jobs.push_back(tagger::FileJob{path, output_path_for(path, options_)});
  }
  return jobs;
}

int CLI::run() {
  const std::vector<tagger::FileJob> jobs = plan_jobs();
  if (jobs.empty()) {
    BOOST_LOG_TRIVIAL(warning) << "CLI: No files to process";
    return 0;
  }

  const metadata::MetadataEditor editor(options_.directives, out_);
  const tagger::FileProcessor processor(editor.as_transform(), options_.overwrite || options_.inplace);
  const tagger::BatchRunner runner(processor, options_.jobs);

  const tagger::BatchSummary summary = runner.run(jobs);
  return summary.ok() ? 0 : 1;
}

} // namespace cli
} // namespace xdf
