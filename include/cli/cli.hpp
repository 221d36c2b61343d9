#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "codec/codec_error.hpp"
#include "metadata/metadata_editor.hpp"
#include "tagger/batch_runner.hpp"

namespace xdf {
namespace cli {

class UsageError : public XdfError {
public:
  explicit UsageError(const std::string& message) : XdfError(message) {}
};

// Everything configurable from the command line
struct TaggerOptions {
  metadata::EditDirectives directives;
  std::string suffix{".processed"};
  bool inplace{false};
  bool process_suffixed{false};
  bool overwrite{false};
  std::size_t jobs{1};
  std::string loglevel{"INFO"};
  std::string logfile;
  std::vector<std::string> paths;
  bool help{false};
};

// ---- COMMAND LINE ----
// Parses argv[1..], throws UsageError
TaggerOptions parse_command_line(const std::vector<std::string>& args);
void print_usage(std::ostream& out, const std::string& program_name);

// ---- PATHS ----
// Expands glob patterns; a pattern without matches is kept as given
std::vector<std::string> expand_paths(const std::vector<std::string>& patterns);
// True if path already carries "<suffix>.xdf"
bool has_processed_suffix(const std::filesystem::path& path, const std::string& suffix);
// Where the result for inpath goes; empty in read-only mode
std::optional<std::filesystem::path> output_path_for(const std::filesystem::path& inpath,
                                                     const TaggerOptions& options);

class CLI {
public:
  // ---- CONSTRUCTOR ----
  explicit CLI(TaggerOptions options, std::ostream& out);


  // ---- STARTUP ----
  // Processes every matching file, returns the process exit status
  int run();

  // Input/output pairs after expansion and suffix filtering
  std::vector<tagger::FileJob> plan_jobs() const;

private:
  TaggerOptions options_;
  std::ostream& out_;
};

} // namespace cli
} // namespace xdf
