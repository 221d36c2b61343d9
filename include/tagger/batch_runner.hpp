#ifndef XDF_TAGGER_BATCH_RUNNER_HPP
#define XDF_TAGGER_BATCH_RUNNER_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <vector>
#include "tagger/file_processor.hpp"

namespace xdf {
namespace tagger {

struct FileJob {
  std::filesystem::path input;
  std::optional<std::filesystem::path> output;
};

struct BatchSummary {
  std::size_t succeeded{0};
  std::size_t failed{0};

  bool ok() const { return failed == 0; }
};

// Processes many files, each independently. A failing file is logged and
// does not stop the others.
class BatchRunner {
public:
  // ---- CONSTRUCTOR ----
  // jobs is the number of worker threads, 1 runs everything on the caller
  BatchRunner(const FileProcessor& processor, std::size_t jobs);


  // ---- EXECUTION ----
  BatchSummary run(const std::vector<FileJob>& files) const;

private:
  const FileProcessor& processor_;
  std::size_t jobs_;

  // Returns false when the file failed
  bool run_one(const FileJob& job) const;
};

} // namespace tagger
} // namespace xdf

#endif // XDF_TAGGER_BATCH_RUNNER_HPP
