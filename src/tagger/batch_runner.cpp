#include "tagger/batch_runner.hpp"
#include <algorithm>
#include <atomic>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/log/trivial.hpp>

namespace xdf {
namespace tagger {

BatchRunner::BatchRunner(const FileProcessor& processor, std::size_t jobs)
  : processor_(processor)
  , jobs_(std::max<std::size_t>(jobs, 1)) {}

BatchSummary BatchRunner::run(const std::vector<FileJob>& files) const {
  BOOST_LOG_TRIVIAL(info) << "BatchRunner: Processing " << files.size() << " file(s) with "
                          << jobs_ << " worker(s)";

  std::atomic<std::size_t> succeeded{0};
  std::atomic<std::size_t> failed{0};

  if (jobs_ == 1 || files.size() <= 1) {
    for (const auto& job : files) {
      ++(run_one(job) ? succeeded : failed);
    }
  } else {
    boost::asio::thread_pool pool(std::min(jobs_, files.size()));
    for (const auto& job : files) {
      boost::asio::post(pool, [this, &job, &succeeded, &failed]() {
        ++(run_one(job) ? succeeded : failed);
      });
    }
    pool.join();
  }

  BatchSummary summary;
  summary.succeeded = succeeded.load();
  summary.failed = failed.load();
  BOOST_LOG_TRIVIAL(info) << "BatchRunner: " << summary.succeeded << " succeeded, " << summary.failed << " failed";
  return summary;
}

bool BatchRunner::run_one(const FileJob& job) const {
  try {
    processor_.process(job.input, job.output);
    return true;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "BatchRunner: Failed to process " << job.input.string() << ": " << e.what();
    return false;
  }
}

} // namespace tagger
} // namespace xdf
