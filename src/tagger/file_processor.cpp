#include "tagger/file_processor.hpp"
#include "codec/codec_error.hpp"
#include "container/container_error.hpp"
#include "container/splice_writer.hpp"
#include <boost/log/trivial.hpp>
#include <fstream>
#include <random>

namespace xdf {
namespace tagger {

namespace fs = std::filesystem;

//==============================================
// CONSTRUCTOR
//==============================================

FileProcessor::FileProcessor(metadata::TransformFn transform, bool overwrite)
  : transform_(std::move(transform))
  , overwrite_(overwrite) {}


//==============================================
// PROCESSING
//==============================================

ProcessResult FileProcessor::process(const fs::path& inpath, const std::optional<fs::path>& outpath) const {
  BOOST_LOG_TRIVIAL(info) << "FileProcessor: Processing file " << inpath.string() << "...";

  const bool inplace = outpath && fs::weakly_canonical(*outpath) == fs::weakly_canonical(inpath);
  if (outpath && !inplace && !overwrite_ && fs::exists(*outpath)) {
    BOOST_LOG_TRIVIAL(error) << "FileProcessor: Refusing to overwrite " << outpath->string();
    throw container::OutputExistsError(outpath->string());
  }

  std::error_code ec;
  const uint64_t in_size = fs::file_size(inpath, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "FileProcessor: Cannot stat " << inpath.string() << ": " << ec.message();
    throw codec::IoError("Cannot read " + inpath.string() + ": " + ec.message());
  }

  std::ifstream input(inpath, std::ios::binary);
  if (!input) {
    throw codec::IoError("Failed to open input file: " + inpath.string());
  }

  // first read in the metadata chunk and note its place in the file
  const container::StreamLocator locator(inpath.string());
  const container::MetadataLocation location = locator.locate(input);

  // process the content
  const std::string new_content = transform_(location.content);

  ProcessResult result;
  result.changed = new_content != location.content;
  result.inserted = location.synthesized && result.changed;

  if (!outpath) {
    BOOST_LOG_TRIVIAL(debug) << "FileProcessor: Read-only run, no output written for " << inpath.string();
    return result;
  }

  write_output(input, in_size, location, new_content, *outpath);
  result.written = true;
  BOOST_LOG_TRIVIAL(info) << "FileProcessor: Wrote " << outpath->string()
                          << (result.changed ? "" : " (metadata unchanged)");
  return result;
}

void FileProcessor::write_output(std::istream& input, uint64_t in_size, const container::MetadataLocation& location,
                                 const std::string& new_content, const fs::path& outpath) const {
  const fs::path temp_path = temp_path_for(outpath);
  BOOST_LOG_TRIVIAL(debug) << "FileProcessor: Writing to temporary file " << temp_path.string();

  try {
    {
      std::ofstream output(temp_path, std::ios::binary | std::ios::trunc);
      if (!output) {
        throw codec::IoError("Failed to create output file: " + temp_path.string());
      }
      container::SpliceWriter::splice(input, in_size, location, new_content, output);
      output.close();
      if (output.fail()) {
        throw codec::IoError("Failed to close output file: " + temp_path.string());
      }
    }

    // promote the finished file
    std::error_code ec;
    fs::rename(temp_path, outpath, ec);
    if (ec) {
      throw codec::IoError("Failed to rename " + temp_path.string() + " to " + outpath.string() + ": " + ec.message());
    }
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "FileProcessor: Discarding partial output " << temp_path.string() << ": " << e.what();
    std::error_code ec;
    if (!fs::remove(temp_path, ec) && ec) {
      BOOST_LOG_TRIVIAL(warning) << "FileProcessor: Could not remove " << temp_path.string() << ": " << ec.message();
    }
    throw;
  }
}

fs::path FileProcessor::temp_path_for(const fs::path& final_path) {
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<int> dis(10000, 99999);

  while (true) {
    fs::path candidate = final_path;
    candidate += "." + std::to_string(dis(gen)) + ".tmp";
    if (!fs::exists(candidate)) {
      return candidate;
    }
  }
}

} // namespace tagger
} // namespace xdf
