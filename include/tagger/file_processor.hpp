#ifndef XDF_TAGGER_FILE_PROCESSOR_HPP
#define XDF_TAGGER_FILE_PROCESSOR_HPP

#include <filesystem>
#include <optional>
#include "container/stream_locator.hpp"
#include "metadata/metadata_editor.hpp"

namespace xdf {
namespace tagger {

struct ProcessResult {
  bool written{false};   // an output file was produced
  bool changed{false};   // the metadata content differs from the input
  bool inserted{false};  // the metadata chunk did not exist before
};

// Runs locate -> transform -> splice for one file
class FileProcessor {
public:
  // ---- CONSTRUCTOR ----
  FileProcessor(metadata::TransformFn transform, bool overwrite);


  // ---- PROCESSING ----
  // Without outpath only the transform runs and nothing is written. The
  // output is written to a temporary sibling of outpath and renamed onto it
  // once complete, so outpath may equal inpath. Throws XdfError subclasses.
  ProcessResult process(const std::filesystem::path& inpath,
                        const std::optional<std::filesystem::path>& outpath) const;

  // Unused "<path>.<5 digits>.tmp" name next to final_path
  static std::filesystem::path temp_path_for(const std::filesystem::path& final_path);

private:
  metadata::TransformFn transform_;
  bool overwrite_;

  void write_output(std::istream& input, uint64_t in_size, const container::MetadataLocation& location,
                    const std::string& new_content, const std::filesystem::path& outpath) const;
};

} // namespace tagger
} // namespace xdf

#endif // XDF_TAGGER_FILE_PROCESSOR_HPP
