#ifndef XDF_CONTAINER_STREAM_LOCATOR_HPP
#define XDF_CONTAINER_STREAM_LOCATOR_HPP

#include <cstdint>
#include <istream>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include "codec/chunk_frame.hpp"
#include "container/resync_scanner.hpp"

namespace xdf {
namespace container {

// [MagicCode] at the start of every XDF file
constexpr char MAGIC_CODE[] = {'X', 'D', 'F', ':'};
constexpr std::size_t MAGIC_CODE_SIZE = sizeof(MAGIC_CODE);

// Where the metadata chunk is, or where a new one goes
struct MetadataLocation {
  std::string content;
  std::optional<uint64_t> begin_offset;
  uint64_t byte_length{0};   // 0 when the chunk must be inserted
  uint32_t stream_id{0};
  bool synthesized{false};
  bool duplicate_found{false};

  uint64_t begin() const { return begin_offset.value_or(0); }
  uint64_t end() const { return begin() + byte_length; }
};

// ---- CHUNK EVENTS ----
// StreamHeader chunk, fully read
struct HeaderChunk {
  uint64_t begin;
  uint64_t end;
  uint32_t stream_id;
  std::string text;
};
// Samples or StreamFooter chunk: the header section is over
struct DataBoundary {
  uint64_t begin;
  uint16_t tag;
};
// Any other chunk, skipped unread
struct OpaqueChunk {
  uint64_t begin;
  codec::FrameHeader header;
};
// No further chunk could be decoded
struct EndOfStream {
  uint64_t position;
};
using ChunkEvent = std::variant<HeaderChunk, DataBoundary, OpaqueChunk, EndOfStream>;

// Accumulated result of the header-section traversal
struct ScanState {
  enum class Phase { SCANNING_HEADERS, DONE };

  struct FoundMetadata {
    uint64_t begin;
    uint64_t length;
    std::string content;
    uint32_t stream_id;
  };

  Phase phase{Phase::SCANNING_HEADERS};
  std::optional<uint64_t> streamheaders_begin;
  std::optional<FoundMetadata> metadata;
  std::set<uint32_t> other_stream_ids;
  bool duplicate_metadata_seen{false};
  uint64_t stop_position{0};
};

class StreamLocator {
public:
  // A malformed length closer than this to the end of the file is taken as
  // ordinary truncation rather than corruption
  static constexpr uint64_t NEAR_EOF_MARGIN = 1024;
  // Range for stream ids of synthesized metadata streams
  static constexpr uint32_t SYNTHETIC_ID_MIN = 10000;
  static constexpr uint32_t SYNTHETIC_ID_MAX = 99999;

  // ---- CONSTRUCTOR ----
  // source_name is only used in log messages and errors
  explicit StreamLocator(std::string source_name, ResyncScanner scanner = ResyncScanner());


  // ---- LOCATING ----
  // Scans the header section of input. The read position of input is
  // restored before returning. Throws InvalidContainerError.
  MetadataLocation locate(std::istream& input) const;


  // ---- TRAVERSAL STEPS ----
  // Decodes the next chunk, resynchronizing past corrupted lengths
  ChunkEvent next_event(std::istream& input, uint64_t file_size) const;
  // Folds one chunk event into the scan state
  ScanState fold(ScanState state, const ChunkEvent& event) const;
  // Turns the final scan state into a location, synthesizing one if needed
  MetadataLocation finish(ScanState state) const;

private:
  std::string source_name_;
  ResyncScanner scanner_;

  void check_magic_code(std::istream& input) const;
  static uint32_t allocate_stream_id(const std::set<uint32_t>& taken);
};

} // namespace container
} // namespace xdf

#endif // XDF_CONTAINER_STREAM_LOCATOR_HPP
