#ifndef XDF_CODEC_CHUNK_FRAME_HPP
#define XDF_CODEC_CHUNK_FRAME_HPP

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>

namespace xdf {
namespace codec {

// XDF chunk tags. Only StreamHeader, Samples and StreamFooter are interpreted,
// the others are named for logging
enum class ChunkTag : uint16_t {
    FILE_HEADER = 1,
    STREAM_HEADER = 2,
    SAMPLES = 3,
    CLOCK_OFFSET = 4,
    BOUNDARY = 5,
    STREAM_FOOTER = 6
};

const char* chunk_tag_to_string(uint16_t tag);

// Size of the tag field, counted in the chunk length
constexpr uint64_t TAG_SIZE = sizeof(uint16_t);

// Decoded [Length][Tag] prefix of a chunk
struct FrameHeader {
    uint64_t length;  // tag + content bytes
    uint16_t tag;

    uint64_t content_length() const { return length - TAG_SIZE; }
    bool is(ChunkTag t) const { return tag == static_cast<uint16_t>(t); }
};

class ChunkFrame {
public:
  // ---- WRITING ----
  // Writes [Length][Tag][Content], returns the number of bytes written
  static std::size_t write_chunk(std::ostream& output, uint16_t tag, const std::string& content);
  static std::size_t write_chunk(std::ostream& output, ChunkTag tag, const std::string& content) {
    return write_chunk(output, static_cast<uint16_t>(tag), content);
  }


  // ---- READING ----
  // Reads [Length][Tag] and leaves the stream at the first content byte.
  // Throws MalformedLengthError; the stream position is unspecified afterwards
  static FrameHeader read_frame_header(std::istream& input);
  // Reads exactly header.content_length() bytes, throws IoError when short
  static std::string read_content(std::istream& input, const FrameHeader& header);
};

} // namespace codec
} // namespace xdf

#endif // XDF_CODEC_CHUNK_FRAME_HPP
