#include "codec/chunk_frame.hpp"
#include "codec/codec_error.hpp"
#include "codec/varlen_int.hpp"
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>

namespace xdf {
namespace codec {

const char* chunk_tag_to_string(uint16_t tag) {
  switch (static_cast<ChunkTag>(tag)) {
    case ChunkTag::FILE_HEADER: return "FileHeader";
    case ChunkTag::STREAM_HEADER: return "StreamHeader";
    case ChunkTag::SAMPLES: return "Samples";
    case ChunkTag::CLOCK_OFFSET: return "ClockOffset";
    case ChunkTag::BOUNDARY: return "Boundary";
    case ChunkTag::STREAM_FOOTER: return "StreamFooter";
    default: return "Unknown";
  }
}


//==============================================
// WRITING
//==============================================

std::size_t ChunkFrame::write_chunk(std::ostream& output, uint16_t tag, const std::string& content) {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "ChunkFrame: Invalid output stream state";
    throw IoError("ChunkFrame: Invalid output stream");
  }

  const uint64_t length = content.size() + TAG_SIZE;
  BOOST_LOG_TRIVIAL(debug) << "ChunkFrame: Writing " << chunk_tag_to_string(tag)
                           << " chunk, length=" << length;

  // Write [NumLengthBytes] and [Length]
  VarLenInt::encode(length, output);

  // Write [Tag]
  const uint16_t le_tag = boost::endian::native_to_little(tag);
  if (!output.write(reinterpret_cast<const char*>(&le_tag), sizeof(le_tag))) {
    throw IoError("ChunkFrame: Failed to write chunk tag");
  }

  // Write [Content]
  if (!output.write(content.data(), static_cast<std::streamsize>(content.size()))) {
    BOOST_LOG_TRIVIAL(error) << "ChunkFrame: Failed to write " << content.size() << " content bytes";
    throw IoError("ChunkFrame: Failed to write chunk content");
  }

  return VarLenInt::encoded_size(length) + static_cast<std::size_t>(length);
}


//==============================================
// READING
//==============================================

FrameHeader ChunkFrame::read_frame_header(std::istream& input) {
  FrameHeader header{};
  header.length = VarLenInt::decode(input);

  if (header.length < TAG_SIZE) {
    BOOST_LOG_TRIVIAL(debug) << "ChunkFrame: Chunk length " << header.length << " is shorter than its tag";
    throw MalformedLengthError("chunk length " + std::to_string(header.length) + " below tag size");
  }

  uint16_t le_tag = 0;
  if (!input.read(reinterpret_cast<char*>(&le_tag), sizeof(le_tag))) {
    BOOST_LOG_TRIVIAL(debug) << "ChunkFrame: Stream ended while reading chunk tag";
    throw MalformedLengthError("stream ended while reading chunk tag");
  }
  header.tag = boost::endian::little_to_native(le_tag);
  return header;
}

std::string ChunkFrame::read_content(std::istream& input, const FrameHeader& header) {
  const uint64_t size = header.content_length();
  std::string content;
  content.resize(static_cast<std::size_t>(size));

  if (size > 0 && !input.read(&content[0], static_cast<std::streamsize>(size))) {
    BOOST_LOG_TRIVIAL(debug) << "ChunkFrame: Read " << input.gcount() << " of " << size << " content bytes";
    throw IoError("ChunkFrame: Chunk content truncated");
  }
  return content;
}

} // namespace codec
} // namespace xdf
