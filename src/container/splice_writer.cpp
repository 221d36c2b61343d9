#include "container/splice_writer.hpp"
#include "codec/chunk_frame.hpp"
#include "codec/codec_error.hpp"
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>
#include <array>

namespace xdf {
namespace container {

//==============================================
// SPLICING
//==============================================

uint64_t SpliceWriter::splice(std::istream& input, uint64_t file_size, const MetadataLocation& location,
                              const std::string& new_content, std::ostream& output) {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "SpliceWriter: Invalid output stream state";
    throw codec::IoError("SpliceWriter: Invalid output stream");
  }
  if (location.end() > file_size) {
    BOOST_LOG_TRIVIAL(error) << "SpliceWriter: Metadata span [" << location.begin() << ", " << location.end()
                             << ") exceeds file size " << file_size;
    throw codec::IoError("SpliceWriter: Metadata span exceeds input size");
  }

  input.clear();
  input.seekg(0);

  if (new_content == location.content) {
    // no data change, just copy the file
    BOOST_LOG_TRIVIAL(info) << "SpliceWriter: Metadata unchanged, copying " << file_size << " bytes verbatim";
    copy_range(input, output, file_size);
    output.flush();
    return file_size;
  }

  // first copy the part preceding the metadata chunk
  copy_range(input, output, location.begin());

  // write the new metadata chunk
  const std::size_t chunk_bytes = codec::ChunkFrame::write_chunk(
    output, codec::ChunkTag::STREAM_HEADER, stream_header_content(location.stream_id, new_content));

  // skip original version of the chunk in the input
  input.seekg(static_cast<std::streamoff>(location.end()));

  // finally copy the remainder of the file
  copy_range(input, output, file_size - location.end());
  output.flush();
  if (!output.good()) {
    throw codec::IoError("SpliceWriter: Failed to flush output stream");
  }

  const uint64_t total = file_size - location.byte_length + chunk_bytes;
  BOOST_LOG_TRIVIAL(info) << "SpliceWriter: " << (location.synthesized ? "Inserted" : "Replaced")
                          << " metadata chunk at offset " << location.begin() << " (" << location.byte_length
                          << " -> " << chunk_bytes << " bytes), wrote " << total << " bytes";
  return total;
}


//==============================================
// BYTE COPYING
//==============================================

void SpliceWriter::copy_range(std::istream& input, std::ostream& output, uint64_t length) {
  std::array<char, BLOCK_SIZE> buffer;

  while (length > 0) {
    const std::size_t block = length >= BLOCK_SIZE ? BLOCK_SIZE : static_cast<std::size_t>(length);
    if (!input.read(buffer.data(), static_cast<std::streamsize>(block))) {
      BOOST_LOG_TRIVIAL(error) << "SpliceWriter: Read " << input.gcount() << " of " << block << " bytes";
      throw codec::IoError("SpliceWriter: Unexpected end of input");
    }
    if (!output.write(buffer.data(), static_cast<std::streamsize>(block))) {
      BOOST_LOG_TRIVIAL(error) << "SpliceWriter: Failed to write " << block << " bytes to output stream";
      throw codec::IoError("SpliceWriter: Failed to write to output stream");
    }
    length -= block;
  }
}

std::string SpliceWriter::stream_header_content(uint32_t stream_id, const std::string& text) {
  const uint32_t le_stream_id = boost::endian::native_to_little(stream_id);
  std::string content(reinterpret_cast<const char*>(&le_stream_id), sizeof(le_stream_id));
  content += text;
  return content;
}

} // namespace container
} // namespace xdf
