#ifndef XDF_CONTAINER_SPLICE_WRITER_HPP
#define XDF_CONTAINER_SPLICE_WRITER_HPP

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include "container/stream_locator.hpp"

namespace xdf {
namespace container {

// Writes a copy of the input with the metadata chunk replaced or inserted
class SpliceWriter {
public:
  static constexpr std::size_t BLOCK_SIZE = 64 * 1024;

  // ---- SPLICING ----
  // Copies input to output. When new_content equals location.content the copy
  // is verbatim; otherwise the bytes in [location.begin(), location.end()) are
  // replaced by a StreamHeader chunk holding location.stream_id and
  // new_content. Returns the number of bytes written. Throws IoError.
  static uint64_t splice(std::istream& input, uint64_t file_size, const MetadataLocation& location,
                         const std::string& new_content, std::ostream& output);


  // ---- BYTE COPYING ----
  // Copies length bytes from the current input position to output
  static void copy_range(std::istream& input, std::ostream& output, uint64_t length);
  // Serialized StreamHeader chunk content: [StreamId][Content]
  static std::string stream_header_content(uint32_t stream_id, const std::string& text);
};

} // namespace container
} // namespace xdf

#endif // XDF_CONTAINER_SPLICE_WRITER_HPP
