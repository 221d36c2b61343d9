#ifndef XDF_CODEC_VARLEN_INT_HPP
#define XDF_CODEC_VARLEN_INT_HPP

#include <cstdint>
#include <istream>
#include <ostream>

namespace xdf {
namespace codec {

// Length prefix used by every XDF chunk:
// [NumLengthBytes: 1, 4 or 8][Length: little endian, NumLengthBytes wide]
class VarLenInt {
public:
  // ---- WIDTH SELECTORS ----
  static constexpr uint8_t WIDTH_8 = 1;
  static constexpr uint8_t WIDTH_32 = 4;
  static constexpr uint8_t WIDTH_64 = 8;


  // ---- DECODING ----
  // Reads selector and value, throws MalformedLengthError on a bad selector
  // or when the stream ends early
  static uint64_t decode(std::istream& input);


  // ---- ENCODING ----
  // Writes value using the smallest of the three widths that fits
  static void encode(uint64_t value, std::ostream& output);
  // Returns the selector encode() would pick for value
  static uint8_t width_for(uint64_t value);
  // Number of bytes encode() writes for value, selector included
  static std::size_t encoded_size(uint64_t value);
};

} // namespace codec
} // namespace xdf

#endif // XDF_CODEC_VARLEN_INT_HPP
