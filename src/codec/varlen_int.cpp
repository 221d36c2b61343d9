#include "codec/varlen_int.hpp"
#include "codec/codec_error.hpp"
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>
#include <limits>

namespace xdf {
namespace codec {

namespace {

// Reads exactly size bytes or throws MalformedLengthError
void read_exact(std::istream& input, void* data, std::size_t size, const char* what) {
  if (!input.read(static_cast<char*>(data), size)) {
    BOOST_LOG_TRIVIAL(debug) << "VarLenInt: Stream ended while reading " << what;
    throw MalformedLengthError(std::string("stream ended while reading ") + what);
  }
}

void write_exact(std::ostream& output, const void* data, std::size_t size) {
  if (!output.write(static_cast<const char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "VarLenInt: Failed to write " << size << " bytes to output stream";
    throw IoError("VarLenInt: Failed to write to output stream");
  }
}

} // namespace

//==============================================
// DECODING
//==============================================

uint64_t VarLenInt::decode(std::istream& input) {
  uint8_t width = 0;
  read_exact(input, &width, sizeof(width), "width selector");

  switch (width) {
    case WIDTH_8: {
      uint8_t value = 0;
      read_exact(input, &value, sizeof(value), "1-byte length");
      return value;
    }
    case WIDTH_32: {
      uint32_t value = 0;
      read_exact(input, &value, sizeof(value), "4-byte length");
      return boost::endian::little_to_native(value);
    }
    case WIDTH_64: {
      uint64_t value = 0;
      read_exact(input, &value, sizeof(value), "8-byte length");
      return boost::endian::little_to_native(value);
    }
    default:
      BOOST_LOG_TRIVIAL(debug) << "VarLenInt: Invalid width selector: " << static_cast<int>(width);
      throw MalformedLengthError("invalid width selector " + std::to_string(width));
  }
}


//==============================================
// ENCODING
//==============================================

void VarLenInt::encode(uint64_t value, std::ostream& output) {
  const uint8_t width = width_for(value);
  write_exact(output, &width, sizeof(width));

  if (width == WIDTH_8) {
    const uint8_t narrow = static_cast<uint8_t>(value);
    write_exact(output, &narrow, sizeof(narrow));
  } else if (width == WIDTH_32) {
    const uint32_t le = boost::endian::native_to_little(static_cast<uint32_t>(value));
    write_exact(output, &le, sizeof(le));
  } else {
    const uint64_t le = boost::endian::native_to_little(value);
    write_exact(output, &le, sizeof(le));
  }
}

uint8_t VarLenInt::width_for(uint64_t value) {
  if (value <= std::numeric_limits<uint8_t>::max()) {
    return WIDTH_8;
  }
  if (value <= std::numeric_limits<uint32_t>::max()) {
    return WIDTH_32;
  }
  return WIDTH_64;
}

std::size_t VarLenInt::encoded_size(uint64_t value) {
  return 1 + width_for(value);
}

} // namespace codec
} // namespace xdf
