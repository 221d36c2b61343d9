#include "utils/utf8.hpp"

namespace xdf {
namespace utils {

namespace {

constexpr const char REPLACEMENT[] = "\xEF\xBF\xBD";

bool is_continuation(unsigned char c) {
  return (c & 0xC0) == 0x80;
}

// Length of the valid sequence starting at pos, or 0 if it is invalid
std::size_t valid_sequence_length(const std::string& s, std::size_t pos) {
  const auto c0 = static_cast<unsigned char>(s[pos]);
  if (c0 < 0x80) {
    return 1;
  }

  std::size_t len = 0;
  unsigned char lo = 0x80;
  unsigned char hi = 0xBF;
  if (c0 >= 0xC2 && c0 <= 0xDF) {
    len = 2;
  } else if (c0 >= 0xE0 && c0 <= 0xEF) {
    len = 3;
    if (c0 == 0xE0) lo = 0xA0;
    if (c0 == 0xED) hi = 0x9F;  // surrogates
  } else if (c0 >= 0xF0 && c0 <= 0xF4) {
    len = 4;
    if (c0 == 0xF0) lo = 0x90;
    if (c0 == 0xF4) hi = 0x8F;
  } else {
    return 0;
  }

  if (pos + len > s.size()) {
    return 0;
  }
  const auto c1 = static_cast<unsigned char>(s[pos + 1]);
  if (c1 < lo || c1 > hi) {
    return 0;
  }
  for (std::size_t i = 2; i < len; ++i) {
    if (!is_continuation(static_cast<unsigned char>(s[pos + i]))) {
      return 0;
    }
  }
  return len;
}

} // namespace

std::string sanitize_utf8(const std::string& bytes) {
  std::string out;
  out.reserve(bytes.size());

  std::size_t pos = 0;
  while (pos < bytes.size()) {
    const std::size_t len = valid_sequence_length(bytes, pos);
    if (len == 0) {
      out += REPLACEMENT;
      ++pos;
      // Swallow the continuation bytes of the broken sequence
      while (pos < bytes.size() && is_continuation(static_cast<unsigned char>(bytes[pos]))) {
        ++pos;
      }
      continue;
    }
    out.append(bytes, pos, len);
    pos += len;
  }
  return out;
}

} // namespace utils
} // namespace xdf
