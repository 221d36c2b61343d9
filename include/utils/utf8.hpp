#ifndef XDF_UTILS_UTF8_HPP
#define XDF_UTILS_UTF8_HPP

#include <string>

namespace xdf {
namespace utils {

// Returns bytes with every invalid UTF-8 sequence replaced by U+FFFD
std::string sanitize_utf8(const std::string& bytes);

} // namespace utils
} // namespace xdf

#endif // XDF_UTILS_UTF8_HPP
