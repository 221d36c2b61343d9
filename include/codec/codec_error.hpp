#ifndef XDF_CODEC_ERROR_HPP
#define XDF_CODEC_ERROR_HPP

#include <stdexcept>
#include <string>

namespace xdf {

// Base of every error raised while processing an XDF file
class XdfError : public std::runtime_error {
public:
    explicit XdfError(const std::string& message)
        : std::runtime_error(message) {}
};

namespace codec {

// Width selector outside {1,4,8}, truncated length or tag field
class MalformedLengthError : public XdfError {
public:
    explicit MalformedLengthError(const std::string& message)
        : XdfError("Malformed length: " + message) {}
};

// Read or write failure on an underlying stream
class IoError : public XdfError {
public:
    explicit IoError(const std::string& message)
        : XdfError("I/O error: " + message) {}
};

} // namespace codec
} // namespace xdf

#endif // XDF_CODEC_ERROR_HPP
