#ifndef XDF_CONTAINER_ERROR_HPP
#define XDF_CONTAINER_ERROR_HPP

#include <string>
#include "codec/codec_error.hpp"

namespace xdf {
namespace container {

// Input does not start with the XDF magic code
class InvalidContainerError : public XdfError {
public:
  explicit InvalidContainerError(const std::string& path)
    : XdfError("Not a valid XDF file: " + path) {}
};

// Output path is taken and overwriting was not allowed
class OutputExistsError : public XdfError {
public:
  explicit OutputExistsError(const std::string& path)
    : XdfError("Output file already exists: " + path +
               ". Use the --overwrite option to force-overwrite existing files.") {}
};

} // namespace container
} // namespace xdf

#endif // XDF_CONTAINER_ERROR_HPP
