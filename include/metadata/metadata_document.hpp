#ifndef XDF_METADATA_DOCUMENT_HPP
#define XDF_METADATA_DOCUMENT_HPP

#include <string>
#include <vector>
#include <boost/property_tree/ptree.hpp>
#include "codec/codec_error.hpp"

namespace xdf {
namespace metadata {

// Name and type that mark the stream holding the user metadata
constexpr const char* METADATA_STREAM_NAME = "Metadata";
constexpr const char* METADATA_STREAM_TYPE = "Metadata";

class DocumentError : public XdfError {
public:
  explicit DocumentError(const std::string& message)
    : XdfError("Metadata document: " + message) {}
};

// XML <info> document carried by a StreamHeader chunk.
// Field names are dotted paths resolved below info.desc, e.g. "subject.age"
// addresses <info><desc><subject><age>.
class MetadataDocument {
public:
  // ---- CONSTRUCTION ----
  // Parses a stream header document, throws DocumentError on malformed XML
  static MetadataDocument parse(const std::string& xml);
  // Blank metadata stream header with the given unique id
  static std::string default_content(const std::string& uid);
  // Random RFC 4122 version 4 UUID
  static std::string generate_uid();


  // ---- QUERY ----
  std::string name() const;
  std::string type() const;
  // True when name and type both equal the metadata stream identifiers
  bool is_metadata_stream() const;
  // Values of every field matching the dotted path, in document order
  std::vector<std::string> find_all(const std::string& field) const;


  // ---- EDITING ----
  // Sets the first matching field, creating the path when missing
  void set(const std::string& field, const std::string& value);
  // Removes every matching field, returns how many were removed
  std::size_t clear(const std::string& field);


  // ---- SERIALIZATION ----
  std::string to_string() const;

  bool operator==(const MetadataDocument& other) const { return tree_ == other.tree_; }
  bool operator!=(const MetadataDocument& other) const { return !(*this == other); }

private:
  explicit MetadataDocument(boost::property_tree::ptree tree);

  boost::property_tree::ptree tree_;

  // Splits a dotted field name, throws DocumentError on empty components
  static std::vector<std::string> split_field(const std::string& field);
};

} // namespace metadata
} // namespace xdf

#endif // XDF_METADATA_DOCUMENT_HPP
