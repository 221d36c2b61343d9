#ifndef XDF_METADATA_EDITOR_HPP
#define XDF_METADATA_EDITOR_HPP

#include <functional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace xdf {
namespace metadata {

// Content transform applied to the located metadata text
using TransformFn = std::function<std::string(const std::string&)>;

// set/clear/show requests from the command line
struct EditDirectives {
  std::vector<std::pair<std::string, std::string>> to_set;
  std::vector<std::string> to_clear;
  std::vector<std::string> to_show;

  // True when applying the directives can change a document
  bool modifies() const { return !to_set.empty() || !to_clear.empty(); }
};

class MetadataEditor {
public:
  // ---- CONSTRUCTOR ----
  // Values requested by --show are written to out
  MetadataEditor(EditDirectives directives, std::ostream& out);


  // ---- TRANSFORM ----
  // Applies show, then clear, then set. Returns content itself when the
  // resulting document is unchanged. Throws DocumentError.
  std::string apply(const std::string& content) const;
  // Wraps apply() for the file processor
  TransformFn as_transform() const;

private:
  EditDirectives directives_;
  std::ostream& out_;
};

} // namespace metadata
} // namespace xdf

#endif // XDF_METADATA_EDITOR_HPP
