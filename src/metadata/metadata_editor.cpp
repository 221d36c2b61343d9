#include "metadata/metadata_editor.hpp"
#include "metadata/metadata_document.hpp"
#include <boost/log/trivial.hpp>
#include <mutex>
#include <sstream>

namespace xdf {
namespace metadata {

namespace {
// Serializes --show output when several files are processed at once
std::mutex show_mutex;
}

MetadataEditor::MetadataEditor(EditDirectives directives, std::ostream& out)
  : directives_(std::move(directives))
  , out_(out) {}

std::string MetadataEditor::apply(const std::string& content) const {
  const MetadataDocument original = MetadataDocument::parse(content);
  MetadataDocument edited = original;

  if (!directives_.to_show.empty()) {
    std::ostringstream shown;
    for (const auto& field : directives_.to_show) {
      for (const auto& value : edited.find_all(field)) {
        shown << field << ": " << value << '\n';
      }
    }
    std::lock_guard<std::mutex> lock(show_mutex);
    out_ << shown.str() << std::flush;
  }

  for (const auto& field : directives_.to_clear) {
    edited.clear(field);
  }

  for (const auto& [field, value] : directives_.to_set) {
    edited.set(field, value);
  }

  if (edited == original) {
    BOOST_LOG_TRIVIAL(debug) << "MetadataEditor: Document unchanged";
    return content;
  }
  return edited.to_string();
}

TransformFn MetadataEditor::as_transform() const {
  return [this](const std::string& content) { return apply(content); };
}

} // namespace metadata
} // namespace xdf
