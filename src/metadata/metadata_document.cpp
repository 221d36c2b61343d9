#include "metadata/metadata_document.hpp"
#include <boost/log/trivial.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <array>
#include <iomanip>
#include <sstream>

namespace xdf {
namespace metadata {

namespace pt = boost::property_tree;

namespace {

constexpr const char* DESC_PATH = "info.desc";

void collect_matches(const pt::ptree& node, const std::vector<std::string>& parts,
                     std::size_t index, std::vector<std::string>& out) {
  if (index == parts.size()) {
    out.push_back(node.data());
    return;
  }
  for (const auto& child : node) {
    if (child.first == parts[index]) {
      collect_matches(child.second, parts, index + 1, out);
    }
  }
}

std::size_t erase_matches(pt::ptree& node, const std::vector<std::string>& parts, std::size_t index) {
  if (index + 1 == parts.size()) {
    return node.erase(parts[index]);
  }
  std::size_t removed = 0;
  for (auto& child : node) {
    if (child.first == parts[index]) {
      removed += erase_matches(child.second, parts, index + 1);
    }
  }
  return removed;
}

} // namespace

//==============================================
// CONSTRUCTION
//==============================================

MetadataDocument::MetadataDocument(pt::ptree tree) : tree_(std::move(tree)) {}

MetadataDocument MetadataDocument::parse(const std::string& xml) {
  std::istringstream input(xml);
  pt::ptree tree;
  try {
    pt::read_xml(input, tree, pt::xml_parser::trim_whitespace);
  } catch (const pt::xml_parser_error& e) {
    BOOST_LOG_TRIVIAL(debug) << "MetadataDocument: Failed to parse XML: " << e.what();
    throw DocumentError(std::string("malformed XML: ") + e.what());
  }
  return MetadataDocument(std::move(tree));
}

std::string MetadataDocument::default_content(const std::string& uid) {
  std::ostringstream ss;
  ss << "<?xml version=\"1.0\"?>\n"
     << "<info>\n"
     << "    <name>" << METADATA_STREAM_NAME << "</name>\n"
     << "    <type>" << METADATA_STREAM_TYPE << "</type>\n"
     << "    <channel_count>0</channel_count>\n"
     << "    <nominal_srate>0</nominal_srate>\n"
     << "    <channel_format>string</channel_format>\n"
     << "    <source_id></source_id>\n"
     << "    <version>1.1000000000000001</version>\n"
     << "    <created_at>0</created_at>\n"
     << "    <uid>" << uid << "</uid>\n"
     << "    <session_id>default</session_id>\n"
     << "    <hostname>undefined</hostname>\n"
     << "    <desc></desc>\n"
     << "</info>";
  return ss.str();
}

std::string MetadataDocument::generate_uid() {
  std::array<unsigned char, 16> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    BOOST_LOG_TRIVIAL(error) << "MetadataDocument: RAND_bytes failed, error " << ERR_get_error();
    throw XdfError("Metadata document: failed to generate random uid");
  }

  // Version 4, variant 10xx
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

  std::stringstream ss;
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      ss << '-';
    }
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
  }
  return ss.str();
}


//==============================================
// QUERY
//==============================================

std::string MetadataDocument::name() const {
  return tree_.get<std::string>("info.name", "");
}

std::string MetadataDocument::type() const {
  return tree_.get<std::string>("info.type", "");
}

bool MetadataDocument::is_metadata_stream() const {
  return name() == METADATA_STREAM_NAME && type() == METADATA_STREAM_TYPE;
}

std::vector<std::string> MetadataDocument::find_all(const std::string& field) const {
  std::vector<std::string> values;
  auto desc = tree_.get_child_optional(DESC_PATH);
  if (!desc) {
    return values;
  }
  collect_matches(*desc, split_field(field), 0, values);
  return values;
}


//==============================================
// EDITING
//==============================================

void MetadataDocument::set(const std::string& field, const std::string& value) {
  split_field(field);
  if (!tree_.get_child_optional("info")) {
    throw DocumentError("document has no <info> root");
  }
  pt::ptree& desc = tree_.get_child_optional(DESC_PATH)
    ? tree_.get_child(DESC_PATH)
    : tree_.put_child(DESC_PATH, pt::ptree());
  desc.put(pt::ptree::path_type(field, '.'), value);
  BOOST_LOG_TRIVIAL(debug) << "MetadataDocument: Set " << field << " = " << value;
}

std::size_t MetadataDocument::clear(const std::string& field) {
  const auto parts = split_field(field);
  auto desc = tree_.get_child_optional(DESC_PATH);
  if (!desc) {
    return 0;
  }
  const std::size_t removed = erase_matches(*desc, parts, 0);
  BOOST_LOG_TRIVIAL(debug) << "MetadataDocument: Cleared " << removed << " field(s) named " << field;
  return removed;
}


//==============================================
// SERIALIZATION
//==============================================

std::string MetadataDocument::to_string() const {
  std::ostringstream output;
  pt::write_xml(output, tree_, pt::xml_writer_make_settings<std::string>(' ', 4));
  return output.str();
}

std::vector<std::string> MetadataDocument::split_field(const std::string& field) {
  std::vector<std::string> parts;
  std::string::size_type start = 0;
  while (true) {
    const auto dot = field.find('.', start);
    parts.push_back(field.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
    if (parts.back().empty()) {
      throw DocumentError("invalid field name '" + field + "'");
    }
    if (dot == std::string::npos) {
      break;
    }
    start = dot + 1;
  }
  return parts;
}

} // namespace metadata
} // namespace xdf
