#include "container/stream_locator.hpp"
#include "codec/codec_error.hpp"
#include "container/container_error.hpp"
#include "metadata/metadata_document.hpp"
#include "utils/utf8.hpp"
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <random>

namespace xdf {
namespace container {

namespace {

// Runs operation and puts the read position back where it was, also on error
template <typename Operation>
auto save_stream_pos(std::istream& input, Operation operation) {
  input.clear();
  const auto input_pos = input.tellg();

  try {
    auto result = operation();
    input.clear();
    input.seekg(input_pos);
    return result;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(debug) << "StreamLocator: Restoring stream position after error: " << e.what();
    input.clear();
    input.seekg(input_pos);
    throw;
  }
}

uint64_t current_offset(std::istream& input, uint64_t fallback) {
  input.clear();
  const std::streamoff pos = input.tellg();
  return pos < 0 ? fallback : static_cast<uint64_t>(pos);
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

StreamLocator::StreamLocator(std::string source_name, ResyncScanner scanner)
  : source_name_(std::move(source_name))
  , scanner_(scanner) {}


//==============================================
// LOCATING
//==============================================

MetadataLocation StreamLocator::locate(std::istream& input) const {
  return save_stream_pos(input, [&]() {
    input.seekg(0, std::ios::end);
    const uint64_t file_size = current_offset(input, 0);
    input.seekg(0);

    BOOST_LOG_TRIVIAL(debug) << "StreamLocator: Scanning " << source_name_ << " (" << file_size << " bytes)";
    check_magic_code(input);

    ScanState state;
    state.stop_position = MAGIC_CODE_SIZE;
    while (state.phase == ScanState::Phase::SCANNING_HEADERS) {
      state = fold(std::move(state), next_event(input, file_size));
    }
    return finish(std::move(state));
  });
}

void StreamLocator::check_magic_code(std::istream& input) const {
  char magic[MAGIC_CODE_SIZE] = {};
  if (!input.read(magic, MAGIC_CODE_SIZE) || !std::equal(magic, magic + MAGIC_CODE_SIZE, MAGIC_CODE)) {
    BOOST_LOG_TRIVIAL(error) << "StreamLocator: Missing XDF magic code in " << source_name_;
    throw InvalidContainerError(source_name_);
  }
}


//==============================================
// TRAVERSAL STEPS
//==============================================

ChunkEvent StreamLocator::next_event(std::istream& input, uint64_t file_size) const {
  while (true) {
    const uint64_t begin = current_offset(input, file_size);

    try {
      // read [NumLengthBytes], [Length], [Tag]
      const codec::FrameHeader header = codec::ChunkFrame::read_frame_header(input);
      const uint64_t content_begin = current_offset(input, file_size);
      BOOST_LOG_TRIVIAL(trace) << "StreamLocator: Read tag " << header.tag << " ("
                               << codec::chunk_tag_to_string(header.tag) << ") at " << content_begin
                               << " bytes, length=" << header.length;

      // data chunks end the header section, their content is never read
      if (header.is(codec::ChunkTag::SAMPLES) || header.is(codec::ChunkTag::STREAM_FOOTER)) {
        return DataBoundary{begin, header.tag};
      }

      if (content_begin > file_size || header.content_length() > file_size - content_begin) {
        throw codec::MalformedLengthError("chunk at offset " + std::to_string(begin) +
                                          " runs past end of file");
      }

      if (header.is(codec::ChunkTag::STREAM_HEADER)) {
        if (header.content_length() < sizeof(uint32_t)) {
          throw codec::MalformedLengthError("stream header chunk too short for a stream id");
        }
        // read [StreamId]
        uint32_t le_stream_id = 0;
        if (!input.read(reinterpret_cast<char*>(&le_stream_id), sizeof(le_stream_id))) {
          throw codec::IoError("StreamLocator: Failed to read stream id");
        }
        // read [Content]
        codec::FrameHeader text_header = header;
        text_header.length -= sizeof(uint32_t);
        const std::string raw = codec::ChunkFrame::read_content(input, text_header);

        return HeaderChunk{begin, current_offset(input, file_size),
                           boost::endian::little_to_native(le_stream_id), utils::sanitize_utf8(raw)};
      }

      // skip other chunk types (Boundary, ClockOffset, ...)
      input.seekg(static_cast<std::streamoff>(header.content_length()), std::ios::cur);
      return OpaqueChunk{begin, header};
    }
    catch (const codec::MalformedLengthError& e) {
      const uint64_t position = current_offset(input, file_size);
      if (position + NEAR_EOF_MARGIN < file_size) {
        BOOST_LOG_TRIVIAL(warning) << "StreamLocator: " << e.what() << " at offset " << begin << " in "
                                   << source_name_ << ", scanning forward to next boundary chunk";
        if (scanner_.scan_forward(input)) {
          continue;
        }
        BOOST_LOG_TRIVIAL(warning) << "StreamLocator: No boundary chunk after offset " << begin << " in "
                                   << source_name_ << ", treating it as the end of the file";
      } else {
        BOOST_LOG_TRIVIAL(debug) << "StreamLocator: Reached end of file at offset " << begin;
      }
      return EndOfStream{begin};
    }
  }
}

ScanState StreamLocator::fold(ScanState state, const ChunkEvent& event) const {
  if (const auto* chunk = std::get_if<HeaderChunk>(&event)) {
    // note the beginning of the stream headers in the file
    if (!state.streamheaders_begin) {
      state.streamheaders_begin = chunk->begin;
    }

    bool is_metadata = false;
    try {
      const auto document = metadata::MetadataDocument::parse(chunk->text);
      is_metadata = document.is_metadata_stream();
      BOOST_LOG_TRIVIAL(debug) << "StreamLocator: Found stream " << document.name()
                               << " (id " << chunk->stream_id << ")";
    }
    catch (const metadata::DocumentError& e) {
      BOOST_LOG_TRIVIAL(warning) << "StreamLocator: Unreadable header of stream " << chunk->stream_id
                                 << " in " << source_name_ << ": " << e.what();
    }

    if (is_metadata && !state.metadata) {
      state.metadata = ScanState::FoundMetadata{
        chunk->begin, chunk->end - chunk->begin, chunk->text, chunk->stream_id};
    } else {
      if (is_metadata) {
        state.duplicate_metadata_seen = true;
      }
      state.other_stream_ids.insert(chunk->stream_id);
    }
    return state;
  }

  if (const auto* boundary = std::get_if<DataBoundary>(&event)) {
    // Metadata chunks after this point are not looked at
    BOOST_LOG_TRIVIAL(debug) << "StreamLocator: Header section ends at " << codec::chunk_tag_to_string(boundary->tag)
                             << " chunk, offset " << boundary->begin;
    state.phase = ScanState::Phase::DONE;
    state.stop_position = boundary->begin;
    return state;
  }

  if (const auto* opaque = std::get_if<OpaqueChunk>(&event)) {
    BOOST_LOG_TRIVIAL(trace) << "StreamLocator: Skipped " << opaque->header.content_length()
                             << " bytes of " << codec::chunk_tag_to_string(opaque->header.tag)
                             << " chunk at offset " << opaque->begin;
    return state;
  }

  state.phase = ScanState::Phase::DONE;
  state.stop_position = std::get<EndOfStream>(event).position;
  return state;
}

MetadataLocation StreamLocator::finish(ScanState state) const {
  if (state.duplicate_metadata_seen) {
    BOOST_LOG_TRIVIAL(warning) << "File " << source_name_
                               << " has more than one metadata stream. Using only the first one.";
  }

  MetadataLocation location;
  location.duplicate_found = state.duplicate_metadata_seen;

  if (state.metadata) {
    location.content = std::move(state.metadata->content);
    location.begin_offset = state.metadata->begin;
    location.byte_length = state.metadata->length;
    location.stream_id = state.metadata->stream_id;
    BOOST_LOG_TRIVIAL(debug) << "StreamLocator: Metadata chunk at offset " << location.begin()
                             << ", " << location.byte_length << " bytes, stream id " << location.stream_id;
    return location;
  }

  // No metadata chunk yet: insert one in front of the stream headers
  location.content = metadata::MetadataDocument::default_content(metadata::MetadataDocument::generate_uid());
  location.begin_offset = state.streamheaders_begin.value_or(state.stop_position);
  location.byte_length = 0;
  location.stream_id = allocate_stream_id(state.other_stream_ids);
  location.synthesized = true;
  BOOST_LOG_TRIVIAL(debug) << "StreamLocator: No metadata chunk in " << source_name_ << ", inserting one at offset "
                           << location.begin() << " with stream id " << location.stream_id;
  return location;
}

uint32_t StreamLocator::allocate_stream_id(const std::set<uint32_t>& taken) {
  // High ids: streams declared after the header section typically have low ones
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<uint32_t> dis(SYNTHETIC_ID_MIN, SYNTHETIC_ID_MAX);

  while (true) {
    const uint32_t candidate = dis(gen);
    if (taken.count(candidate) == 0) {
      return candidate;
    }
  }
}

} // namespace container
} // namespace xdf
