#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <sstream>
#include "container/container_error.hpp"
#include "container/stream_locator.hpp"
#include "metadata/metadata_document.hpp"
#include "test_utils.hpp"

using namespace xdf::container;
using ::testing::HasSubstr;
using ::testing::Not;

class StreamLocatorTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_logging();
  }

  static MetadataLocation locate(const std::string& data) {
    std::stringstream ss(data);
    return StreamLocator("test.xdf").locate(ss);
  }

  // Bytes without any width selector in {1,4,8} and without the boundary signature
  static std::string garbage(std::size_t size) {
    return std::string(size, '\x07');
  }
};

TEST_F(StreamLocatorTest, FindsExistingMetadataChunk) {
  XdfBuilder xdf;
  xdf.file_header().stream_header(1, stream_xml("EEG", "EEG"));
  const uint64_t meta_begin = xdf.size();
  xdf.stream_header(7, metadata_xml("<subject><age>42</age></subject>"));
  const uint64_t meta_end = xdf.size();
  xdf.samples(1).footer(1);

  const MetadataLocation location = locate(xdf.str());
  ASSERT_TRUE(location.begin_offset.has_value());
  EXPECT_EQ(location.begin(), meta_begin);
  EXPECT_EQ(location.byte_length, meta_end - meta_begin);
  EXPECT_EQ(location.stream_id, 7u);
  EXPECT_EQ(location.content, metadata_xml("<subject><age>42</age></subject>"));
  EXPECT_FALSE(location.synthesized);
  EXPECT_FALSE(location.duplicate_found);
}

TEST_F(StreamLocatorTest, SynthesizesMetadataBeforeFirstHeader) {
  XdfBuilder xdf;
  xdf.file_header();
  const uint64_t headers_begin = xdf.size();
  xdf.stream_header(1, stream_xml("EEG", "EEG"))
     .stream_header(2, stream_xml("Markers", "Markers"))
     .samples(1)
     .footer(1);

  const MetadataLocation location = locate(xdf.str());
  EXPECT_TRUE(location.synthesized);
  EXPECT_EQ(location.begin(), headers_begin);
  EXPECT_EQ(location.byte_length, 0u);
  EXPECT_GE(location.stream_id, StreamLocator::SYNTHETIC_ID_MIN);
  EXPECT_LE(location.stream_id, StreamLocator::SYNTHETIC_ID_MAX);

  const auto document = xdf::metadata::MetadataDocument::parse(location.content);
  EXPECT_TRUE(document.is_metadata_stream());
}

TEST_F(StreamLocatorTest, SynthesizesAtDataBoundaryWithoutHeaders) {
  XdfBuilder xdf;
  xdf.file_header();
  const uint64_t samples_begin = xdf.size();
  xdf.samples(1);

  const MetadataLocation location = locate(xdf.str());
  EXPECT_TRUE(location.synthesized);
  EXPECT_EQ(location.begin(), samples_begin);
}

TEST_F(StreamLocatorTest, SynthesizesAtEndOfHeaderOnlyFile) {
  XdfBuilder xdf;
  xdf.file_header();
  const uint64_t end = xdf.size();

  const MetadataLocation location = locate(xdf.str());
  EXPECT_TRUE(location.synthesized);
  EXPECT_EQ(location.begin(), end);
}

TEST_F(StreamLocatorTest, SkipsOpaqueChunks) {
  XdfBuilder xdf;
  xdf.file_header()
     .chunk(4, std::string(12, '\x01'))
     .chunk(0x1234, std::string(300, '\x02'))
     .boundary();
  const uint64_t meta_begin = xdf.size();
  xdf.stream_header(3, metadata_xml()).samples(3);

  const MetadataLocation location = locate(xdf.str());
  EXPECT_FALSE(location.synthesized);
  EXPECT_EQ(location.begin(), meta_begin);
}

TEST_F(StreamLocatorTest, IgnoresMetadataAfterHeaderSection) {
  XdfBuilder xdf;
  xdf.file_header().stream_header(1, stream_xml("EEG", "EEG")).samples(1).stream_header(9, metadata_xml());

  const MetadataLocation location = locate(xdf.str());
  EXPECT_TRUE(location.synthesized);
  EXPECT_NE(location.stream_id, 9u);
}

TEST_F(StreamLocatorTest, SamplesChunkEndsHeaderSectionWhateverItsLength) {
  XdfBuilder xdf;
  xdf.file_header();
  const uint64_t headers_begin = xdf.size();
  xdf.stream_header(1, stream_xml("EEG", "EEG"));
  // Samples chunk claiming 2^32 bytes, cut off after 2000
  xdf.raw(std::string("\x08\x00\x00\x00\x00\x01\x00\x00\x00\x03\x00", 11))
     .raw(std::string(2000, 's'))
     .boundary()
     .stream_header(9, metadata_xml())
     .samples(9);

  LogCapture capture;
  const MetadataLocation location = locate(xdf.str());
  EXPECT_TRUE(location.synthesized);
  EXPECT_EQ(location.begin(), headers_begin);
  EXPECT_NE(location.stream_id, 9u);
  EXPECT_NE(location.stream_id, 1u);
  EXPECT_THAT(capture.text(), Not(HasSubstr("scanning forward")));
}

TEST_F(StreamLocatorTest, FirstDuplicateWinsAndIsReported) {
  XdfBuilder xdf;
  xdf.file_header();
  const uint64_t first_begin = xdf.size();
  xdf.stream_header(4, metadata_xml("<first>1</first>"))
     .stream_header(5, metadata_xml("<second>2</second>"))
     .samples(4);

  LogCapture capture;
  const MetadataLocation location = locate(xdf.str());

  EXPECT_EQ(location.begin(), first_begin);
  EXPECT_EQ(location.stream_id, 4u);
  EXPECT_THAT(location.content, HasSubstr("<first>1</first>"));
  EXPECT_TRUE(location.duplicate_found);
  EXPECT_THAT(capture.text(), HasSubstr("test.xdf has more than one metadata stream"));
}

TEST_F(StreamLocatorTest, ResynchronizesAfterCorruptedLength) {
  XdfBuilder xdf;
  xdf.file_header().stream_header(1, stream_xml("EEG", "EEG"));
  xdf.raw(garbage(500)).boundary();
  const uint64_t meta_begin = xdf.size();
  xdf.stream_header(6, metadata_xml("<found>yes</found>"))
     .samples(1, std::string(2000, 's'));

  LogCapture capture;
  const MetadataLocation location = locate(xdf.str());

  EXPECT_FALSE(location.synthesized);
  EXPECT_EQ(location.begin(), meta_begin);
  EXPECT_EQ(location.stream_id, 6u);
  EXPECT_THAT(location.content, HasSubstr("<found>yes</found>"));
  EXPECT_THAT(capture.text(), HasSubstr("scanning forward to next boundary chunk"));
}

TEST_F(StreamLocatorTest, MalformedLengthNearEndIsTreatedAsEndOfFile) {
  XdfBuilder xdf;
  xdf.file_header();
  const uint64_t headers_begin = xdf.size();
  xdf.stream_header(1, stream_xml("EEG", "EEG")).raw(garbage(100));

  LogCapture capture;
  const MetadataLocation location = locate(xdf.str());

  EXPECT_TRUE(location.synthesized);
  EXPECT_EQ(location.begin(), headers_begin);
  EXPECT_EQ(capture.text(), "");
}

TEST_F(StreamLocatorTest, CorruptionWithoutBoundaryEndsTraversal) {
  XdfBuilder xdf;
  xdf.file_header();
  const uint64_t corrupt_begin = xdf.size();
  xdf.raw(garbage(5000));

  const MetadataLocation location = locate(xdf.str());
  EXPECT_TRUE(location.synthesized);
  EXPECT_EQ(location.begin(), corrupt_begin);
}

TEST_F(StreamLocatorTest, TruncatedFinalChunkEndsTraversal) {
  XdfBuilder xdf;
  xdf.file_header().stream_header(2, metadata_xml());
  const std::string full = xdf.str();
  XdfBuilder tail;
  tail.stream_header(3, stream_xml("EEG", "EEG"));
  // Cut the last header in half
  const std::string data = full + tail.str().substr(4, 20);

  const MetadataLocation location = locate(data);
  EXPECT_FALSE(location.synthesized);
  EXPECT_EQ(location.stream_id, 2u);
}

TEST_F(StreamLocatorTest, UnparsableHeaderIsNotMetadata) {
  XdfBuilder xdf;
  xdf.file_header().stream_header(8, "<info><name>broken").samples(8);

  const MetadataLocation location = locate(xdf.str());
  EXPECT_TRUE(location.synthesized);
  EXPECT_NE(location.stream_id, 8u);
}

TEST_F(StreamLocatorTest, InvalidUtf8IsReplaced) {
  XdfBuilder xdf;
  xdf.file_header().stream_header(2, metadata_xml("<note>caf\xC3</note>")).samples(2);

  const MetadataLocation location = locate(xdf.str());
  EXPECT_FALSE(location.synthesized);
  EXPECT_THAT(location.content, HasSubstr("caf\xEF\xBF\xBD</note>"));
}

TEST_F(StreamLocatorTest, RejectsMissingMagicCode) {
  EXPECT_THROW(locate("XDG:rest of file"), InvalidContainerError);
  EXPECT_THROW(locate("XD"), InvalidContainerError);
}

TEST_F(StreamLocatorTest, RestoresStreamPosition) {
  XdfBuilder xdf;
  xdf.file_header().stream_header(1, metadata_xml()).samples(1);
  std::stringstream ss(xdf.str());
  ss.seekg(13);

  StreamLocator("test.xdf").locate(ss);
  EXPECT_EQ(ss.tellg(), 13);

  std::stringstream bad("nope");
  bad.seekg(2);
  EXPECT_THROW(StreamLocator("bad.xdf").locate(bad), InvalidContainerError);
  EXPECT_EQ(bad.tellg(), 2);
}

TEST_F(StreamLocatorTest, SyntheticIdAvoidsTakenIds) {
  ScanState state;
  state.phase = ScanState::Phase::DONE;
  for (uint32_t id = StreamLocator::SYNTHETIC_ID_MIN; id <= StreamLocator::SYNTHETIC_ID_MAX; ++id) {
    if (id != 54321) {
      state.other_stream_ids.insert(id);
    }
  }

  const MetadataLocation location = StreamLocator("test.xdf").finish(std::move(state));
  EXPECT_EQ(location.stream_id, 54321u);
}

TEST_F(StreamLocatorTest, FoldRecordsHeaderState) {
  const StreamLocator locator("test.xdf");
  ScanState state;

  state = locator.fold(std::move(state), HeaderChunk{10, 50, 1, stream_xml("EEG", "EEG")});
  state = locator.fold(std::move(state), OpaqueChunk{50, {20, 4}});
  state = locator.fold(std::move(state), HeaderChunk{70, 120, 2, metadata_xml()});
  EXPECT_EQ(state.phase, ScanState::Phase::SCANNING_HEADERS);
  EXPECT_EQ(state.streamheaders_begin, 10u);
  ASSERT_TRUE(state.metadata.has_value());
  EXPECT_EQ(state.metadata->begin, 70u);
  EXPECT_EQ(state.metadata->length, 50u);
  EXPECT_EQ(state.other_stream_ids, std::set<uint32_t>{1});

  state = locator.fold(std::move(state), DataBoundary{120, 3});
  EXPECT_EQ(state.phase, ScanState::Phase::DONE);
  EXPECT_EQ(state.stop_position, 120u);
}
