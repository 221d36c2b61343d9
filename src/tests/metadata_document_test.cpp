#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "metadata/metadata_document.hpp"
#include "test_utils.hpp"

using namespace xdf::metadata;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::MatchesRegex;

TEST(MetadataDocumentTest, RecognizesMetadataStream) {
  EXPECT_TRUE(MetadataDocument::parse(metadata_xml()).is_metadata_stream());
  EXPECT_FALSE(MetadataDocument::parse(stream_xml("EEG", "EEG")).is_metadata_stream());
  EXPECT_FALSE(MetadataDocument::parse(stream_xml("Metadata", "Markers")).is_metadata_stream());
  EXPECT_FALSE(MetadataDocument::parse("<info><type>Metadata</type></info>").is_metadata_stream());
}

TEST(MetadataDocumentTest, MalformedXmlThrows) {
  EXPECT_THROW(MetadataDocument::parse("<info><name>Metadata</info>"), DocumentError);
  EXPECT_THROW(MetadataDocument::parse("not xml at all <"), DocumentError);
}

TEST(MetadataDocumentTest, DefaultContentIsMetadataStream) {
  const std::string uid = MetadataDocument::generate_uid();
  const std::string content = MetadataDocument::default_content(uid);
  const auto document = MetadataDocument::parse(content);

  EXPECT_TRUE(document.is_metadata_stream());
  EXPECT_THAT(content, HasSubstr("<uid>" + uid + "</uid>"));
  EXPECT_THAT(content, HasSubstr("<desc></desc>"));
  EXPECT_THAT(document.find_all("anything"), IsEmpty());
}

TEST(MetadataDocumentTest, GeneratesVersion4Uids) {
  const std::string a = MetadataDocument::generate_uid();
  const std::string b = MetadataDocument::generate_uid();
  EXPECT_THAT(a, MatchesRegex("[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}"));
  EXPECT_NE(a, b);
}

TEST(MetadataDocumentTest, FindAllFollowsDottedPaths) {
  const auto document = MetadataDocument::parse(metadata_xml(
    "<subject><age>42</age><name>A</name></subject>"
    "<subject><age>43</age></subject>"
    "<age>top</age>"));

  EXPECT_THAT(document.find_all("subject.age"), ElementsAre("42", "43"));
  EXPECT_THAT(document.find_all("subject.name"), ElementsAre("A"));
  EXPECT_THAT(document.find_all("age"), ElementsAre("top"));
  EXPECT_THAT(document.find_all("subject.height"), IsEmpty());
}

TEST(MetadataDocumentTest, SetOverridesFirstMatch) {
  auto document = MetadataDocument::parse(metadata_xml(
    "<subject><id>old</id></subject><subject><id>other</id></subject>"));

  document.set("subject.id", "new");
  EXPECT_THAT(document.find_all("subject.id"), ElementsAre("new", "other"));
}

TEST(MetadataDocumentTest, SetCreatesMissingPath) {
  auto document = MetadataDocument::parse(metadata_xml());
  document.set("subject.session.number", "3");
  EXPECT_THAT(document.find_all("subject.session.number"), ElementsAre("3"));

  const auto reparsed = MetadataDocument::parse(document.to_string());
  EXPECT_EQ(reparsed, document);
  EXPECT_THAT(document.to_string(), HasSubstr("<number>3</number>"));
}

TEST(MetadataDocumentTest, SetCreatesDescWhenAbsent) {
  auto document = MetadataDocument::parse("<info><name>Metadata</name><type>Metadata</type></info>");
  document.set("experimenter", "Jane");
  EXPECT_THAT(document.find_all("experimenter"), ElementsAre("Jane"));
}

TEST(MetadataDocumentTest, SetWithoutInfoRootThrows) {
  auto document = MetadataDocument::parse("<other/>");
  EXPECT_THROW(document.set("a", "b"), DocumentError);
}

TEST(MetadataDocumentTest, ClearRemovesAllMatches) {
  auto document = MetadataDocument::parse(metadata_xml(
    "<subject><hand>left</hand><hand>right</hand><age>1</age></subject>"
    "<subject><hand>both</hand></subject>"));

  EXPECT_EQ(document.clear("subject.hand"), 3u);
  EXPECT_THAT(document.find_all("subject.hand"), IsEmpty());
  EXPECT_THAT(document.find_all("subject.age"), ElementsAre("1"));
  EXPECT_EQ(document.clear("subject.hand"), 0u);
}

TEST(MetadataDocumentTest, ClearWholeSubtree) {
  auto document = MetadataDocument::parse(metadata_xml("<subject><age>1</age></subject><keep>1</keep>"));
  EXPECT_EQ(document.clear("subject"), 1u);
  EXPECT_THAT(document.find_all("subject.age"), IsEmpty());
  EXPECT_THAT(document.find_all("keep"), ElementsAre("1"));
}

TEST(MetadataDocumentTest, RejectsEmptyFieldComponents) {
  auto document = MetadataDocument::parse(metadata_xml());
  EXPECT_THROW(document.set("", "x"), DocumentError);
  EXPECT_THROW(document.set("subject..age", "x"), DocumentError);
  EXPECT_THROW(document.clear("subject."), DocumentError);
  EXPECT_THROW(document.find_all(".age"), DocumentError);
}
