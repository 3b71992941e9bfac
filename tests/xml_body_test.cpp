#include "xml_body.hpp"
#include "request_errors.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <gtest/gtest.h>

#include <vector>

namespace {

CompletedPart Part(int number, const std::string& etag)
{
  CompletedPart part;
  part.part_number = number;
  part.etag = etag;
  return part;
}

// (PartNumber, ETag) of every <Part>, in document order
std::vector<std::pair<std::string, std::string>> ReadParts(const std::string& xml)
{
  std::vector<std::pair<std::string, std::string>> parts;
  xmlDocPtr doc = xmlReadMemory(xml.data(), static_cast<int>(xml.size()), "body.xml", nullptr, XML_PARSE_NONET);
  EXPECT_NE(doc, nullptr) << xml;
  if (doc == nullptr) return parts;

  xmlNodePtr root = xmlDocGetRootElement(doc);
  for (xmlNodePtr part = root->children; part != nullptr; part = part->next) {
    if (part->type != XML_ELEMENT_NODE) continue;
    std::pair<std::string, std::string> entry;
    for (xmlNodePtr leaf = part->children; leaf != nullptr; leaf = leaf->next) {
      if (leaf->type != XML_ELEMENT_NODE) continue;
      xmlChar* text = xmlNodeGetContent(leaf);
      std::string value(reinterpret_cast<const char*>(text));
      xmlFree(text);
      if (xmlStrEqual(leaf->name, BAD_CAST "PartNumber")) entry.first = value;
      if (xmlStrEqual(leaf->name, BAD_CAST "ETag")) entry.second = value;
    }
    parts.push_back(entry);
  }
  xmlFreeDoc(doc);
  return parts;
}

} // namespace

TEST(XmlBodyTest, NoPartListGivesEmptyBody)
{
  EXPECT_EQ(SerializeCompleteMultipartUpload(std::nullopt).size(), 0u);
}

TEST(XmlBodyTest, WireFormat)
{
  CompletedMultipartUpload upload;
  upload.parts = {Part(1, "etag1"), Part(2, "etag2")};

  EXPECT_EQ(SerializeCompleteMultipartUpload(upload),
            "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
            "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">"
            "<Part><PartNumber>1</PartNumber><ETag>etag1</ETag></Part>"
            "<Part><PartNumber>2</PartNumber><ETag>etag2</ETag></Part>"
            "</CompleteMultipartUpload>\n");
}

TEST(XmlBodyTest, EmptyPartListStillHasRootElement)
{
  std::string xml = SerializeCompleteMultipartUpload(CompletedMultipartUpload{});
  EXPECT_NE(xml.find("<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\"/>"),
            std::string::npos) << xml;
}

TEST(XmlBodyTest, CallerOrderIsPreserved)
{
  CompletedMultipartUpload upload;
  upload.parts = {Part(1, "etag1"), Part(3, "etag3"), Part(2, "etag2")};

  auto parts = ReadParts(SerializeCompleteMultipartUpload(upload));
  ASSERT_EQ(parts.size(), 3u);
  EXPECT_EQ(parts[0], std::make_pair(std::string("1"), std::string("etag1")));
  EXPECT_EQ(parts[1], std::make_pair(std::string("3"), std::string("etag3")));
  EXPECT_EQ(parts[2], std::make_pair(std::string("2"), std::string("etag2")));
}

TEST(XmlBodyTest, SpecialCharactersAreEscapedAndRoundTrip)
{
  const std::string etag = "\"a&b<c>d\"";
  CompletedMultipartUpload upload;
  upload.parts = {Part(7, etag)};

  std::string xml = SerializeCompleteMultipartUpload(upload);
  EXPECT_NE(xml.find("&amp;"), std::string::npos) << xml;
  EXPECT_NE(xml.find("&lt;"), std::string::npos) << xml;
  EXPECT_EQ(xml.find("a&b"), std::string::npos) << xml;

  auto parts = ReadParts(xml);
  ASSERT_EQ(parts.size(), 1u);
  EXPECT_EQ(parts[0].second, etag);
}

TEST(XmlBodyTest, PartChecksumsFollowETag)
{
  CompletedPart part = Part(1, "etag1");
  part.checksum_sha256 = "c2hh";
  part.checksum_crc32 = "Y3Jj";
  CompletedMultipartUpload upload;
  upload.parts = {part};

  std::string xml = SerializeCompleteMultipartUpload(upload);
  EXPECT_NE(xml.find("<Part><PartNumber>1</PartNumber><ETag>etag1</ETag>"
                     "<ChecksumCRC32>Y3Jj</ChecksumCRC32><ChecksumSHA256>c2hh</ChecksumSHA256></Part>"),
            std::string::npos) << xml;
}

TEST(XmlBodyTest, AbsentPartFieldsAreOmitted)
{
  CompletedPart part;
  part.etag = "only-etag";
  CompletedMultipartUpload upload;
  upload.parts = {part};

  std::string xml = SerializeCompleteMultipartUpload(upload);
  EXPECT_EQ(xml.find("PartNumber"), std::string::npos) << xml;
  EXPECT_NE(xml.find("<Part><ETag>only-etag</ETag></Part>"), std::string::npos) << xml;
}

TEST(XmlBodyTest, InvalidUtf8IsASerializationError)
{
  CompletedMultipartUpload upload;
  upload.parts = {Part(1, std::string("bad\xC3", 4))};
  EXPECT_THROW(SerializeCompleteMultipartUpload(upload), SerializationError);
}

TEST(XmlBodyTest, ControlCharacterIsASerializationError)
{
  CompletedMultipartUpload upload;
  upload.parts = {Part(1, std::string("a\x01" "b"))};
  EXPECT_THROW(SerializeCompleteMultipartUpload(upload), SerializationError);
}

TEST(XmlBodyTest, NonCharacterCodePointsAreSerializationErrors)
{
  CompletedMultipartUpload noncharacter;
  noncharacter.parts = {Part(1, std::string("\xEF\xBF\xBE"))};
  EXPECT_THROW(SerializeCompleteMultipartUpload(noncharacter), SerializationError);

  CompletedMultipartUpload surrogate;
  surrogate.parts = {Part(1, std::string("\xED\xA0\x80"))};
  EXPECT_THROW(SerializeCompleteMultipartUpload(surrogate), SerializationError);
}

TEST(XmlBodyTest, MultiByteTextIsKept)
{
  CompletedMultipartUpload upload;
  upload.parts = {Part(1, std::string("\xC3\xA9t\xE2\x82\xAC\xF0\x9F\x98\x80"))};

  auto parts = ReadParts(SerializeCompleteMultipartUpload(upload));
  ASSERT_EQ(parts.size(), 1u);
  EXPECT_EQ(parts[0].second, "\xC3\xA9t\xE2\x82\xAC\xF0\x9F\x98\x80");
}
