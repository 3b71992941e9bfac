#include "request_builder.hpp"
#include "request_errors.hpp"

#include <gtest/gtest.h>

namespace {

const std::vector<std::string> kPayers = {"requester"};

CompleteMultipartUploadRequest BaseRequest()
{
  return CompleteMultipartUploadRequest().WithBucket("b").WithKey("k").WithUploadId("u");
}

std::string MissingField(const CompleteMultipartUploadRequest& request)
{
  try {
    BuildCompleteMultipartUpload(request, kPayers);
  } catch (const MissingRequiredField& e) {
    return e.field();
  }
  return "";
}

} // namespace

TEST(RequestBuilderTest, MinimalRequest)
{
  RequestDescriptor request = BuildCompleteMultipartUpload(BaseRequest(), kPayers);

  EXPECT_EQ(request.method, "POST");
  EXPECT_EQ(request.path, "/b/k");
  ASSERT_EQ(request.query.size(), 1u);
  EXPECT_EQ(request.query.at("uploadId"), "u");
  EXPECT_EQ(request.QueryString(), "uploadId=u");
  EXPECT_EQ(request.Target(), "/b/k?uploadId=u");
  EXPECT_EQ(request.headers.size(), 1u);
  EXPECT_EQ(request.headers.at("content-type"), "application/xml");
  EXPECT_TRUE(request.body.empty());
  EXPECT_TRUE(request.endpoint.empty());
}

TEST(RequestBuilderTest, PathKeepsKeySeparatorsAndEncodesTheRest)
{
  auto params = BaseRequest().WithBucket("my bucket").WithKey("photos/2024/a b+c?.jpg");
  RequestDescriptor request = BuildCompleteMultipartUpload(params, kPayers);
  EXPECT_EQ(request.path, "/my%20bucket/photos/2024/a%20b%2Bc%3F.jpg");
}

TEST(RequestBuilderTest, UploadIdIsEncodedOnlyWhenRendered)
{
  RequestDescriptor request = BuildCompleteMultipartUpload(BaseRequest().WithUploadId("x/y=="), kPayers);
  EXPECT_EQ(request.query.at("uploadId"), "x/y==");
  EXPECT_EQ(request.QueryString(), "uploadId=x%2Fy%3D%3D");
}

TEST(RequestBuilderTest, MissingFieldsReportedInOrder)
{
  CompleteMultipartUploadRequest empty;
  EXPECT_EQ(MissingField(empty), "Bucket");
  EXPECT_EQ(MissingField(empty.WithUploadId("u")), "Bucket");
  EXPECT_EQ(MissingField(empty.WithBucket("b")), "Key");
  EXPECT_EQ(MissingField(empty.WithBucket("b").WithKey("k")), "UploadId");
  EXPECT_EQ(MissingField(BaseRequest().WithKey(std::nullopt)), "Key");
  EXPECT_EQ(MissingField(BaseRequest()), "");
}

TEST(RequestBuilderTest, ValidationPrecedesHeaderChecks)
{
  // both problems present: the missing field wins
  auto params = BaseRequest().WithUploadId(std::nullopt).WithRequestPayer("bogus");
  EXPECT_THROW(BuildCompleteMultipartUpload(params, kPayers), MissingRequiredField);
}

TEST(RequestBuilderTest, InvalidPayerAbortsBuild)
{
  EXPECT_THROW(BuildCompleteMultipartUpload(BaseRequest().WithRequestPayer("bogus"), kPayers), InvalidEnumValue);
}

TEST(RequestBuilderTest, BodyCarriesParts)
{
  CompletedPart part;
  part.part_number = 1;
  part.etag = "etag1";
  RequestDescriptor request =
    BuildCompleteMultipartUpload(BaseRequest().WithMultipartUpload(CompletedMultipartUpload{{part}}), kPayers);

  EXPECT_NE(request.body.find("<Part><PartNumber>1</PartNumber><ETag>etag1</ETag></Part>"), std::string::npos);
}

TEST(RequestBuilderTest, BuildingTwiceGivesIdenticalRequests)
{
  CompletedPart p1, p2;
  p1.part_number = 2;
  p1.etag = "b";
  p2.part_number = 1;
  p2.etag = "a";
  auto params = BaseRequest()
                  .WithMultipartUpload(CompletedMultipartUpload{{p1, p2}})
                  .WithChecksumSha256("c2hh")
                  .WithIfNoneMatch("*");

  EXPECT_EQ(BuildCompleteMultipartUpload(params, kPayers), BuildCompleteMultipartUpload(params, kPayers));
}

TEST(RequestBuilderTest, WithLeavesOriginalUntouched)
{
  CompleteMultipartUploadRequest original = BaseRequest();
  CompleteMultipartUploadRequest changed = original.WithKey("other");

  EXPECT_EQ(*original.GetKey(), "k");
  EXPECT_EQ(*changed.GetKey(), "other");
  EXPECT_EQ(BuildCompleteMultipartUpload(original, kPayers).path, "/b/k");
}
