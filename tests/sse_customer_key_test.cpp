#include "sse_customer_key.hpp"
#include "crypto_utils.hpp"

#include <gtest/gtest.h>

TEST(SseCustomerKeyTest, Base64Helpers)
{
  EXPECT_EQ(Base64Encode(""), "");
  EXPECT_EQ(Base64Encode("abc"), "YWJj");
  EXPECT_EQ(Base64Encode("ab"), "YWI=");
  EXPECT_EQ(Base64Encode(Md5("abc")), "kAFQmDzST7DWlj99KOF/cg==");

  const unsigned char raw[] = {'a', 'b', 'c'};
  EXPECT_EQ(Base64Encode(raw, sizeof(raw)), "YWJj");
  EXPECT_EQ(Md5(raw, sizeof(raw)), Md5("abc"));
  EXPECT_EQ(Base64Encode(raw, 0), "");
}

TEST(SseCustomerKeyTest, FromRawKey)
{
  std::vector<unsigned char> raw(32);
  for (size_t i = 0; i < raw.size(); ++i) raw[i] = static_cast<unsigned char>(i);

  SseCustomerKey key = SseCustomerKey::FromRawKey(raw);
  EXPECT_EQ(key.Algorithm(), "AES256");
  EXPECT_EQ(key.KeyBase64(), "AAECAwQFBgcICQoLDA0ODxAREhMUFRYXGBkaGxwdHh8=");
  EXPECT_EQ(key.KeyMd5Base64(), "tP/LI3N87DFaSk0aoqYgzg==");
}

TEST(SseCustomerKeyTest, EmptyKeyRejected)
{
  EXPECT_THROW(SseCustomerKey::FromRawKey({}), std::invalid_argument);
}

TEST(SseCustomerKeyTest, GeneratedKeysDiffer)
{
  SseCustomerKey a = SseCustomerKey::Generate();
  SseCustomerKey b = SseCustomerKey::Generate();
  EXPECT_EQ(a.KeyBase64().size(), 44u); // 32 bytes
  EXPECT_NE(a.KeyBase64(), b.KeyBase64());
}

TEST(SseCustomerKeyTest, ApplyToSetsAllThreeFields)
{
  SseCustomerKey key = SseCustomerKey::Generate();
  CompleteMultipartUploadRequest request = CompleteMultipartUploadRequest().WithBucket("b");
  CompleteMultipartUploadRequest keyed = key.ApplyTo(request);

  EXPECT_FALSE(request.GetSseCustomerKey().has_value());
  EXPECT_EQ(keyed.GetSseCustomerAlgorithm(), "AES256");
  EXPECT_EQ(keyed.GetSseCustomerKey(), key.KeyBase64());
  EXPECT_EQ(keyed.GetSseCustomerKeyMd5(), key.KeyMd5Base64());
  EXPECT_EQ(keyed.GetBucket(), "b");
}

TEST(SseCustomerKeyTest, CopiesShareMaterial)
{
  SseCustomerKey key = SseCustomerKey::Generate();
  SseCustomerKey copy = key;
  EXPECT_EQ(copy.KeyBase64(), key.KeyBase64());

  SseCustomerKey other = SseCustomerKey::Generate();
  other = key;
  EXPECT_EQ(other.KeyMd5Base64(), key.KeyMd5Base64());
}
