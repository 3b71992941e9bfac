#ifndef COMPLETE_MULTIPART_UPLOAD_REQUEST_HPP
#define COMPLETE_MULTIPART_UPLOAD_REQUEST_HPP

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

// One uploaded part referenced by the complete call.
struct CompletedPart {
    std::optional<int> part_number;
    std::optional<std::string> etag;
    std::optional<std::string> checksum_crc32;
    std::optional<std::string> checksum_crc32c;
    std::optional<std::string> checksum_sha1;
    std::optional<std::string> checksum_sha256;

    bool operator==(const CompletedPart& other) const {
        return part_number == other.part_number && etag == other.etag &&
               checksum_crc32 == other.checksum_crc32 && checksum_crc32c == other.checksum_crc32c &&
               checksum_sha1 == other.checksum_sha1 && checksum_sha256 == other.checksum_sha256;
    }
};

// Parts in the order the caller listed them. The service reads them in
// this order, so nothing downstream may sort them.
struct CompletedMultipartUpload {
    std::vector<CompletedPart> parts;

    bool operator==(const CompletedMultipartUpload& other) const { return parts == other.parts; }
};

// Parameters of a CompleteMultipartUpload call.
//
// The value is immutable: every With* call returns a modified copy and
// leaves the original alone, so one instance can be shared across threads
// and built from any number of times.
class CompleteMultipartUploadRequest {
public:
    using OptionalString = std::optional<std::string>;

    CompleteMultipartUploadRequest() = default;

    // Builds the parameters from a JSON object keyed like the S3 API
    // ("Bucket", "Key", "UploadId", "MultipartUpload", ...). Absent keys and
    // JSON nulls both mean "not set". Throws InvalidInput on wrong types.
    static CompleteMultipartUploadRequest FromJson(const nlohmann::json& input);

    const OptionalString& GetBucket() const { return bucket_; }
    const OptionalString& GetKey() const { return key_; }
    const OptionalString& GetUploadId() const { return upload_id_; }
    const std::optional<CompletedMultipartUpload>& GetMultipartUpload() const { return multipart_upload_; }
    const OptionalString& GetChecksumCrc32() const { return checksum_crc32_; }
    const OptionalString& GetChecksumCrc32C() const { return checksum_crc32c_; }
    const OptionalString& GetChecksumSha1() const { return checksum_sha1_; }
    const OptionalString& GetChecksumSha256() const { return checksum_sha256_; }
    const OptionalString& GetRequestPayer() const { return request_payer_; }
    const OptionalString& GetExpectedBucketOwner() const { return expected_bucket_owner_; }
    const OptionalString& GetIfMatch() const { return if_match_; }
    const OptionalString& GetIfNoneMatch() const { return if_none_match_; }
    const OptionalString& GetSseCustomerAlgorithm() const { return sse_customer_algorithm_; }
    const OptionalString& GetSseCustomerKey() const { return sse_customer_key_; }
    const OptionalString& GetSseCustomerKeyMd5() const { return sse_customer_key_md5_; }

    // Per-request region override ("@region"); only the endpoint layer reads it.
    const OptionalString& GetRegion() const { return region_; }

    CompleteMultipartUploadRequest WithBucket(OptionalString value) const {
        return With(&CompleteMultipartUploadRequest::bucket_, std::move(value));
    }
    CompleteMultipartUploadRequest WithKey(OptionalString value) const {
        return With(&CompleteMultipartUploadRequest::key_, std::move(value));
    }
    CompleteMultipartUploadRequest WithUploadId(OptionalString value) const {
        return With(&CompleteMultipartUploadRequest::upload_id_, std::move(value));
    }
    CompleteMultipartUploadRequest WithMultipartUpload(std::optional<CompletedMultipartUpload> value) const {
        return With(&CompleteMultipartUploadRequest::multipart_upload_, std::move(value));
    }
    CompleteMultipartUploadRequest WithChecksumCrc32(OptionalString value) const {
        return With(&CompleteMultipartUploadRequest::checksum_crc32_, std::move(value));
    }
    CompleteMultipartUploadRequest WithChecksumCrc32C(OptionalString value) const {
        return With(&CompleteMultipartUploadRequest::checksum_crc32c_, std::move(value));
    }
    CompleteMultipartUploadRequest WithChecksumSha1(OptionalString value) const {
        return With(&CompleteMultipartUploadRequest::checksum_sha1_, std::move(value));
    }
    CompleteMultipartUploadRequest WithChecksumSha256(OptionalString value) const {
        return With(&CompleteMultipartUploadRequest::checksum_sha256_, std::move(value));
    }
    CompleteMultipartUploadRequest WithRequestPayer(OptionalString value) const {
        return With(&CompleteMultipartUploadRequest::request_payer_, std::move(value));
    }
    CompleteMultipartUploadRequest WithExpectedBucketOwner(OptionalString value) const {
        return With(&CompleteMultipartUploadRequest::expected_bucket_owner_, std::move(value));
    }
    CompleteMultipartUploadRequest WithIfMatch(OptionalString value) const {
        return With(&CompleteMultipartUploadRequest::if_match_, std::move(value));
    }
    CompleteMultipartUploadRequest WithIfNoneMatch(OptionalString value) const {
        return With(&CompleteMultipartUploadRequest::if_none_match_, std::move(value));
    }
    CompleteMultipartUploadRequest WithSseCustomerAlgorithm(OptionalString value) const {
        return With(&CompleteMultipartUploadRequest::sse_customer_algorithm_, std::move(value));
    }
    CompleteMultipartUploadRequest WithSseCustomerKey(OptionalString value) const {
        return With(&CompleteMultipartUploadRequest::sse_customer_key_, std::move(value));
    }
    CompleteMultipartUploadRequest WithSseCustomerKeyMd5(OptionalString value) const {
        return With(&CompleteMultipartUploadRequest::sse_customer_key_md5_, std::move(value));
    }
    CompleteMultipartUploadRequest WithRegion(OptionalString value) const {
        return With(&CompleteMultipartUploadRequest::region_, std::move(value));
    }

private:
    template <typename T>
    CompleteMultipartUploadRequest With(T CompleteMultipartUploadRequest::*field, T value) const {
        CompleteMultipartUploadRequest copy(*this);
        copy.*field = std::move(value);
        return copy;
    }

    OptionalString bucket_;
    OptionalString key_;
    OptionalString upload_id_;
    std::optional<CompletedMultipartUpload> multipart_upload_;
    OptionalString checksum_crc32_;
    OptionalString checksum_crc32c_;
    OptionalString checksum_sha1_;
    OptionalString checksum_sha256_;
    OptionalString request_payer_;
    OptionalString expected_bucket_owner_;
    OptionalString if_match_;
    OptionalString if_none_match_;
    OptionalString sse_customer_algorithm_;
    OptionalString sse_customer_key_;
    OptionalString sse_customer_key_md5_;
    OptionalString region_;
};

#endif // COMPLETE_MULTIPART_UPLOAD_REQUEST_HPP
