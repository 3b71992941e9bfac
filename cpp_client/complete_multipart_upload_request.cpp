#include "complete_multipart_upload_request.hpp"
#include "request_errors.hpp"
#include <cstdint>
#include <limits>

namespace {

std::optional<std::string> ReadString(const nlohmann::json& input, const char* name) {
    auto it = input.find(name);
    if (it == input.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw InvalidInput(name, std::string("expected a string, got ") + it->type_name());
    }
    return it->get<std::string>();
}

std::optional<int> ReadInt(const nlohmann::json& input, const char* name) {
    auto it = input.find(name);
    if (it == input.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_number_integer()) {
        throw InvalidInput(name, std::string("expected an integer, got ") + it->type_name());
    }
    if (it->is_number_unsigned()) {
        if (it->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            throw InvalidInput(name, "value " + it->dump() + " is out of range");
        }
        return static_cast<int>(it->get<std::uint64_t>());
    }
    std::int64_t value = it->get<std::int64_t>();
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw InvalidInput(name, "value " + it->dump() + " is out of range");
    }
    return static_cast<int>(value);
}

CompletedPart PartFromJson(const nlohmann::json& input) {
    if (!input.is_object()) {
        throw InvalidInput("Parts", std::string("expected an object per part, got ") + input.type_name());
    }

    CompletedPart part;
    part.part_number = ReadInt(input, "PartNumber");
    part.etag = ReadString(input, "ETag");
    part.checksum_crc32 = ReadString(input, "ChecksumCRC32");
    part.checksum_crc32c = ReadString(input, "ChecksumCRC32C");
    part.checksum_sha1 = ReadString(input, "ChecksumSHA1");
    part.checksum_sha256 = ReadString(input, "ChecksumSHA256");
    return part;
}

std::optional<CompletedMultipartUpload> MultipartUploadFromJson(const nlohmann::json& input) {
    auto it = input.find("MultipartUpload");
    if (it == input.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_object()) {
        throw InvalidInput("MultipartUpload", std::string("expected an object, got ") + it->type_name());
    }

    CompletedMultipartUpload upload;
    auto parts = it->find("Parts");
    if (parts == it->end() || parts->is_null()) {
        return upload;
    }
    if (!parts->is_array()) {
        throw InvalidInput("Parts", std::string("expected an array, got ") + parts->type_name());
    }

    upload.parts.reserve(parts->size());
    for (const auto& part : *parts) {
        upload.parts.push_back(PartFromJson(part));
    }
    return upload;
}

} // namespace

CompleteMultipartUploadRequest CompleteMultipartUploadRequest::FromJson(const nlohmann::json& input) {
    if (!input.is_object()) {
        throw InvalidInput("input", std::string("expected an object, got ") + input.type_name());
    }

    CompleteMultipartUploadRequest request;
    request.bucket_ = ReadString(input, "Bucket");
    request.key_ = ReadString(input, "Key");
    request.multipart_upload_ = MultipartUploadFromJson(input);
    request.upload_id_ = ReadString(input, "UploadId");
    request.checksum_crc32_ = ReadString(input, "ChecksumCRC32");
    request.checksum_crc32c_ = ReadString(input, "ChecksumCRC32C");
    request.checksum_sha1_ = ReadString(input, "ChecksumSHA1");
    request.checksum_sha256_ = ReadString(input, "ChecksumSHA256");
    request.request_payer_ = ReadString(input, "RequestPayer");
    request.expected_bucket_owner_ = ReadString(input, "ExpectedBucketOwner");
    request.if_match_ = ReadString(input, "IfMatch");
    request.if_none_match_ = ReadString(input, "IfNoneMatch");
    request.sse_customer_algorithm_ = ReadString(input, "SSECustomerAlgorithm");
    request.sse_customer_key_ = ReadString(input, "SSECustomerKey");
    request.sse_customer_key_md5_ = ReadString(input, "SSECustomerKeyMD5");
    request.region_ = ReadString(input, "@region");
    return request;
}
