#include "header_assembler.hpp"
#include "request_errors.hpp"
#include <algorithm>

namespace {

void SetIfPresent(std::map<std::string, std::string>& headers, const char* name,
                  const std::optional<std::string>& value) {
    if (value) {
        headers[name] = *value;
    }
}

} // namespace

std::map<std::string, std::string> AssembleHeaders(const CompleteMultipartUploadRequest& request,
                                                   const std::vector<std::string>& request_payer_values) {
    std::map<std::string, std::string> headers;
    headers["content-type"] = "application/xml";

    SetIfPresent(headers, "x-amz-checksum-crc32", request.GetChecksumCrc32());
    SetIfPresent(headers, "x-amz-checksum-crc32c", request.GetChecksumCrc32C());
    SetIfPresent(headers, "x-amz-checksum-sha1", request.GetChecksumSha1());
    SetIfPresent(headers, "x-amz-checksum-sha256", request.GetChecksumSha256());

    if (const auto& payer = request.GetRequestPayer()) {
        if (std::find(request_payer_values.begin(), request_payer_values.end(), *payer) ==
            request_payer_values.end()) {
            throw InvalidEnumValue("RequestPayer", *payer);
        }
        headers["x-amz-request-payer"] = *payer;
    }

    SetIfPresent(headers, "x-amz-expected-bucket-owner", request.GetExpectedBucketOwner());
    SetIfPresent(headers, "If-Match", request.GetIfMatch());
    SetIfPresent(headers, "If-None-Match", request.GetIfNoneMatch());
    SetIfPresent(headers, "x-amz-server-side-encryption-customer-algorithm", request.GetSseCustomerAlgorithm());
    SetIfPresent(headers, "x-amz-server-side-encryption-customer-key", request.GetSseCustomerKey());
    SetIfPresent(headers, "x-amz-server-side-encryption-customer-key-MD5", request.GetSseCustomerKeyMd5());

    return headers;
}
