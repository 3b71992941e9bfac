#ifndef S3_RESPONSE_HPP
#define S3_RESPONSE_HPP

#include <map>
#include <optional>
#include <stdexcept>
#include <string>

struct HttpResponse {
    long status = 0;
    std::map<std::string, std::string> headers; // names lower-cased
    std::string body;
};

struct CompleteMultipartUploadResult {
    std::optional<std::string> location;
    std::optional<std::string> bucket;
    std::optional<std::string> key;
    std::optional<std::string> etag;
    std::optional<std::string> checksum_crc32;
    std::optional<std::string> checksum_crc32c;
    std::optional<std::string> checksum_sha1;
    std::optional<std::string> checksum_sha256;

    // From response headers
    std::optional<std::string> expiration;
    std::optional<std::string> server_side_encryption;
    std::optional<std::string> version_id;
    std::optional<std::string> sse_kms_key_id;
    std::optional<bool> bucket_key_enabled;
    std::optional<std::string> request_charged;
};

// The service answered with an S3 <Error> document or an error status.
class S3ServiceError : public std::runtime_error {
public:
    S3ServiceError(long status, const std::string& code, const std::string& message, const std::string& request_id)
        : std::runtime_error("S3 error " + std::to_string(status) + (code.empty() ? "" : " " + code) +
                             (message.empty() ? "" : ": " + message)),
          status_(status), code_(code), message_(message), request_id_(request_id) {}

    long status() const { return status_; }
    const std::string& code() const { return code_; }
    const std::string& message() const { return message_; }
    const std::string& request_id() const { return request_id_; }

private:
    long status_;
    std::string code_;
    std::string message_;
    std::string request_id_;
};

// The request never produced an HTTP response.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

// Interprets the answer to a CompleteMultipartUpload call. S3 can report a
// failure with status 200 and an <Error> body once the request has been
// accepted, so the body is checked even on success statuses.
//
// Throws S3ServiceError for error answers and SerializationError for
// bodies that are not XML.
CompleteMultipartUploadResult ParseCompleteMultipartUploadResponse(const HttpResponse& response);

#endif // S3_RESPONSE_HPP
