#ifndef SSE_CUSTOMER_KEY_HPP
#define SSE_CUSTOMER_KEY_HPP

#include <string>
#include <vector>
#include "complete_multipart_upload_request.hpp"

// Customer-provided key for SSE-C requests.
//
// Holds the raw key material and derives the three header values S3
// expects: the algorithm, the base64 key and the base64 MD5 of the key.
// The raw bytes are wiped when the object is destroyed.
class SseCustomerKey {
public:
    static constexpr size_t KEY_SIZE = 32; // AES-256

    // Generates a new random 256-bit key.
    static SseCustomerKey Generate();

    // Wraps existing key material; S3 rejects anything but 32 bytes, but
    // the length is left for the service to judge.
    static SseCustomerKey FromRawKey(const std::vector<unsigned char>& key);

    SseCustomerKey(const SseCustomerKey& other);
    SseCustomerKey& operator=(const SseCustomerKey& other);
    ~SseCustomerKey();

    std::string Algorithm() const { return "AES256"; }
    std::string KeyBase64() const;
    std::string KeyMd5Base64() const;

    // Copy of request carrying all three SSE-C fields for this key
    CompleteMultipartUploadRequest ApplyTo(const CompleteMultipartUploadRequest& request) const;

private:
    explicit SseCustomerKey(std::vector<unsigned char> key);
    void Wipe();

    std::vector<unsigned char> key_;
};

#endif // SSE_CUSTOMER_KEY_HPP
