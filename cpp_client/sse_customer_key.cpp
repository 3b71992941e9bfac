#include "sse_customer_key.hpp"
#include "crypto_utils.hpp"
#include <openssl/crypto.h>
#include <openssl/rand.h>
#include <stdexcept>

SseCustomerKey::SseCustomerKey(std::vector<unsigned char> key) : key_(std::move(key)) {}

SseCustomerKey::SseCustomerKey(const SseCustomerKey& other) : key_(other.key_) {}

SseCustomerKey& SseCustomerKey::operator=(const SseCustomerKey& other) {
    if (this != &other) {
        Wipe();
        key_ = other.key_;
    }
    return *this;
}

SseCustomerKey::~SseCustomerKey() {
    Wipe();
}

void SseCustomerKey::Wipe() {
    if (!key_.empty()) {
        OPENSSL_cleanse(key_.data(), key_.size());
    }
}

SseCustomerKey SseCustomerKey::Generate() {
    std::vector<unsigned char> key(KEY_SIZE);
    if (RAND_bytes(key.data(), KEY_SIZE) != 1) {
        throw std::runtime_error("Failed to generate random key.");
    }
    return SseCustomerKey(std::move(key));
}

SseCustomerKey SseCustomerKey::FromRawKey(const std::vector<unsigned char>& key) {
    if (key.empty()) {
        throw std::invalid_argument("SSE-C key material is empty");
    }
    return SseCustomerKey(key);
}

std::string SseCustomerKey::KeyBase64() const {
    return Base64Encode(key_.data(), key_.size());
}

std::string SseCustomerKey::KeyMd5Base64() const {
    return Base64Encode(Md5(key_.data(), key_.size()));
}

CompleteMultipartUploadRequest SseCustomerKey::ApplyTo(const CompleteMultipartUploadRequest& request) const {
    return request.WithSseCustomerAlgorithm(Algorithm())
                  .WithSseCustomerKey(KeyBase64())
                  .WithSseCustomerKeyMd5(KeyMd5Base64());
}
