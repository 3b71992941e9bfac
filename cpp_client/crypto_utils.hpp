#ifndef CRYPTO_UTILS_HPP
#define CRYPTO_UTILS_HPP

#include <cstddef>
#include <string>

// Raw 32-byte HMAC-SHA256 of msg under key
std::string HmacSha256(const std::string& key, const std::string& msg);

std::string HexEncode(const unsigned char* data, size_t len);
std::string HexEncode(const std::string& data);

// Lower-case hex SHA-256 of str
std::string Sha256Hex(const std::string& str);

// Raw 16-byte MD5 of data
std::string Md5(const unsigned char* data, size_t len);
std::string Md5(const std::string& data);

std::string Base64Encode(const unsigned char* data, size_t len);
std::string Base64Encode(const std::string& data);

#endif // CRYPTO_UTILS_HPP
