#ifndef URI_ENCODER_HPP
#define URI_ENCODER_HPP

#include <map>
#include <string>

// Percent-encodes everything outside the RFC 3986 unreserved set
// (A-Z a-z 0-9 - . _ ~), with upper-case hex digits.
std::string UriEncode(const std::string& str);

// Encodes an object key for use in a path: the whole key is encoded, then
// every "%2F" is turned back into "/" so the key's hierarchy stays visible.
std::string ObjectKeyEncode(const std::string& key);

// "k1=v1&k2=v2" with keys and values UriEncode'd, in key order.
std::string BuildQueryString(const std::map<std::string, std::string>& query);

#endif // URI_ENCODER_HPP
