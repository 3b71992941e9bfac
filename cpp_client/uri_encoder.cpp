#include "uri_encoder.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>

namespace {

bool IsUnreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

} // namespace

std::string UriEncode(const std::string& str) {
    std::ostringstream res;

    for (const auto& c : str) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (IsUnreserved(uc)) {
            res << c;
        } else {
            res << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
                << static_cast<unsigned int>(uc);
        }
    }

    return res.str();
}

std::string ObjectKeyEncode(const std::string& key) {
    std::string encoded = UriEncode(key);

    std::string res;
    res.reserve(encoded.size());
    for (size_t i = 0; i < encoded.size(); ++i) {
        if (encoded.compare(i, 3, "%2F") == 0) {
            res += '/';
            i += 2;
        } else {
            res += encoded[i];
        }
    }
    return res;
}

std::string BuildQueryString(const std::map<std::string, std::string>& query) {
    std::string res;
    for (const auto& [name, value] : query) {
        if (!res.empty()) {
            res += '&';
        }
        res += UriEncode(name);
        res += '=';
        res += UriEncode(value);
    }
    return res;
}
