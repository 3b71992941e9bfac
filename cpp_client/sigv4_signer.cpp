#include "sigv4_signer.hpp"
#include "crypto_utils.hpp"
#include "uri_encoder.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace {

const char* const kService = "s3";

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

// Leading/trailing blanks removed, inner runs of blanks collapsed to one
std::string TrimAll(const std::string& value) {
    std::string res;
    bool pending_space = false;
    for (char c : value) {
        if (c == ' ' || c == '\t') {
            pending_space = !res.empty();
        } else {
            if (pending_space) res += ' ';
            pending_space = false;
            res += c;
        }
    }
    return res;
}

std::string CanonicalQuery(const std::map<std::string, std::string>& query) {
    std::vector<std::pair<std::string, std::string>> encoded;
    encoded.reserve(query.size());
    for (const auto& [name, value] : query) {
        encoded.emplace_back(UriEncode(name), UriEncode(value));
    }
    std::sort(encoded.begin(), encoded.end());

    std::string res;
    for (const auto& [name, value] : encoded) {
        if (!res.empty()) res += '&';
        res += name + "=" + value;
    }
    return res;
}

std::string FormatTime(std::time_t now, const char* format) {
    std::tm tm_utc{};
    gmtime_r(&now, &tm_utc);
    char buf[32];
    size_t len = std::strftime(buf, sizeof(buf), format, &tm_utc);
    return std::string(buf, len);
}

} // namespace

RequestDescriptor SignRequest(const RequestDescriptor& request, const Credentials& credentials,
                              const std::string& region, std::time_t now) {
    std::string date_iso = FormatTime(now, "%Y%m%dT%H%M%SZ");
    std::string date_ymd = FormatTime(now, "%Y%m%d");
    std::string payload_hash = Sha256Hex(request.body);

    RequestDescriptor signed_request = request;
    signed_request.headers["x-amz-date"] = date_iso;
    signed_request.headers["x-amz-content-sha256"] = payload_hash;
    if (!credentials.session_token.empty()) {
        signed_request.headers["x-amz-security-token"] = credentials.session_token;
    }

    // Lower-cased names in sorted order; same-name headers are comma-joined
    std::map<std::string, std::string> canonical_headers;
    for (const auto& [name, value] : signed_request.headers) {
        std::string lname = ToLower(name);
        if (lname == "authorization") continue;
        auto& slot = canonical_headers[lname];
        slot = slot.empty() ? TrimAll(value) : slot + "," + TrimAll(value);
    }
    if (canonical_headers.find("host") == canonical_headers.end()) {
        throw std::invalid_argument("Cannot sign a request without a host header");
    }

    std::string signed_headers;
    std::stringstream header_block;
    for (const auto& [name, value] : canonical_headers) {
        header_block << name << ":" << value << "\n";
        if (!signed_headers.empty()) signed_headers += ';';
        signed_headers += name;
    }

    // 1. Canonical Request
    std::stringstream canonical_req;
    canonical_req << request.method << "\n"
                  << request.path << "\n"
                  << CanonicalQuery(request.query) << "\n"
                  << header_block.str() << "\n"
                  << signed_headers << "\n"
                  << payload_hash;

    // 2. String to Sign
    std::string scope = date_ymd + "/" + region + "/" + kService + "/aws4_request";
    std::stringstream string_to_sign;
    string_to_sign << "AWS4-HMAC-SHA256\n"
                   << date_iso << "\n"
                   << scope << "\n"
                   << Sha256Hex(canonical_req.str());

    // 3. Signature
    std::string k_date = HmacSha256("AWS4" + credentials.secret_key, date_ymd);
    std::string k_region = HmacSha256(k_date, region);
    std::string k_service = HmacSha256(k_region, kService);
    std::string k_signing = HmacSha256(k_service, "aws4_request");
    std::string signature = HexEncode(HmacSha256(k_signing, string_to_sign.str()));

    // 4. Header
    std::stringstream auth_header;
    auth_header << "AWS4-HMAC-SHA256 Credential=" << credentials.access_key << "/" << scope
                << ", SignedHeaders=" << signed_headers << ", Signature=" << signature;
    signed_request.headers["Authorization"] = auth_header.str();

    return signed_request;
}
