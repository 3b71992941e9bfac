#ifndef REQUEST_DESCRIPTOR_HPP
#define REQUEST_DESCRIPTOR_HPP

#include <map>
#include <string>
#include "uri_encoder.hpp"

// An outbound HTTP request, ready for any transport.
struct RequestDescriptor {
    std::string method;
    std::string path;                            // already percent-encoded
    std::map<std::string, std::string> query;    // raw values, encoded on render
    std::map<std::string, std::string> headers;
    std::string body;

    // "scheme://host[:port]", empty until ApplyEndpoint runs
    std::string endpoint;

    std::string QueryString() const { return BuildQueryString(query); }

    // Path plus query, as it appears on the request line
    std::string Target() const {
        std::string qs = QueryString();
        return qs.empty() ? path : path + "?" + qs;
    }

    std::string Url() const { return endpoint + Target(); }

    bool operator==(const RequestDescriptor& other) const {
        return method == other.method && path == other.path && query == other.query &&
               headers == other.headers && body == other.body && endpoint == other.endpoint;
    }
    bool operator!=(const RequestDescriptor& other) const { return !(*this == other); }
};

#endif // REQUEST_DESCRIPTOR_HPP
