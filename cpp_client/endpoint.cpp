#include "endpoint.hpp"
#include "uri_encoder.hpp"

bool IsVirtualHostable(const std::string& bucket, bool use_https) {
    if (bucket.size() < 3 || bucket.size() > 63) {
        return false;
    }
    auto is_lower_alnum = [](char c) { return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9'); };
    if (!is_lower_alnum(bucket.front()) || !is_lower_alnum(bucket.back())) {
        return false;
    }
    for (size_t i = 0; i < bucket.size(); ++i) {
        char c = bucket[i];
        if (c == '.') {
            if (use_https || bucket[i - 1] == '.') return false;
        } else if (c != '-' && !is_lower_alnum(c)) {
            return false;
        }
    }
    return true;
}

std::string DefaultHost(const std::string& region) {
    if (region.empty() || region == "us-east-1") {
        return "s3.amazonaws.com";
    }
    return "s3." + region + ".amazonaws.com";
}

std::string EffectiveRegion(const Config::S3Settings& settings, const std::optional<std::string>& region_override) {
    if (region_override && !region_override->empty()) {
        return *region_override;
    }
    return settings.region;
}

RequestDescriptor ApplyEndpoint(const RequestDescriptor& request, const std::string& bucket,
                                const Config::S3Settings& settings,
                                const std::optional<std::string>& region_override) {
    std::string host = settings.endpoint.empty() ? DefaultHost(EffectiveRegion(settings, region_override))
                                                 : settings.endpoint;
    std::string scheme = settings.use_https ? "https://" : "http://";

    RequestDescriptor decorated = request;
    std::string bucket_prefix = "/" + UriEncode(bucket);

    if (!settings.path_style && IsVirtualHostable(bucket, settings.use_https) &&
        decorated.path.compare(0, bucket_prefix.size() + 1, bucket_prefix + "/") == 0) {
        host = bucket + "." + host;
        decorated.path = decorated.path.substr(bucket_prefix.size());
    }

    decorated.endpoint = scheme + host;
    decorated.headers["host"] = host;
    return decorated;
}
