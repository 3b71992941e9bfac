#ifndef ENDPOINT_HPP
#define ENDPOINT_HPP

#include <optional>
#include <string>
#include "config.hpp"
#include "request_descriptor.hpp"

// True when the bucket can be used as a DNS label prefix
// ("<bucket>.<host>"). Dotted names only qualify over plain http, since
// they break wildcard certificate matching.
bool IsVirtualHostable(const std::string& bucket, bool use_https);

// Host serving the given region when no endpoint is configured
std::string DefaultHost(const std::string& region);

// Region actually used for a request: the override if set, else the config
std::string EffectiveRegion(const Config::S3Settings& settings, const std::optional<std::string>& region_override);

// Points a built request at a concrete endpoint. Sets the "host" header and
// the descriptor endpoint; in virtual-hosted style the bucket moves from the
// path into the host name. The input descriptor is not modified.
RequestDescriptor ApplyEndpoint(const RequestDescriptor& request, const std::string& bucket,
                                const Config::S3Settings& settings,
                                const std::optional<std::string>& region_override = std::nullopt);

#endif // ENDPOINT_HPP
