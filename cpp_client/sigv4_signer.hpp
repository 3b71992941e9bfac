#ifndef SIGV4_SIGNER_HPP
#define SIGV4_SIGNER_HPP

#include <ctime>
#include <string>
#include "request_descriptor.hpp"

struct Credentials {
    std::string access_key;
    std::string secret_key;
    std::string session_token; // optional
};

// Signs a request with AWS Signature Version 4 for the "s3" service.
//
// Adds x-amz-date, x-amz-content-sha256 (SHA-256 of the body),
// x-amz-security-token when a session token is set, and Authorization.
// Every header already on the request is signed. The request must carry a
// "host" header (see ApplyEndpoint); otherwise std::invalid_argument.
RequestDescriptor SignRequest(const RequestDescriptor& request, const Credentials& credentials,
                              const std::string& region, std::time_t now);

#endif // SIGV4_SIGNER_HPP
