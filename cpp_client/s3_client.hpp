#ifndef S3_CLIENT_HPP
#define S3_CLIENT_HPP

#include <ctime>
#include <string>
#include "complete_multipart_upload_request.hpp"
#include "config.hpp"
#include "request_descriptor.hpp"
#include "s3_response.hpp"

class S3Client {
public:
    S3Client(const Config::S3Settings& settings);
    ~S3Client();

    // Builds, points at the configured endpoint and signs the request
    RequestDescriptor Prepare(const CompleteMultipartUploadRequest& request, std::time_t now) const;

    // Performs one HTTP exchange. Throws TransportError if no response arrives.
    HttpResponse Send(const RequestDescriptor& request) const;

    // Completes a multipart upload: Prepare, Send, then parse the answer
    CompleteMultipartUploadResult CompleteMultipartUpload(const CompleteMultipartUploadRequest& request) const;

private:
    Config::S3Settings settings_;
};

#endif // S3_CLIENT_HPP
