#include "request_builder.hpp"
#include "config.hpp"
#include "header_assembler.hpp"
#include "request_errors.hpp"
#include "uri_encoder.hpp"
#include "xml_body.hpp"

void ValidateRequiredFields(const CompleteMultipartUploadRequest& request) {
    if (!request.GetBucket()) throw MissingRequiredField("Bucket");
    if (!request.GetKey()) throw MissingRequiredField("Key");
    if (!request.GetUploadId()) throw MissingRequiredField("UploadId");
}

std::string BuildObjectPath(const CompleteMultipartUploadRequest& request) {
    const auto& bucket = request.GetBucket();
    if (!bucket) throw MissingRequiredField("Bucket");
    const auto& key = request.GetKey();
    if (!key) throw MissingRequiredField("Key");

    return "/" + UriEncode(*bucket) + "/" + ObjectKeyEncode(*key);
}

RequestDescriptor BuildCompleteMultipartUpload(const CompleteMultipartUploadRequest& request) {
    return BuildCompleteMultipartUpload(request, Config::Instance().Get().request_payer_values);
}

RequestDescriptor BuildCompleteMultipartUpload(const CompleteMultipartUploadRequest& request,
                                               const std::vector<std::string>& request_payer_values) {
    ValidateRequiredFields(request);

    RequestDescriptor descriptor;
    descriptor.method = "POST";
    descriptor.headers = AssembleHeaders(request, request_payer_values);
    descriptor.query["uploadId"] = *request.GetUploadId();
    descriptor.path = BuildObjectPath(request);
    descriptor.body = SerializeCompleteMultipartUpload(request.GetMultipartUpload());

    return descriptor;
}
