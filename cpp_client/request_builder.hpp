#ifndef REQUEST_BUILDER_HPP
#define REQUEST_BUILDER_HPP

#include <string>
#include <vector>
#include "complete_multipart_upload_request.hpp"
#include "request_descriptor.hpp"

// Throws MissingRequiredField for the first of Bucket, Key, UploadId that
// is not set.
void ValidateRequiredFields(const CompleteMultipartUploadRequest& request);

// "/" + bucket + "/" + key, encoded; the key keeps its "/" separators.
std::string BuildObjectPath(const CompleteMultipartUploadRequest& request);

// Builds the POST request completing a multipart upload. All-or-nothing:
// on any RequestBuildError no descriptor is produced. Uses the RequestPayer
// allow-list from Config unless one is passed explicitly.
RequestDescriptor BuildCompleteMultipartUpload(const CompleteMultipartUploadRequest& request);
RequestDescriptor BuildCompleteMultipartUpload(const CompleteMultipartUploadRequest& request,
                                               const std::vector<std::string>& request_payer_values);

#endif // REQUEST_BUILDER_HPP
