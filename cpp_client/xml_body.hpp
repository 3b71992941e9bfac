#ifndef XML_BODY_HPP
#define XML_BODY_HPP

#include <optional>
#include <string>
#include "complete_multipart_upload_request.hpp"

constexpr const char* S3_XML_NAMESPACE = "http://s3.amazonaws.com/doc/2006-03-01/";

// Serializes the part list into a compact UTF-8 CompleteMultipartUpload
// document. Without a part list the result is empty (no document at all).
// Parts are written in the order given. Throws SerializationError if the
// content cannot be represented as well-formed XML.
std::string SerializeCompleteMultipartUpload(const std::optional<CompletedMultipartUpload>& upload);

#endif // XML_BODY_HPP
