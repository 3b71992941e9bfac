#include "s3_response.hpp"
#include "request_errors.hpp"
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <memory>

namespace {

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};
using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

std::string NodeText(xmlNodePtr node) {
    xmlChar* content = xmlNodeGetContent(node);
    if (content == nullptr) {
        return std::string();
    }
    std::string text(reinterpret_cast<const char*>(content));
    xmlFree(content);
    return text;
}

// Text of the first child element called name, if any
std::optional<std::string> ChildText(xmlNodePtr parent, const char* name) {
    for (xmlNodePtr child = parent->children; child != nullptr; child = child->next) {
        if (child->type == XML_ELEMENT_NODE && xmlStrEqual(child->name, BAD_CAST name)) {
            return NodeText(child);
        }
    }
    return std::nullopt;
}

std::optional<std::string> Header(const HttpResponse& response, const char* name) {
    auto it = response.headers.find(name);
    if (it == response.headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

XmlDocPtr ParseBody(const std::string& body) {
    return XmlDocPtr(xmlReadMemory(body.data(), static_cast<int>(body.size()), "response.xml", nullptr,
                                   XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
}

void ThrowServiceError(const HttpResponse& response, xmlNodePtr error) {
    std::string request_id = Header(response, "x-amz-request-id").value_or("");
    if (error == nullptr) {
        throw S3ServiceError(response.status, "", "", request_id);
    }
    throw S3ServiceError(response.status, ChildText(error, "Code").value_or(""),
                         ChildText(error, "Message").value_or(""),
                         ChildText(error, "RequestId").value_or(request_id));
}

} // namespace

CompleteMultipartUploadResult ParseCompleteMultipartUploadResponse(const HttpResponse& response) {
    bool error_status = response.status >= 300;

    CompleteMultipartUploadResult result;
    if (!response.body.empty()) {
        XmlDocPtr doc = ParseBody(response.body);
        xmlNodePtr root = doc ? xmlDocGetRootElement(doc.get()) : nullptr;
        if (root == nullptr) {
            if (error_status) {
                ThrowServiceError(response, nullptr);
            }
            throw SerializationError("response body is not an XML document");
        }

        if (xmlStrEqual(root->name, BAD_CAST "Error")) {
            ThrowServiceError(response, root);
        }
        if (error_status) {
            ThrowServiceError(response, nullptr);
        }

        result.location = ChildText(root, "Location");
        result.bucket = ChildText(root, "Bucket");
        result.key = ChildText(root, "Key");
        result.etag = ChildText(root, "ETag");
        result.checksum_crc32 = ChildText(root, "ChecksumCRC32");
        result.checksum_crc32c = ChildText(root, "ChecksumCRC32C");
        result.checksum_sha1 = ChildText(root, "ChecksumSHA1");
        result.checksum_sha256 = ChildText(root, "ChecksumSHA256");
    } else if (error_status) {
        ThrowServiceError(response, nullptr);
    }

    result.expiration = Header(response, "x-amz-expiration");
    result.server_side_encryption = Header(response, "x-amz-server-side-encryption");
    result.version_id = Header(response, "x-amz-version-id");
    result.sse_kms_key_id = Header(response, "x-amz-server-side-encryption-aws-kms-key-id");
    if (auto enabled = Header(response, "x-amz-server-side-encryption-bucket-key-enabled")) {
        result.bucket_key_enabled = (*enabled == "true");
    }
    result.request_charged = Header(response, "x-amz-request-charged");

    return result;
}
