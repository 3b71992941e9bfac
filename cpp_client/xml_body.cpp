#include "xml_body.hpp"
#include "request_errors.hpp"
#include <libxml/tree.h>
#include <libxml/xmlstring.h>
#include <algorithm>
#include <memory>

namespace {

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};
using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

struct XmlBufferDeleter {
    void operator()(xmlChar* mem) const { xmlFree(mem); }
};

// XML 1.0 Char: tab, LF, CR, and U+0020..U+10FFFF minus surrogates, U+FFFE, U+FFFF
bool IsXmlChar(int c) {
    if (c < 0x20) {
        return c == '\t' || c == '\n' || c == '\r';
    }
    if (c >= 0xD800 && c <= 0xDFFF) {
        return false;
    }
    return c != 0xFFFE && c != 0xFFFF && c <= 0x10FFFF;
}

// Text must be valid UTF-8 and free of characters XML 1.0 cannot carry.
void CheckText(const char* element, const std::string& text) {
    const auto* cursor = reinterpret_cast<const unsigned char*>(text.data());
    size_t remaining = text.size();
    while (remaining > 0) {
        int len = static_cast<int>(std::min<size_t>(remaining, 4));
        int c = xmlGetUTF8Char(cursor, &len);
        if (c < 0 || len <= 0) {
            throw SerializationError(std::string("invalid UTF-8 in <") + element + ">");
        }
        if (!IsXmlChar(c)) {
            throw SerializationError(std::string("character not allowed in XML in <") + element + ">");
        }
        cursor += len;
        remaining -= static_cast<size_t>(len);
    }
}

void AddTextElement(xmlNodePtr parent, const char* name, const std::string& text) {
    CheckText(name, text);
    // xmlNewTextChild escapes the content, xmlNewChild would not
    if (xmlNewTextChild(parent, nullptr, BAD_CAST name, BAD_CAST text.c_str()) == nullptr) {
        throw SerializationError(std::string("cannot create <") + name + ">");
    }
}

void AddTextElement(xmlNodePtr parent, const char* name, const std::optional<std::string>& text) {
    if (text) {
        AddTextElement(parent, name, *text);
    }
}

void AddPart(xmlNodePtr root, const CompletedPart& part) {
    xmlNodePtr node = xmlNewChild(root, nullptr, BAD_CAST "Part", nullptr);
    if (node == nullptr) {
        throw SerializationError("cannot create <Part>");
    }

    if (part.part_number) {
        AddTextElement(node, "PartNumber", std::to_string(*part.part_number));
    }
    AddTextElement(node, "ETag", part.etag);
    AddTextElement(node, "ChecksumCRC32", part.checksum_crc32);
    AddTextElement(node, "ChecksumCRC32C", part.checksum_crc32c);
    AddTextElement(node, "ChecksumSHA1", part.checksum_sha1);
    AddTextElement(node, "ChecksumSHA256", part.checksum_sha256);
}

} // namespace

std::string SerializeCompleteMultipartUpload(const std::optional<CompletedMultipartUpload>& upload) {
    if (!upload) {
        return std::string();
    }

    XmlDocPtr doc(xmlNewDoc(BAD_CAST "1.0"));
    if (!doc) {
        throw SerializationError("cannot allocate document");
    }

    xmlNodePtr root = xmlNewDocNode(doc.get(), nullptr, BAD_CAST "CompleteMultipartUpload", nullptr);
    if (root == nullptr) {
        throw SerializationError("cannot create <CompleteMultipartUpload>");
    }
    xmlDocSetRootElement(doc.get(), root);

    xmlNsPtr ns = xmlNewNs(root, BAD_CAST S3_XML_NAMESPACE, nullptr);
    if (ns == nullptr) {
        throw SerializationError("cannot declare namespace");
    }
    xmlSetNs(root, ns);

    for (const auto& part : upload->parts) {
        AddPart(root, part);
    }

    xmlChar* mem = nullptr;
    int size = 0;
    xmlDocDumpFormatMemoryEnc(doc.get(), &mem, &size, "UTF-8", 0);
    std::unique_ptr<xmlChar, XmlBufferDeleter> buffer(mem);
    if (!buffer || size <= 0) {
        throw SerializationError("cannot write document");
    }

    return std::string(reinterpret_cast<const char*>(buffer.get()), static_cast<size_t>(size));
}
