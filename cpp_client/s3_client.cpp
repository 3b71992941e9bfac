#include "s3_client.hpp"
#include "endpoint.hpp"
#include "logger.hpp"
#include "request_builder.hpp"
#include "sigv4_signer.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>

namespace {

// Collects the response body
size_t WriteCallback(void* ptr, size_t size, size_t nmemb, void* stream) {
    std::string* body = static_cast<std::string*>(stream);
    body->append(static_cast<char*>(ptr), size * nmemb);
    return size * nmemb;
}

// Collects response headers; an interim status line (100 Continue) resets them
size_t HeaderCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    std::string line(buffer, size * nitems);

    if (line.compare(0, 5, "HTTP/") == 0) {
        headers->clear();
        return size * nitems;
    }

    auto colon = line.find(':');
    if (colon == std::string::npos) {
        return size * nitems;
    }

    std::string name = line.substr(0, colon);
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return std::tolower(c); });

    auto begin = line.find_first_not_of(" \t", colon + 1);
    auto end = line.find_last_not_of(" \t\r\n");
    std::string value = (begin == std::string::npos || end < begin) ? "" : line.substr(begin, end - begin + 1);

    (*headers)[name] = value;
    return size * nitems;
}

// CR or LF would end the header line early and inject whatever follows
bool HasLineBreak(const std::string& text) {
    return text.find_first_of("\r\n") != std::string::npos;
}

} // namespace

S3Client::S3Client(const Config::S3Settings& settings) : settings_(settings) {
    curl_global_init(CURL_GLOBAL_ALL);
}

S3Client::~S3Client() {
    curl_global_cleanup();
}

RequestDescriptor S3Client::Prepare(const CompleteMultipartUploadRequest& request, std::time_t now) const {
    RequestDescriptor built = BuildCompleteMultipartUpload(request);
    RequestDescriptor located = ApplyEndpoint(built, *request.GetBucket(), settings_, request.GetRegion());

    if (settings_.access_key.empty()) {
        Logger::Warn("No access key configured. Sending unsigned request.", "S3Client");
        return located;
    }

    Credentials credentials{settings_.access_key, settings_.secret_key, settings_.session_token};
    return SignRequest(located, credentials, EffectiveRegion(settings_, request.GetRegion()), now);
}

HttpResponse S3Client::Send(const RequestDescriptor& request) const {
    for (const auto& [name, value] : request.headers) {
        if (HasLineBreak(name) || HasLineBreak(value)) {
            Logger::Error("Refusing to send header '" + name + "' containing a line break", "S3Client");
            throw TransportError("header '" + name + "' contains a line break");
        }
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        throw TransportError("curl_easy_init failed");
    }

    struct curl_slist* headers = NULL;
    for (const auto& [name, value] : request.headers) {
        // "Name;" is curl's spelling of a header with an empty value
        std::string line = value.empty() ? name + ";" : name + ": " + value;
        headers = curl_slist_append(headers, line.c_str());
    }
    headers = curl_slist_append(headers, "Expect:");

    std::string url = request.Url();
    HttpResponse response;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    if (request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
    } else {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, (curl_off_t)request.body.size());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, HeaderCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, settings_.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        Logger::Error("S3 request failed: " + std::string(curl_easy_strerror(res)), "S3Client");
        throw TransportError(std::string("S3 request failed: ") + curl_easy_strerror(res));
    }
    return response;
}

CompleteMultipartUploadResult S3Client::CompleteMultipartUpload(const CompleteMultipartUploadRequest& request) const {
    RequestDescriptor prepared = Prepare(request, std::time(nullptr));

    Logger::Info("Completing multipart upload " + prepared.method + " " + prepared.Url(), "S3Client");
    HttpResponse response = Send(prepared);

    try {
        CompleteMultipartUploadResult result = ParseCompleteMultipartUploadResponse(response);
        Logger::Info("Multipart upload completed: " + result.etag.value_or("(no ETag)"), "S3Client");
        return result;
    } catch (const S3ServiceError& e) {
        Logger::Error(std::string("CompleteMultipartUpload rejected: ") + e.what(), "S3Client");
        throw;
    }
}
