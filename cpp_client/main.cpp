#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "complete_multipart_upload_request.hpp"
#include "config.hpp"
#include "endpoint.hpp"
#include "logger.hpp"
#include "request_builder.hpp"
#include "request_errors.hpp"
#include "s3_client.hpp"

namespace {

constexpr int EXIT_USAGE = 1;
constexpr int EXIT_REQUEST = 2;

void PrintUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <params.json> [config.json] [--send]" << std::endl;
}

nlohmann::json ReadJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    return nlohmann::json::parse(file);
}

nlohmann::json DescriptorToJson(const RequestDescriptor& request) {
    nlohmann::json j;
    j["method"] = request.method;
    j["url"] = request.Url();
    j["path"] = request.path;
    j["query"] = request.query;
    j["headers"] = request.headers;
    j["body"] = request.body;
    return j;
}

nlohmann::json ResultToJson(const CompleteMultipartUploadResult& result) {
    nlohmann::json j = nlohmann::json::object();
    auto put = [&j](const char* name, const std::optional<std::string>& value) {
        if (value) j[name] = *value;
    };
    put("Location", result.location);
    put("Bucket", result.bucket);
    put("Key", result.key);
    put("ETag", result.etag);
    put("ChecksumCRC32", result.checksum_crc32);
    put("ChecksumCRC32C", result.checksum_crc32c);
    put("ChecksumSHA1", result.checksum_sha1);
    put("ChecksumSHA256", result.checksum_sha256);
    put("Expiration", result.expiration);
    put("ServerSideEncryption", result.server_side_encryption);
    put("VersionId", result.version_id);
    put("SSEKMSKeyId", result.sse_kms_key_id);
    if (result.bucket_key_enabled) j["BucketKeyEnabled"] = *result.bucket_key_enabled;
    put("RequestCharged", result.request_charged);
    return j;
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> positional;
    bool send = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--send") {
            send = true;
        } else if (arg == "-h" || arg == "--help") {
            PrintUsage(argv[0]);
            return 0;
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.empty() || positional.size() > 2) {
        PrintUsage(argv[0]);
        return EXIT_USAGE;
    }

    if (positional.size() == 2) {
        Config::Instance().Load(positional[1]);
    }
    const auto& config = Config::Instance().Get();

    CompleteMultipartUploadRequest request;
    try {
        request = CompleteMultipartUploadRequest::FromJson(ReadJsonFile(positional[0]));
    } catch (const std::exception& e) {
        Logger::Error("Cannot read parameters: " + std::string(e.what()), "Main");
        return EXIT_USAGE;
    }

    try {
        if (!send) {
            RequestDescriptor built = BuildCompleteMultipartUpload(request);
            RequestDescriptor located = ApplyEndpoint(built, *request.GetBucket(), config.s3, request.GetRegion());
            std::cout << DescriptorToJson(located).dump(2) << std::endl;
            return 0;
        }

        std::string host = config.s3.endpoint.empty() ? DefaultHost(EffectiveRegion(config.s3, request.GetRegion()))
                                                      : config.s3.endpoint;
        Logger::Info("Initializing S3 Client (" + host + ")...", "Main");
        S3Client client(config.s3);
        CompleteMultipartUploadResult result = client.CompleteMultipartUpload(request);
        std::cout << ResultToJson(result).dump(2) << std::endl;
        return 0;
    } catch (const RequestBuildError& e) {
        Logger::Error(std::string("Invalid request: ") + e.what(), "Main");
    } catch (const S3ServiceError& e) {
        Logger::Error(std::string("Service error: ") + e.what(), "Main");
    } catch (const TransportError& e) {
        Logger::Error(std::string("Transport error: ") + e.what(), "Main");
    } catch (const std::exception& e) {
        Logger::Fatal(std::string("Unexpected failure: ") + e.what(), "Main");
    }
    return EXIT_REQUEST;
}
