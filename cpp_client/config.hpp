#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

class Config {
public:
    struct S3Settings {
        std::string endpoint = ""; // e.g., "s3.amazonaws.com" or "localhost:9000"; empty derives from region
        std::string region = "us-east-1";
        std::string access_key = "";
        std::string secret_key = "";
        std::string session_token = "";
        bool use_https = true;
        bool path_style = false;
        long timeout_seconds = 30;
    };

    struct ClientConfig {
        std::string log_level = "INFO";

        // Accepted values for the RequestPayer parameter
        std::vector<std::string> request_payer_values = {"requester"};

        S3Settings s3;
    };

    static Config& Instance();

    void Load(const std::string& path);
    // False (and the previous settings kept) when the document is rejected
    bool LoadFromString(const std::string& text);
    const ClientConfig& Get() const;

    // Restores defaults (used between test cases)
    void Reset();

private:
    Config() = default;
    void Apply(const nlohmann::json& j);

    ClientConfig config_;
};

#endif // CONFIG_HPP
