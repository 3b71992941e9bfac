#include "config.hpp"
#include "logger.hpp"
#include <fstream>
#include <sstream>

Config& Config::Instance() {
    static Config instance;
    return instance;
}

void Config::Load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::Warn("Config file not found at " + path + ". Using defaults.", "Config");
        return;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (LoadFromString(buffer.str())) {
        Logger::Info("Configuration loaded from " + path, "Config");
    } else {
        Logger::Warn("Configuration at " + path + " was not applied.", "Config");
    }
}

bool Config::LoadFromString(const std::string& text) {
    try {
        nlohmann::json j = nlohmann::json::parse(text);

        // Parse into a copy so a bad document leaves the previous settings intact
        ClientConfig previous = config_;
        try {
            Apply(j);
        } catch (...) {
            config_ = previous;
            throw;
        }

        if (!Logger::SetLevel(config_.log_level)) {
            Logger::Warn("Unknown log_level '" + config_.log_level + "'. Keeping current level.", "Config");
        }
        return true;
    } catch (const std::exception& e) {
        Logger::Error("Failed to parse config file: " + std::string(e.what()), "Config");
        return false;
    }
}

void Config::Apply(const nlohmann::json& j) {
    if (j.contains("log_level")) config_.log_level = j["log_level"].get<std::string>();

    if (j.contains("request_payer_values")) {
        config_.request_payer_values = j["request_payer_values"].get<std::vector<std::string>>();
        if (config_.request_payer_values.empty()) {
            Logger::Warn("request_payer_values is empty. Every RequestPayer value will be rejected.", "Config");
        }
    }

    if (j.contains("s3")) {
        auto& s3 = j["s3"];
        if (s3.contains("endpoint")) config_.s3.endpoint = s3["endpoint"].get<std::string>();
        if (s3.contains("region")) config_.s3.region = s3["region"].get<std::string>();
        if (s3.contains("access_key")) config_.s3.access_key = s3["access_key"].get<std::string>();
        if (s3.contains("secret_key")) config_.s3.secret_key = s3["secret_key"].get<std::string>();
        if (s3.contains("session_token")) config_.s3.session_token = s3["session_token"].get<std::string>();
        if (s3.contains("use_https")) config_.s3.use_https = s3["use_https"].get<bool>();
        if (s3.contains("path_style")) config_.s3.path_style = s3["path_style"].get<bool>();
        if (s3.contains("timeout_seconds")) config_.s3.timeout_seconds = s3["timeout_seconds"].get<long>();
    }
}

const Config::ClientConfig& Config::Get() const {
    return config_;
}

void Config::Reset() {
    config_ = ClientConfig();
    Logger::SetLevel(LogLevel::INFO);
}
