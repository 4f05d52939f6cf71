#include "config.hpp"
#include "logger.hpp"
#include <fstream>
#include <stdexcept>

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

    try {
        nlohmann::json j;
        file >> j;

        config_ = Parse(j, config_);
        Logger::SetLevel(Logger::ParseLevel(config_.log_level));

        Logger::Info("Configuration loaded from " + path, "Config");
    } catch (const std::exception& e) {
        Logger::Error("Failed to parse config file: " + std::string(e.what()), "Config");
    }
}

const Config::ClientConfig& Config::Get() const {
    return config_;
}

Config::ClientConfig Config::Parse(const nlohmann::json& j) {
    return Parse(j, ClientConfig());
}

Config::ClientConfig Config::Parse(const nlohmann::json& j, const ClientConfig& base) {
    if (!j.is_object()) {
        throw std::invalid_argument("Configuration root must be a JSON object");
    }

    ClientConfig config = base;

    if (j.contains("base_url")) config.base_url = j["base_url"].get<std::string>();
    if (j.contains("log_level")) config.log_level = j["log_level"].get<std::string>();

    if (j.contains("upload")) {
        auto& upload = j["upload"];
        if (upload.contains("chunk_threshold")) config.upload_chunk_threshold = upload["chunk_threshold"].get<uint64_t>();
        if (upload.contains("chunk_size")) config.upload_chunk_size = upload["chunk_size"].get<uint64_t>();
        if (upload.contains("chunk_retries")) config.upload_chunk_retries = upload["chunk_retries"].get<int>();
    }

    if (j.contains("download")) {
        auto& download = j["download"];
        if (download.contains("chunk_size")) config.download_chunk_size = download["chunk_size"].get<size_t>();
    }

    if (j.contains("http")) {
        auto& http = j["http"];
        if (http.contains("connect_timeout")) config.connect_timeout_seconds = http["connect_timeout"].get<long>();
        if (http.contains("low_speed_timeout")) config.low_speed_timeout_seconds = http["low_speed_timeout"].get<long>();
        if (http.contains("verify_peer")) config.verify_peer = http["verify_peer"].get<bool>();
        if (http.contains("ca_file")) config.ca_file = http["ca_file"].get<std::string>();
        if (http.contains("user_agent")) config.user_agent = http["user_agent"].get<std::string>();
    }

    if (config.upload_chunk_size == 0) {
        throw std::invalid_argument("upload.chunk_size must be greater than zero");
    }
    if (config.download_chunk_size == 0) {
        throw std::invalid_argument("download.chunk_size must be greater than zero");
    }
    // Validates the name; the value itself is applied by Load.
    Logger::ParseLevel(config.log_level);

    return config;
}
