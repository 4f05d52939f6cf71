#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

class Config {
public:
    struct ClientConfig {
        std::string base_url = ""; // e.g., "https://acme.egnyte.com"
        std::string log_level = "INFO";

        // Upload policy
        uint64_t upload_chunk_threshold = 100 * 1024 * 1024; // below this, one request
        uint64_t upload_chunk_size = 100 * 1024 * 1024;
        int upload_chunk_retries = 3; // attempts per chunk, at least 1 is always made

        // Download iteration
        size_t download_chunk_size = 16 * 1024;

        // Transport
        long connect_timeout_seconds = 30;
        long low_speed_timeout_seconds = 60; // abort when below 1 B/s for this long, 0 disables
        bool verify_peer = true;
        std::string ca_file = "";
        std::string user_agent = "egnyte-transfer/1.0";
    };

    static Config& Instance();

    void Load(const std::string& path);
    const ClientConfig& Get() const;

    // Applies the keys present in `j` on top of `base`.
    // Throws nlohmann::json::exception on type errors and std::invalid_argument on bad values.
    static ClientConfig Parse(const nlohmann::json& j, const ClientConfig& base);
    static ClientConfig Parse(const nlohmann::json& j);

private:
    Config() = default;
    ClientConfig config_;
};

#endif // CONFIG_HPP
