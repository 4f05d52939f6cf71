#include "config.hpp"
#include "logger.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

TEST(ConfigTest, EmptyObjectKeepsDefaults) {
    Config::ClientConfig config = Config::Parse(nlohmann::json::object());

    EXPECT_EQ(config.upload_chunk_threshold, 100u * 1024 * 1024);
    EXPECT_EQ(config.upload_chunk_size, 100u * 1024 * 1024);
    EXPECT_EQ(config.upload_chunk_retries, 3);
    EXPECT_EQ(config.download_chunk_size, 16u * 1024);
    EXPECT_TRUE(config.verify_peer);
    EXPECT_EQ(config.log_level, "INFO");
}

TEST(ConfigTest, PresentKeysOverride) {
    nlohmann::json j = {
        {"base_url", "https://acme.egnyte.com"},
        {"log_level", "debug"},
        {"upload", {{"chunk_threshold", 1024}, {"chunk_retries", 5}}},
        {"download", {{"chunk_size", 4096}}},
        {"http", {{"connect_timeout", 5}, {"verify_peer", false}, {"user_agent", "backup-job/2"}}}
    };

    Config::ClientConfig config = Config::Parse(j);

    EXPECT_EQ(config.base_url, "https://acme.egnyte.com");
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.upload_chunk_threshold, 1024u);
    EXPECT_EQ(config.upload_chunk_size, 100u * 1024 * 1024);
    EXPECT_EQ(config.upload_chunk_retries, 5);
    EXPECT_EQ(config.download_chunk_size, 4096u);
    EXPECT_EQ(config.connect_timeout_seconds, 5);
    EXPECT_EQ(config.low_speed_timeout_seconds, 60);
    EXPECT_FALSE(config.verify_peer);
    EXPECT_EQ(config.user_agent, "backup-job/2");
}

TEST(ConfigTest, ParseLayersOnTopOfBase) {
    Config::ClientConfig base;
    base.base_url = "https://first.egnyte.com";
    base.upload_chunk_size = 10;

    Config::ClientConfig config = Config::Parse({{"upload", {{"chunk_retries", 1}}}}, base);

    EXPECT_EQ(config.base_url, "https://first.egnyte.com");
    EXPECT_EQ(config.upload_chunk_size, 10u);
    EXPECT_EQ(config.upload_chunk_retries, 1);
}

TEST(ConfigTest, InvalidValuesAreRejected) {
    EXPECT_THROW(Config::Parse(nlohmann::json::array()), std::invalid_argument);
    EXPECT_THROW(Config::Parse({{"upload", {{"chunk_size", 0}}}}), std::invalid_argument);
    EXPECT_THROW(Config::Parse({{"download", {{"chunk_size", 0}}}}), std::invalid_argument);
    EXPECT_THROW(Config::Parse({{"log_level", "chatty"}}), std::invalid_argument);
    EXPECT_THROW(Config::Parse({{"base_url", 42}}), nlohmann::json::exception);
}

TEST(ConfigTest, LoadMissingFileKeepsCurrentValues) {
    const std::string before = Config::Instance().Get().base_url;

    Config::Instance().Load("/nonexistent/client_config.json");

    EXPECT_EQ(Config::Instance().Get().base_url, before);
}

TEST(ConfigTest, LoadAppliesFileAndLogLevel) {
    const std::string path = ::testing::TempDir() + "client_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"base_url": "https://loaded.egnyte.com", "log_level": "WARN", "upload": {"chunk_size": 2048}})";
    }
    const LogLevel previous = Logger::GetLevel();

    Config::Instance().Load(path);

    EXPECT_EQ(Config::Instance().Get().base_url, "https://loaded.egnyte.com");
    EXPECT_EQ(Config::Instance().Get().upload_chunk_size, 2048u);
    EXPECT_EQ(Logger::GetLevel(), LogLevel::WARN);

    Logger::SetLevel(previous);
    std::remove(path.c_str());
}

TEST(ConfigTest, LoadMalformedFileKeepsCurrentValues) {
    const std::string path = ::testing::TempDir() + "client_config_broken.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    const std::string before = Config::Instance().Get().base_url;

    Config::Instance().Load(path);

    EXPECT_EQ(Config::Instance().Get().base_url, before);
    std::remove(path.c_str());
}

TEST(LoggerTest, ParseLevelAcceptsKnownNames) {
    EXPECT_EQ(Logger::ParseLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::ParseLevel("Info"), LogLevel::INFO);
    EXPECT_EQ(Logger::ParseLevel("WARNING"), LogLevel::WARN);
    EXPECT_EQ(Logger::ParseLevel("error"), LogLevel::ERROR);
    EXPECT_EQ(Logger::ParseLevel("FATAL"), LogLevel::FATAL);
    EXPECT_THROW(Logger::ParseLevel("verbose"), std::invalid_argument);
}

TEST(LoggerTest, LevelNamesRoundTrip) {
    for (LogLevel level : {LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARN, LogLevel::ERROR, LogLevel::FATAL}) {
        EXPECT_EQ(Logger::ParseLevel(Logger::LevelToString(level)), level);
    }
}
