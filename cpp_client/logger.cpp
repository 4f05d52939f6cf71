#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

std::mutex Logger::mutex_;
std::atomic<LogLevel> Logger::min_level_{LogLevel::INFO};

LogLevel Logger::ParseLevel(const std::string& name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "FATAL") return LogLevel::FATAL;
    throw std::invalid_argument("Unknown log level: " + name);
}
