#include "api_urls.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>

std::string EncodePath(const std::string& path) {
    std::stringstream ss;
    ss << std::hex << std::uppercase << std::setfill('0');
    if (path.empty() || path[0] != '/') {
        ss << '/';
    }
    for (unsigned char c : path) {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~' || c == '/') {
            ss << c;
        } else {
            ss << '%' << std::setw(2) << (int)c;
        }
    }
    return ss.str();
}

std::string BuildUrl(const std::string& base_url, const std::string& endpoint, const std::string& path) {
    std::string url = base_url;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url + "/" + endpoint + EncodePath(path);
}
