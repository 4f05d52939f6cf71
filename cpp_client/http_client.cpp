#include "http_client.hpp"
#include "transfer_error.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>

namespace {

// Error bodies are quoted in exception messages, not kept whole.
constexpr size_t MAX_ERROR_BODY = 1024;

std::string Excerpt(const std::string& body) {
    if (body.size() <= MAX_ERROR_BODY) return body;
    return body.substr(0, MAX_ERROR_BODY) + "...";
}

} // namespace

bool CaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
}

std::string HeaderValue(const HttpHeaders& headers, const std::string& name) {
    auto it = headers.find(name);
    return it == headers.end() ? std::string() : it->second;
}

void CheckResponse(const HttpResponse& response, const std::string& url) {
    if (!response.Ok()) {
        throw TransferFailedError(response.status, url, Excerpt(response.body));
    }
}

void CheckResponse(HttpStreamResponse& response, const std::string& url) {
    long status = response.Status();
    if (status >= 200 && status < 300) {
        return;
    }

    std::string body;
    char buffer[512];
    try {
        while (body.size() < MAX_ERROR_BODY) {
            size_t n = response.Read(buffer, sizeof(buffer));
            if (n == 0) break;
            body.append(buffer, n);
        }
    } catch (const TransferError& e) {
        // The status is what gets reported; a truncated body only shortens the message.
        Logger::Debug("Error body of " + url + " unavailable: " + e.what(), "Http");
    }
    response.Close();
    throw TransferFailedError(status, url, Excerpt(body));
}
