#ifndef CURL_HTTP_CLIENT_HPP
#define CURL_HTTP_CLIENT_HPP

#include <curl/curl.h>
#include <memory>
#include <string>
#include "config.hpp"
#include "http_client.hpp"

// Applies one raw header line as libcurl hands it to the header callback.
// A status line starts a new header block (1xx interim responses, redirects),
// dropping the previous one; trailers arrive without one and are merged in.
// Returns true for the blank line that ends a block.
bool ParseHeaderLine(const char* data, size_t len, HttpHeaders& headers);

class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient(const Config::ClientConfig& config);
    ~CurlHttpClient();

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    // Streams body through a read callback; curl may rewind it on its own
    // (redirect, auth retry) through the seek callback.
    HttpResponse Post(const std::string& url, RequestBody& body, const HttpHeaders& headers) override;

    // Drives the transfer with the multi interface from the caller's Read calls,
    // so the body is never fetched ahead of the consumer by more than one
    // transport read (capped at 1 MiB, after which the transfer is paused).
    std::unique_ptr<HttpStreamResponse> GetStream(const std::string& url, const HttpHeaders& headers) override;

private:
    long connect_timeout_seconds_;
    long low_speed_timeout_seconds_;
    bool verify_peer_;
    std::string ca_file_;
    std::string user_agent_;

    void ApplyOptions(CURL* curl, const std::string& url, curl_slist* headers) const;
};

#endif // CURL_HTTP_CLIENT_HPP
