#ifndef HTTP_CLIENT_HPP
#define HTTP_CLIENT_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

using HttpHeaders = std::map<std::string, std::string, CaseInsensitiveLess>;

// Returns the header value, or an empty string when absent.
std::string HeaderValue(const HttpHeaders& headers, const std::string& name);

struct HttpResponse {
    long status = 0;
    HttpHeaders headers;
    std::string body;

    bool Ok() const { return status >= 200 && status < 300; }
    std::string Header(const std::string& name) const { return HeaderValue(headers, name); }
};

// Request body that can be sent more than once.
class RequestBody {
public:
    virtual ~RequestBody() = default;

    virtual uint64_t Size() const = 0;

    // Positions the body at its first byte.
    virtual void Rewind() = 0;

    // Returns 0 once Size() bytes have been produced.
    virtual size_t Read(char* buffer, size_t max_len) = 0;
};

// A response whose body has not been read yet.
class HttpStreamResponse {
public:
    virtual ~HttpStreamResponse() = default;

    virtual long Status() const = 0;
    virtual const HttpHeaders& Headers() const = 0;

    // Blocks until at least one byte is available or the body ends. Returns 0 at end.
    virtual size_t Read(char* buffer, size_t max_len) = 0;

    // Releases the connection. Idempotent.
    virtual void Close() noexcept = 0;
    virtual bool IsClosed() const = 0;
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Sends body from its start. Throws ConnectionError when no response arrives;
    // the status is not checked.
    virtual HttpResponse Post(const std::string& url, RequestBody& body, const HttpHeaders& headers) = 0;

    // Returns as soon as the response headers are known.
    virtual std::unique_ptr<HttpStreamResponse> GetStream(const std::string& url, const HttpHeaders& headers) = 0;
};

// Throw TransferFailedError unless the status is 2xx.
void CheckResponse(const HttpResponse& response, const std::string& url);
void CheckResponse(HttpStreamResponse& response, const std::string& url);

#endif // HTTP_CLIENT_HPP
