#ifndef FAKE_HTTP_CLIENT_HPP
#define FAKE_HTTP_CLIENT_HPP

#include "api_urls.hpp"
#include "checksum.hpp"
#include "http_client.hpp"
#include "transfer_error.hpp"

#include <algorithm>
#include <cstring>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

struct RecordedRequest {
    std::string method;
    std::string url;
    HttpHeaders headers;
    std::string body;

    std::string Header(const std::string& name) const { return HeaderValue(headers, name); }
    bool HasHeader(const std::string& name) const { return headers.count(name) > 0; }
};

// Serves a fixed body, at most max_read bytes per Read. When fail_after is
// set, Read throws ConnectionError once that many bytes have been served.
class FakeStreamResponse : public HttpStreamResponse {
public:
    FakeStreamResponse(long status, HttpHeaders headers, std::string body, size_t max_read = 4096)
        : status_(status), headers_(std::move(headers)), body_(std::move(body)), max_read_(max_read),
          close_calls_(std::make_shared<int>(0)) {}

    long Status() const override { return status_; }
    const HttpHeaders& Headers() const override { return headers_; }

    size_t Read(char* buffer, size_t max_len) override {
        if (closed_) throw StreamClosedError();
        if (fail_after_ >= 0 && offset_ >= static_cast<size_t>(fail_after_)) {
            throw ConnectionError("connection reset by peer");
        }
        size_t n = std::min({max_len, max_read_, body_.size() - offset_});
        std::memcpy(buffer, body_.data() + offset_, n);
        offset_ += n;
        return n;
    }

    void Close() noexcept override {
        ++*close_calls_;
        closed_ = true;
    }

    bool IsClosed() const override { return closed_; }

    void FailAfter(long bytes) { fail_after_ = bytes; }

    // Outlives the response, so tests can check it after the owner is gone.
    std::shared_ptr<int> CloseCalls() const { return close_calls_; }

private:
    long status_;
    HttpHeaders headers_;
    std::string body_;
    size_t max_read_;
    size_t offset_ = 0;
    long fail_after_ = -1;
    bool closed_ = false;
    std::shared_ptr<int> close_calls_;
};

// In-process stand-in for the content endpoints. POSTs are answered like the
// server does: the checksum header carries the SHA-512 of the received body
// and the first chunk gets an upload id. on_post can then alter the answer.
class FakeHttpClient : public HttpClient {
public:
    std::vector<RecordedRequest> requests;
    std::function<void(const RecordedRequest&, HttpResponse&)> on_post;
    std::deque<std::unique_ptr<FakeStreamResponse>> stream_responses;
    long post_status = 200;
    std::string upload_id = "upload-123";

    HttpResponse Post(const std::string& url, RequestBody& body, const HttpHeaders& headers) override {
        RecordedRequest request{"POST", url, headers, ""};
        body.Rewind();
        char buffer[4096];
        size_t n;
        while ((n = body.Read(buffer, sizeof(buffer))) > 0) {
            request.body.append(buffer, n);
        }
        requests.push_back(request);

        HttpResponse response;
        response.status = post_status;
        const std::string digest = Sha512::Hex(request.body);
        if (request.HasHeader(CHUNK_NUM_HEADER)) {
            response.headers[CHUNK_CHECKSUM_HEADER] = digest;
            if (request.Header(CHUNK_NUM_HEADER) == "1") {
                response.headers[UPLOAD_ID_HEADER] = upload_id;
            }
        } else {
            response.headers[SHA512_CHECKSUM_HEADER] = digest;
        }

        if (on_post) {
            on_post(requests.back(), response);
        }
        return response;
    }

    std::unique_ptr<HttpStreamResponse> GetStream(const std::string& url, const HttpHeaders& headers) override {
        requests.push_back(RecordedRequest{"GET", url, headers, ""});
        if (stream_responses.empty()) {
            throw ConnectionError("no scripted response for " + url);
        }
        std::unique_ptr<FakeStreamResponse> response = std::move(stream_responses.front());
        stream_responses.pop_front();
        return response;
    }

    // Keeps a handle on the close counter of the response it queues.
    std::shared_ptr<int> QueueStream(long status, HttpHeaders headers, std::string body, size_t max_read = 4096) {
        auto response = std::make_unique<FakeStreamResponse>(status, std::move(headers), std::move(body), max_read);
        std::shared_ptr<int> close_calls = response->CloseCalls();
        stream_responses.push_back(std::move(response));
        return close_calls;
    }
};

// Deterministic, non-repeating-looking content of the given size.
inline std::string MakeContent(size_t size) {
    std::string content(size, '\0');
    for (size_t i = 0; i < size; ++i) {
        content[i] = static_cast<char>((i * 131 + i / 7) & 0xff);
    }
    return content;
}

#endif // FAKE_HTTP_CLIENT_HPP
