#include "curl_http_client.hpp"
#include "logger.hpp"
#include "transfer_error.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <exception>
#include <utility>

namespace {

// Body bytes buffered ahead of the reader before the transfer is paused.
constexpr size_t MAX_PENDING_BYTES = 1024 * 1024;

constexpr long POLL_TIMEOUT_MS = 1000;

std::string Trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

} // namespace

bool ParseHeaderLine(const char* data, size_t len, HttpHeaders& headers) {
    std::string line(data, len);
    if (line.compare(0, 5, "HTTP/") == 0) {
        headers.clear();
        return false;
    }

    std::string trimmed = Trim(line);
    if (trimmed.empty()) {
        return true;
    }

    size_t colon = trimmed.find(':');
    if (colon != std::string::npos) {
        headers[Trim(trimmed.substr(0, colon))] = Trim(trimmed.substr(colon + 1));
    }
    return false;
}

namespace {

curl_slist* BuildHeaderList(const HttpHeaders& headers) {
    curl_slist* list = NULL;
    auto append = [&list](const std::string& line) {
        curl_slist* next = curl_slist_append(list, line.c_str());
        if (!next) {
            curl_slist_free_all(list);
            throw ConnectionError("failed to build request headers");
        }
        list = next;
    };

    for (const auto& header : headers) {
        append(header.first + ": " + header.second);
    }
    // No 100-continue handshake before the body.
    append("Expect:");
    return list;
}

struct PostContext {
    RequestBody* body;
    HttpResponse* response;
    std::exception_ptr error;
};

size_t PostReadCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    PostContext* ctx = static_cast<PostContext*>(userdata);
    try {
        return ctx->body->Read(ptr, size * nmemb);
    } catch (...) {
        ctx->error = std::current_exception();
        return CURL_READFUNC_ABORT;
    }
}

int PostSeekCallback(void* userdata, curl_off_t offset, int origin) {
    PostContext* ctx = static_cast<PostContext*>(userdata);
    if (origin != SEEK_SET || offset != 0) {
        return CURL_SEEKFUNC_CANTSEEK;
    }
    try {
        ctx->body->Rewind();
        return CURL_SEEKFUNC_OK;
    } catch (...) {
        ctx->error = std::current_exception();
        return CURL_SEEKFUNC_FAIL;
    }
}

size_t PostHeaderCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    PostContext* ctx = static_cast<PostContext*>(userdata);
    try {
        ParseHeaderLine(buffer, size * nitems, ctx->response->headers);
        return size * nitems;
    } catch (...) {
        ctx->error = std::current_exception();
        return 0;
    }
}

size_t PostWriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    PostContext* ctx = static_cast<PostContext*>(userdata);
    try {
        ctx->response->body.append(ptr, size * nmemb);
        return size * nmemb;
    } catch (...) {
        ctx->error = std::current_exception();
        return 0;
    }
}

class CurlStreamResponse : public HttpStreamResponse {
public:
    // Takes ownership of easy and request_headers.
    CurlStreamResponse(CURL* easy, curl_slist* request_headers, const std::string& url)
        : easy_(easy), multi_(curl_multi_init()), request_headers_(request_headers), url_(url) {
        if (!multi_) {
            Close();
            throw ConnectionError("curl_multi_init failed");
        }
        curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, WriteCallback);
        curl_easy_setopt(easy_, CURLOPT_WRITEDATA, this);
        curl_easy_setopt(easy_, CURLOPT_HEADERFUNCTION, HeaderCallback);
        curl_easy_setopt(easy_, CURLOPT_HEADERDATA, this);
    }

    ~CurlStreamResponse() override {
        Close();
    }

    // Blocks until the response headers have arrived.
    void Start() {
        CURLMcode mc = curl_multi_add_handle(multi_, easy_);
        if (mc != CURLM_OK) {
            throw ConnectionError(std::string("curl_multi_add_handle: ") + curl_multi_strerror(mc));
        }
        added_ = true;

        while (!headers_done_ && !finished_) {
            Pump();
        }
        if (!headers_done_) {
            if (result_ != CURLE_OK) {
                throw ConnectionError(url_ + ": " + curl_easy_strerror(result_));
            }
            curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &status_);
            headers_done_ = true;
        }
    }

    long Status() const override { return status_; }
    const HttpHeaders& Headers() const override { return headers_; }

    size_t Read(char* buffer, size_t max_len) override {
        if (closed_) {
            throw StreamClosedError();
        }
        if (max_len == 0) {
            return 0;
        }

        while (offset_ >= pending_.size()) {
            pending_.clear();
            offset_ = 0;
            if (finished_) {
                if (result_ != CURLE_OK) {
                    throw ConnectionError(url_ + ": " + curl_easy_strerror(result_));
                }
                return 0;
            }
            Pump();
        }

        size_t n = std::min(max_len, pending_.size() - offset_);
        std::memcpy(buffer, pending_.data() + offset_, n);
        offset_ += n;
        return n;
    }

    void Close() noexcept override {
        if (closed_) return;
        closed_ = true;
        if (multi_) {
            if (added_) curl_multi_remove_handle(multi_, easy_);
            curl_multi_cleanup(multi_);
            multi_ = NULL;
        }
        curl_easy_cleanup(easy_);
        curl_slist_free_all(request_headers_);
        easy_ = NULL;
        request_headers_ = NULL;
        pending_.clear();
        offset_ = 0;
    }

    bool IsClosed() const override { return closed_; }

private:
    CURL* easy_;
    CURLM* multi_;
    curl_slist* request_headers_;
    std::string url_;

    long status_ = 0;
    HttpHeaders headers_;
    std::string pending_;
    size_t offset_ = 0;

    bool added_ = false;
    bool headers_done_ = false;
    bool finished_ = false;
    bool paused_ = false;
    bool closed_ = false;
    CURLcode result_ = CURLE_OK;
    std::exception_ptr callback_error_;

    // One round of transfer work: waits for socket activity only when the
    // previous round delivered nothing.
    void Pump() {
        if (paused_) {
            paused_ = false;
            CURLcode rc = curl_easy_pause(easy_, CURLPAUSE_CONT);
            if (rc != CURLE_OK) {
                throw ConnectionError(url_ + ": " + curl_easy_strerror(rc));
            }
        }

        const size_t pending_before = pending_.size();
        const bool headers_before = headers_done_;

        int running = 0;
        CURLMcode mc = curl_multi_perform(multi_, &running);
        if (mc != CURLM_OK) {
            throw ConnectionError(std::string("curl_multi_perform: ") + curl_multi_strerror(mc));
        }
        if (callback_error_) {
            std::rethrow_exception(std::exchange(callback_error_, nullptr));
        }

        int left = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_, &left)) {
            if (msg->msg == CURLMSG_DONE && msg->easy_handle == easy_) {
                result_ = msg->data.result;
                finished_ = true;
            }
        }
        if (finished_ || pending_.size() != pending_before || headers_done_ != headers_before) {
            return;
        }

        mc = curl_multi_poll(multi_, NULL, 0, POLL_TIMEOUT_MS, NULL);
        if (mc != CURLM_OK) {
            throw ConnectionError(std::string("curl_multi_poll: ") + curl_multi_strerror(mc));
        }
    }

    static size_t WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        CurlStreamResponse* self = static_cast<CurlStreamResponse*>(userdata);
        if (self->pending_.size() - self->offset_ >= MAX_PENDING_BYTES) {
            self->paused_ = true;
            return CURL_WRITEFUNC_PAUSE;
        }
        try {
            self->pending_.append(ptr, size * nmemb);
            return size * nmemb;
        } catch (...) {
            self->callback_error_ = std::current_exception();
            return 0;
        }
    }

    static size_t HeaderCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
        CurlStreamResponse* self = static_cast<CurlStreamResponse*>(userdata);
        try {
            if (ParseHeaderLine(buffer, size * nitems, self->headers_)) {
                long status = 0;
                curl_easy_getinfo(self->easy_, CURLINFO_RESPONSE_CODE, &status);
                // 1xx blocks are followed by the real response.
                if (status >= 200) {
                    self->status_ = status;
                    self->headers_done_ = true;
                }
            }
            return size * nitems;
        } catch (...) {
            self->callback_error_ = std::current_exception();
            return 0;
        }
    }
};

} // namespace

CurlHttpClient::CurlHttpClient(const Config::ClientConfig& config)
    : connect_timeout_seconds_(config.connect_timeout_seconds),
      low_speed_timeout_seconds_(config.low_speed_timeout_seconds),
      verify_peer_(config.verify_peer),
      ca_file_(config.ca_file),
      user_agent_(config.user_agent) {
    curl_global_init(CURL_GLOBAL_ALL);
}

CurlHttpClient::~CurlHttpClient() {
    curl_global_cleanup();
}

void CurlHttpClient::ApplyOptions(CURL* curl, const std::string& url, curl_slist* headers) const {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, connect_timeout_seconds_);
    if (low_speed_timeout_seconds_ > 0) {
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, low_speed_timeout_seconds_);
    }
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verify_peer_ ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verify_peer_ ? 2L : 0L);
    if (!ca_file_.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, ca_file_.c_str());
    }
}

HttpResponse CurlHttpClient::Post(const std::string& url, RequestBody& body, const HttpHeaders& headers) {
    body.Rewind();
    curl_slist* header_list = BuildHeaderList(headers);

    CURL* curl = curl_easy_init();
    if (!curl) {
        curl_slist_free_all(header_list);
        throw ConnectionError("curl_easy_init failed");
    }

    HttpResponse response;
    PostContext ctx{&body, &response, nullptr};

    ApplyOptions(curl, url, header_list);
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, (curl_off_t)body.Size());
    curl_easy_setopt(curl, CURLOPT_READFUNCTION, PostReadCallback);
    curl_easy_setopt(curl, CURLOPT_READDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_SEEKFUNCTION, PostSeekCallback);
    curl_easy_setopt(curl, CURLOPT_SEEKDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, PostHeaderCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, PostWriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);

    if (ctx.error) {
        std::rethrow_exception(ctx.error);
    }
    if (res != CURLE_OK) {
        Logger::Error("POST " + url + " failed: " + std::string(curl_easy_strerror(res)), "Http");
        throw ConnectionError(url + ": " + curl_easy_strerror(res));
    }

    Logger::Debug("POST " + url + " -> " + std::to_string(response.status), "Http");
    return response;
}

std::unique_ptr<HttpStreamResponse> CurlHttpClient::GetStream(const std::string& url, const HttpHeaders& headers) {
    curl_slist* header_list = BuildHeaderList(headers);

    CURL* curl = curl_easy_init();
    if (!curl) {
        curl_slist_free_all(header_list);
        throw ConnectionError("curl_easy_init failed");
    }

    ApplyOptions(curl, url, header_list);
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    // Bodies arrive as sent; FileDownload decides about decoding.
    curl_easy_setopt(curl, CURLOPT_HTTP_CONTENT_DECODING, 0L);

    auto response = std::make_unique<CurlStreamResponse>(curl, header_list, url);
    try {
        response->Start();
    } catch (const ConnectionError& e) {
        Logger::Error("GET " + url + " failed: " + std::string(e.what()), "Http");
        throw;
    }

    Logger::Debug("GET " + url + " -> " + std::to_string(response->Status()), "Http");
    return response;
}
