#include "file_download.hpp"
#include "api_urls.hpp"
#include "logger.hpp"
#include "transfer_error.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <zlib.h>

// Inflates a gzip or zlib-wrapped deflate body pulled from the response.
// Concatenated gzip members are decoded one after another. With
// allow_raw_deflate, a body without a zlib or gzip header is decoded as raw
// deflate, as some servers send for "Content-Encoding: deflate".
class ContentDecoder {
public:
    explicit ContentDecoder(bool allow_raw_deflate) : sniffing_(allow_raw_deflate) {
        std::memset(&zs_, 0, sizeof(zs_));
        // 15 + 32: maximum window, detect gzip or zlib header automatically
        if (inflateInit2(&zs_, 15 + 32) != Z_OK) {
            throw std::runtime_error("inflateInit2 failed");
        }
    }

    ~ContentDecoder() {
        inflateEnd(&zs_);
    }

    ContentDecoder(const ContentDecoder&) = delete;
    ContentDecoder& operator=(const ContentDecoder&) = delete;

    // Consumed any input since the transport started.
    bool Started() const { return received_ > 0; }

    size_t Read(HttpStreamResponse& source, char* out, size_t max_len) {
        if (finished_ || max_len == 0) return 0;

        zs_.next_out = reinterpret_cast<Bytef*>(out);
        zs_.avail_out = static_cast<uInt>(max_len);

        while (zs_.avail_out == max_len) {
            if (zs_.avail_in == 0) {
                if (!sniffing_) {
                    sniffed_.clear();
                }
                size_t n = source.Read(in_, sizeof(in_));
                if (n == 0) {
                    // An empty body, or one that ends right after a complete member.
                    if (received_ == 0 || member_done_) {
                        finished_ = true;
                        break;
                    }
                    throw ProtocolError("compressed body ended before the end of the stream");
                }
                received_ += n;
                if (sniffing_) {
                    sniffed_.append(in_, n);
                }
                zs_.next_in = reinterpret_cast<Bytef*>(in_);
                zs_.avail_in = static_cast<uInt>(n);
            }

            if (member_done_) {
                // More input after a complete member starts the next one.
                if (inflateReset(&zs_) != Z_OK) {
                    throw std::runtime_error("inflateReset failed");
                }
                member_done_ = false;
            }

            int rc = inflate(&zs_, Z_NO_FLUSH);
            if (rc == Z_STREAM_END) {
                member_done_ = true;
                sniffing_ = false;
                ++members_;
                continue;
            }
            if (rc == Z_DATA_ERROR && sniffing_) {
                RestartAsRawDeflate();
                continue;
            }
            if (rc == Z_DATA_ERROR && members_ > 0 && zs_.total_out == 0) {
                Logger::Warn("Ignoring trailing data after the compressed body", "Download");
                finished_ = true;
                break;
            }
            if (rc != Z_OK && rc != Z_BUF_ERROR) {
                throw ProtocolError(std::string("cannot decode body: ") + (zs_.msg ? zs_.msg : "zlib error"));
            }
            if (sniffing_ && zs_.total_in >= 2) {
                // Header accepted.
                sniffing_ = false;
            }
        }
        return max_len - zs_.avail_out;
    }

private:
    z_stream zs_;
    char in_[16 * 1024];
    std::string sniffed_; // input seen while the header is still unchecked
    uint64_t received_ = 0;
    int members_ = 0;
    bool sniffing_;
    bool member_done_ = false;
    bool finished_ = false;

    // Replays everything consumed so far through a headerless inflater.
    void RestartAsRawDeflate() {
        if (inflateReset2(&zs_, -MAX_WBITS) != Z_OK) {
            throw std::runtime_error("inflateReset2 failed");
        }
        sniffing_ = false;
        zs_.next_in = reinterpret_cast<Bytef*>(&sniffed_[0]);
        zs_.avail_in = static_cast<uInt>(sniffed_.size());
    }
};

namespace {

// Closes the download when the enclosing scope exits, however it exits.
class CloseOnExit {
public:
    explicit CloseOnExit(FileDownload& download) : download_(download) {}
    ~CloseOnExit() { download_.Close(); }

    CloseOnExit(const CloseOnExit&) = delete;
    CloseOnExit& operator=(const CloseOnExit&) = delete;

private:
    FileDownload& download_;
};

std::string Trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

} // namespace

FileDownload::FileDownload(std::unique_ptr<HttpStreamResponse> response, size_t chunk_size)
    : response_(std::move(response)), chunk_size_(chunk_size == 0 ? DEFAULT_CHUNK_SIZE : chunk_size) {
    if (!response_) {
        throw std::invalid_argument("FileDownload needs a response");
    }
}

FileDownload::~FileDownload() {
    if (!response_->IsClosed()) {
        Logger::Debug("Closing download stream left open by its owner", "Download");
    }
    Close();
}

uint64_t FileDownload::Length() const {
    std::string value = Trim(HeaderValue(response_->Headers(), CONTENT_LENGTH_HEADER));
    if (value.empty()) {
        throw LengthUnavailableError("Response has no Content-Length header");
    }
    if (!std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw LengthUnavailableError("Malformed Content-Length header: " + value);
    }
    try {
        return std::stoull(value);
    } catch (const std::out_of_range&) {
        throw LengthUnavailableError("Content-Length out of range: " + value);
    }
}

bool FileDownload::HasLength() const {
    try {
        Length();
        return true;
    } catch (const LengthUnavailableError&) {
        return false;
    }
}

const HttpHeaders& FileDownload::Headers() const {
    return response_->Headers();
}

std::string FileDownload::ContentEncoding() const {
    std::string encoding = Trim(HeaderValue(response_->Headers(), CONTENT_ENCODING_HEADER));
    std::transform(encoding.begin(), encoding.end(), encoding.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return encoding;
}

std::string FileDownload::Read(std::optional<size_t> amount, bool decode_content) {
    EnsureOpen();

    std::string out;
    std::vector<char> buffer(chunk_size_);
    while (!amount || out.size() < *amount) {
        size_t want = amount ? std::min(chunk_size_, *amount - out.size()) : chunk_size_;
        size_t n = Pull(buffer.data(), want, decode_content);
        if (n == 0) break;
        out.append(buffer.data(), n);
    }
    return out;
}

std::optional<std::string> FileDownload::NextChunk() {
    return NextChunk(chunk_size_);
}

std::optional<std::string> FileDownload::NextChunk(size_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk size must be greater than zero");
    }
    std::string block = Read(chunk_size);
    if (block.empty()) {
        return std::nullopt;
    }
    return block;
}

std::optional<std::string> FileDownload::NextLine(const std::string& delimiter) {
    EnsureOpen();

    const std::string separator = delimiter.empty() ? "\n" : delimiter;
    std::vector<char> buffer(chunk_size_);
    size_t search_from = 0;
    std::string line;

    while (true) {
        size_t pos = pending_.find(separator, search_from);
        if (pos != std::string::npos) {
            line = pending_.substr(0, pos);
            pending_.erase(0, pos + separator.size());
            break;
        }
        // A separator may straddle the boundary with the next read.
        search_from = pending_.size() >= separator.size() ? pending_.size() - separator.size() + 1 : 0;

        size_t n = PullFromTransport(buffer.data(), buffer.size(), true);
        if (n == 0) {
            if (pending_.empty()) {
                return std::nullopt;
            }
            line.swap(pending_);
            break;
        }
        pending_.append(buffer.data(), n);
    }

    if (delimiter.empty() && !line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

void FileDownload::ForEachChunk(const std::function<void(const std::string&)>& callback, size_t chunk_size) {
    const size_t size = chunk_size == 0 ? chunk_size_ : chunk_size;
    while (auto block = NextChunk(size)) {
        callback(*block);
    }
}

void FileDownload::ForEachLine(const std::function<void(const std::string&)>& callback, const std::string& delimiter) {
    while (auto line = NextLine(delimiter)) {
        callback(*line);
    }
}

void FileDownload::WriteTo(std::ostream& out) {
    WriteTo([&out](const std::string& block) {
        out.write(block.data(), static_cast<std::streamsize>(block.size()));
        if (!out) {
            throw TransferError("Failed to write downloaded content to output stream");
        }
    });
}

void FileDownload::WriteTo(const std::function<void(const std::string&)>& sink) {
    CloseOnExit guard(*this);
    ForEachChunk(sink);
}

void FileDownload::Close() {
    response_->Close();
    pending_.clear();
    decoder_.reset();
}

bool FileDownload::IsClosed() const {
    return response_->IsClosed();
}

void FileDownload::EnsureOpen() const {
    if (response_->IsClosed()) {
        throw StreamClosedError();
    }
}

bool FileDownload::IsCompressed() const {
    std::string encoding = ContentEncoding();
    return encoding == "gzip" || encoding == "x-gzip" || encoding == "deflate";
}

size_t FileDownload::Pull(char* buffer, size_t max_len, bool decode_content) {
    if (!pending_.empty()) {
        if (!decode_content && IsCompressed()) {
            throw TransferError("Cannot read raw content after decoding has started");
        }
        size_t n = std::min(max_len, pending_.size());
        std::memcpy(buffer, pending_.data(), n);
        pending_.erase(0, n);
        return n;
    }
    return PullFromTransport(buffer, max_len, decode_content);
}

size_t FileDownload::PullFromTransport(char* buffer, size_t max_len, bool decode_content) {
    if (IsCompressed()) {
        if (decode_content) {
            if (!decoder_) {
                decoder_ = std::make_unique<ContentDecoder>(ContentEncoding() == "deflate");
            }
            return decoder_->Read(*response_, buffer, max_len);
        }
        if (decoder_ && decoder_->Started()) {
            // The decoder holds compressed input the raw reader would skip.
            throw TransferError("Cannot read raw content after decoding has started");
        }
    }
    return response_->Read(buffer, max_len);
}
