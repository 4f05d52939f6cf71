#ifndef FILE_DOWNLOAD_HPP
#define FILE_DOWNLOAD_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include "http_client.hpp"

class ContentDecoder;

/**
 * Live content of a downloaded file.
 *
 * Owns the response it was created from. Reads, line iteration and chunk
 * iteration all consume the same body, once: there is no restart. After
 * Close() every read throws StreamClosedError; Close() itself may be called
 * any number of times. Destroying an open FileDownload closes it.
 */
class FileDownload {
public:
    static constexpr size_t DEFAULT_CHUNK_SIZE = 16 * 1024;

    explicit FileDownload(std::unique_ptr<HttpStreamResponse> response,
                          size_t chunk_size = DEFAULT_CHUNK_SIZE);
    ~FileDownload();

    FileDownload(const FileDownload&) = delete;
    FileDownload& operator=(const FileDownload&) = delete;

    // Declared Content-Length. Throws LengthUnavailableError when the header
    // is missing or not a number.
    uint64_t Length() const;
    bool HasLength() const;

    const HttpHeaders& Headers() const;
    std::string ContentEncoding() const;

    // Up to amount bytes, fewer only at the end of the body; everything left
    // when amount is not given. With decode_content, gzip and deflate bodies
    // are inflated; other encodings are returned as sent. Raw reads of a compressed
    // body must come before any decoded read or line iteration, otherwise they
    // throw TransferError: the decoder has already taken transport bytes.
    std::string Read(std::optional<size_t> amount = std::nullopt, bool decode_content = true);

    // Next block of chunk_size bytes (the last one may be shorter), or nullopt at the end.
    std::optional<std::string> NextChunk();
    std::optional<std::string> NextChunk(size_t chunk_size);

    // Next line without its terminator, or nullopt at the end. With no delimiter,
    // lines end at "\n" and a trailing "\r" is dropped.
    std::optional<std::string> NextLine(const std::string& delimiter = "");

    void ForEachChunk(const std::function<void(const std::string&)>& callback, size_t chunk_size = 0);
    void ForEachLine(const std::function<void(const std::string&)>& callback, const std::string& delimiter = "");

    // Copies the remaining content to the sink and closes the stream, also when
    // the sink or the transfer fails.
    void WriteTo(std::ostream& out);
    void WriteTo(const std::function<void(const std::string&)>& sink);

    void Close();
    bool IsClosed() const;

private:
    std::unique_ptr<HttpStreamResponse> response_;
    size_t chunk_size_;
    std::string pending_; // decoded bytes read ahead by NextLine
    std::unique_ptr<ContentDecoder> decoder_;

    void EnsureOpen() const;
    bool IsCompressed() const;
    size_t Pull(char* buffer, size_t max_len, bool decode_content);
    size_t PullFromTransport(char* buffer, size_t max_len, bool decode_content);
};

#endif // FILE_DOWNLOAD_HPP
