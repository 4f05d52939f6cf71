#ifndef UPLOAD_ENGINE_HPP
#define UPLOAD_ENGINE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include "api_urls.hpp"
#include "config.hpp"
#include "content_source.hpp"
#include "http_client.hpp"

class UploadEngine {
public:
    // Throws std::invalid_argument when upload_chunk_size is zero.
    UploadEngine(HttpClient& client, const Config::ClientConfig& config);

    // Uploads source, in one request below the chunk threshold, chunked otherwise.
    // When size is not given the source is probed for it (its position is kept).
    //
    // Throws TransferFailedError, ChecksumMismatchError, ChunkChecksumMismatchError,
    // ConnectionError, ContentSourceError or ProtocolError. Nothing is returned on success.
    void Upload(const std::string& content_url, const std::string& chunked_url,
                ContentSource& source, std::optional<uint64_t> size = std::nullopt);

    uint64_t ChunkThreshold() const { return chunk_threshold_; }
    uint64_t ChunkSize() const { return chunk_size_; }
    int MaxRetries() const { return max_retries_; }

private:
    HttpClient& client_;
    uint64_t chunk_threshold_;
    uint64_t chunk_size_;
    int max_retries_;

    void UploadSingle(const std::string& url, ContentSource& source, uint64_t size);
    void UploadChunked(const std::string& url, ContentSource& source, uint64_t size);
};

#endif // UPLOAD_ENGINE_HPP
