#include "upload_engine.hpp"
#include "file_chunk.hpp"
#include "logger.hpp"
#include "transfer_error.hpp"
#include <algorithm>
#include <stdexcept>

UploadEngine::UploadEngine(HttpClient& client, const Config::ClientConfig& config)
    : client_(client),
      chunk_threshold_(config.upload_chunk_threshold),
      chunk_size_(config.upload_chunk_size),
      max_retries_(std::max(config.upload_chunk_retries, 1)) {
    if (chunk_size_ == 0) {
        throw std::invalid_argument("upload chunk size must be greater than zero");
    }
}

void UploadEngine::Upload(const std::string& content_url, const std::string& chunked_url,
                          ContentSource& source, std::optional<uint64_t> size) {
    const uint64_t total = size ? *size : ProbeSize(source);

    if (total < chunk_threshold_) {
        UploadSingle(content_url, source, total);
    } else {
        UploadChunked(chunked_url, source, total);
    }
}

void UploadEngine::UploadSingle(const std::string& url, ContentSource& source, uint64_t size) {
    Logger::Debug("Uploading " + std::to_string(size) + " bytes to " + url, "Upload");

    FileChunk chunk(source, 0, size);
    HttpHeaders headers;
    headers[CONTENT_LENGTH_HEADER] = std::to_string(size);

    HttpResponse response = client_.Post(url, chunk, headers);
    CheckResponse(response, url);

    if (response.Header(SHA512_CHECKSUM_HEADER) != chunk.HexDigest()) {
        Logger::Error("Checksum mismatch after uploading " + url, "Upload");
        throw ChecksumMismatchError("Failed to upload file");
    }
    Logger::Info("Uploaded " + std::to_string(size) + " bytes to " + url, "Upload");
}

// Chunks go strictly in order: the server binds chunks 2..N to the upload id
// it handed out for chunk 1. Checksum retries are immediate, without backoff,
// and reuse the same bytes.
void UploadEngine::UploadChunked(const std::string& url, ContentSource& source, uint64_t size) {
    const uint64_t chunk_count = ChunkCount(size, chunk_size_);
    Logger::Info("Uploading " + std::to_string(size) + " bytes to " + url + " in " +
                 std::to_string(chunk_count) + " chunks", "Upload");

    HttpHeaders headers;
    for (uint64_t chunk_number = 1; chunk_number <= chunk_count; ++chunk_number) {
        const uint64_t position = (chunk_number - 1) * chunk_size_;
        FileChunk chunk(source, position, std::min(chunk_size_, size - position));

        headers[CHUNK_NUM_HEADER] = std::to_string(chunk_number);
        headers[CONTENT_LENGTH_HEADER] = std::to_string(chunk.Size());
        if (chunk_number == chunk_count) {
            headers[LAST_CHUNK_HEADER] = "true";
        }

        HttpResponse response;
        bool verified = false;
        for (int attempt = 1; attempt <= max_retries_; ++attempt) {
            response = client_.Post(url, chunk, headers);
            if (response.Header(CHUNK_CHECKSUM_HEADER) == chunk.HexDigest()) {
                verified = true;
                break;
            }
            Logger::Warn("Checksum mismatch on chunk " + std::to_string(chunk_number) + " (attempt " +
                         std::to_string(attempt) + " of " + std::to_string(max_retries_) + ")", "Upload");
        }
        if (!verified) {
            throw ChunkChecksumMismatchError(chunk_number, position);
        }
        CheckResponse(response, url);

        if (chunk_number == 1) {
            std::string upload_id = response.Header(UPLOAD_ID_HEADER);
            if (upload_id.empty()) {
                throw ProtocolError("first chunk response has no " + std::string(UPLOAD_ID_HEADER) + " header");
            }
            headers[UPLOAD_ID_HEADER] = upload_id;
        }
        Logger::Debug("Chunk " + std::to_string(chunk_number) + "/" + std::to_string(chunk_count) +
                      " accepted (" + std::to_string(chunk.Size()) + " bytes at " + std::to_string(position) + ")",
                      "Upload");
    }
    Logger::Info("Uploaded " + std::to_string(size) + " bytes to " + url, "Upload");
}
