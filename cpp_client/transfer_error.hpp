#ifndef TRANSFER_ERROR_HPP
#define TRANSFER_ERROR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

class TransferError : public std::runtime_error {
public:
    explicit TransferError(const std::string& message)
        : std::runtime_error(message) {}
};

// Non-2xx HTTP status on an upload or download request.
class TransferFailedError : public TransferError {
public:
    TransferFailedError(long status, const std::string& url, const std::string& body)
        : TransferError("HTTP " + std::to_string(status) + " from " + url + (body.empty() ? "" : ": " + body)),
          status_(status), url_(url), body_(body) {}

    long Status() const { return status_; }
    const std::string& Url() const { return url_; }
    const std::string& Body() const { return body_; }

private:
    long status_;
    std::string url_;
    std::string body_;
};

// The request never produced an HTTP status (DNS, connect, TLS, reset...).
class ConnectionError : public TransferError {
public:
    explicit ConnectionError(const std::string& message)
        : TransferError("Connection error: " + message) {}
};

class ChecksumMismatchError : public TransferError {
public:
    explicit ChecksumMismatchError(const std::string& message)
        : TransferError(message) {}
};

class ChunkChecksumMismatchError : public ChecksumMismatchError {
public:
    ChunkChecksumMismatchError(uint64_t chunk_number, uint64_t start_position)
        : ChecksumMismatchError("Failed to upload file chunk " + std::to_string(chunk_number) +
                                " (start position " + std::to_string(start_position) + ")"),
          chunk_number_(chunk_number), start_position_(start_position) {}

    uint64_t ChunkNumber() const { return chunk_number_; }
    uint64_t StartPosition() const { return start_position_; }

private:
    uint64_t chunk_number_;
    uint64_t start_position_;
};

class LengthUnavailableError : public TransferError {
public:
    explicit LengthUnavailableError(const std::string& message)
        : TransferError(message) {}
};

class StreamClosedError : public TransferError {
public:
    StreamClosedError()
        : TransferError("Download stream is closed") {}
};

class ContentSourceError : public TransferError {
public:
    explicit ContentSourceError(const std::string& message)
        : TransferError("Content source error: " + message) {}
};

class ProtocolError : public TransferError {
public:
    explicit ProtocolError(const std::string& message)
        : TransferError("Protocol error: " + message) {}
};

#endif // TRANSFER_ERROR_HPP
