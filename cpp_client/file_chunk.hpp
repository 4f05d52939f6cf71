#ifndef FILE_CHUNK_HPP
#define FILE_CHUNK_HPP

#include <cstdint>
#include <string>
#include "checksum.hpp"
#include "content_source.hpp"
#include "http_client.hpp"

// The byte range [position, position + size) of a ContentSource, hashed
// with SHA-512 as it is read. Rewind() restarts both the read and the digest,
// so the digest always covers exactly the bytes of the latest transmission.
class FileChunk : public RequestBody {
public:
    FileChunk(ContentSource& source, uint64_t position, uint64_t size);

    uint64_t Size() const override { return size_; }
    void Rewind() override;
    size_t Read(char* buffer, size_t max_len) override;

    uint64_t Position() const { return position_; }
    uint64_t BytesRead() const { return offset_; }
    std::string HexDigest() const { return sha_.HexDigest(); }

private:
    ContentSource& source_;
    uint64_t position_;
    uint64_t size_;
    uint64_t offset_;
    Sha512 sha_;
};

// Number of chunks of at most chunk_size covering size bytes. Never less than 1,
// so empty content still travels as a single (last) chunk.
uint64_t ChunkCount(uint64_t size, uint64_t chunk_size);

#endif // FILE_CHUNK_HPP
