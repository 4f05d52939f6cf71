#include "file_chunk.hpp"
#include "transfer_error.hpp"
#include <algorithm>
#include <stdexcept>

FileChunk::FileChunk(ContentSource& source, uint64_t position, uint64_t size)
    : source_(source), position_(position), size_(size), offset_(0) {}

void FileChunk::Rewind() {
    source_.Seek(position_);
    sha_.Reset();
    offset_ = 0;
}

size_t FileChunk::Read(char* buffer, size_t max_len) {
    if (offset_ >= size_ || max_len == 0) {
        return 0;
    }

    size_t to_read = static_cast<size_t>(std::min<uint64_t>(max_len, size_ - offset_));
    size_t n = source_.Read(buffer, to_read);
    if (n == 0) {
        // Sending fewer bytes than Content-Length announced would corrupt the upload.
        throw ContentSourceError("source ended at offset " + std::to_string(position_ + offset_) +
                                 ", expected data up to " + std::to_string(position_ + size_));
    }

    sha_.Update(buffer, n);
    offset_ += n;
    return n;
}

uint64_t ChunkCount(uint64_t size, uint64_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk size must be greater than zero");
    }
    if (size == 0) return 1;
    return (size + chunk_size - 1) / chunk_size;
}
