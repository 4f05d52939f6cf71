#include "content_source.hpp"
#include "transfer_error.hpp"
#include <algorithm>
#include <cstring>
#include <utility>

uint64_t ProbeSize(ContentSource& source) {
    const uint64_t position = source.Tell();
    const uint64_t end = source.SeekToEnd();
    source.Seek(position);
    return end;
}

StreamContentSource::StreamContentSource(std::istream& stream)
    : stream_(stream) {}

size_t StreamContentSource::Read(char* buffer, size_t max_len) {
    if (max_len == 0) return 0;
    stream_.read(buffer, static_cast<std::streamsize>(max_len));
    if (stream_.bad()) {
        throw ContentSourceError("read failed");
    }
    return static_cast<size_t>(stream_.gcount());
}

void StreamContentSource::Seek(uint64_t position) {
    stream_.clear(); // a previous read may have hit eof
    stream_.seekg(static_cast<std::streamoff>(position), std::ios::beg);
    if (stream_.fail()) {
        throw ContentSourceError("cannot seek to offset " + std::to_string(position));
    }
}

uint64_t StreamContentSource::Tell() {
    stream_.clear();
    std::streampos position = stream_.tellg();
    if (position == std::streampos(-1)) {
        throw ContentSourceError("stream position is unavailable");
    }
    return static_cast<uint64_t>(position);
}

uint64_t StreamContentSource::SeekToEnd() {
    stream_.clear();
    stream_.seekg(0, std::ios::end);
    if (stream_.fail()) {
        throw ContentSourceError("cannot seek to end of stream");
    }
    return Tell();
}

MemoryContentSource::MemoryContentSource(std::string data)
    : data_(std::move(data)), offset_(0) {}

size_t MemoryContentSource::Read(char* buffer, size_t max_len) {
    if (offset_ >= data_.size() || max_len == 0) {
        return 0;
    }
    size_t to_copy = std::min(max_len, data_.size() - offset_);
    std::memcpy(buffer, data_.data() + offset_, to_copy);
    offset_ += to_copy;
    return to_copy;
}

void MemoryContentSource::Seek(uint64_t position) {
    if (position > data_.size()) {
        throw ContentSourceError("cannot seek to offset " + std::to_string(position) +
                                 " past end " + std::to_string(data_.size()));
    }
    offset_ = static_cast<size_t>(position);
}

uint64_t MemoryContentSource::SeekToEnd() {
    offset_ = data_.size();
    return offset_;
}

FileContentSource::FileContentSource(const std::string& path)
    : path_(path), file_(path, std::ios::binary), stream_source_(file_) {
    if (!file_.is_open()) {
        throw ContentSourceError("cannot open " + path);
    }
}
