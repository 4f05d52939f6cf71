#ifndef CONTENT_SOURCE_HPP
#define CONTENT_SOURCE_HPP

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <istream>
#include <string>

// Readable, seekable bytes to upload.
class ContentSource {
public:
    virtual ~ContentSource() = default;

    // Reads up to max_len bytes at the current position. Returns 0 at end.
    virtual size_t Read(char* buffer, size_t max_len) = 0;

    virtual void Seek(uint64_t position) = 0;
    virtual uint64_t Tell() = 0;

    // Moves to the end and returns that offset.
    virtual uint64_t SeekToEnd() = 0;
};

// Total size of the source. The current position is restored before returning.
uint64_t ProbeSize(ContentSource& source);

// Adapts a caller-owned std::istream (std::ifstream, std::istringstream...).
class StreamContentSource : public ContentSource {
public:
    explicit StreamContentSource(std::istream& stream);

    size_t Read(char* buffer, size_t max_len) override;
    void Seek(uint64_t position) override;
    uint64_t Tell() override;
    uint64_t SeekToEnd() override;

private:
    std::istream& stream_;
};

class MemoryContentSource : public ContentSource {
public:
    explicit MemoryContentSource(std::string data);

    size_t Read(char* buffer, size_t max_len) override;
    void Seek(uint64_t position) override;
    uint64_t Tell() override { return offset_; }
    uint64_t SeekToEnd() override;

private:
    std::string data_;
    size_t offset_;
};

class FileContentSource : public ContentSource {
public:
    explicit FileContentSource(const std::string& path);

    size_t Read(char* buffer, size_t max_len) override { return stream_source_.Read(buffer, max_len); }
    void Seek(uint64_t position) override { stream_source_.Seek(position); }
    uint64_t Tell() override { return stream_source_.Tell(); }
    uint64_t SeekToEnd() override { return stream_source_.SeekToEnd(); }

    const std::string& Path() const { return path_; }

private:
    std::string path_;
    std::ifstream file_;
    StreamContentSource stream_source_;
};

#endif // CONTENT_SOURCE_HPP
