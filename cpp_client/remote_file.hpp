#ifndef REMOTE_FILE_HPP
#define REMOTE_FILE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "config.hpp"
#include "content_source.hpp"
#include "file_download.hpp"
#include "http_client.hpp"

// A file in the cloud, addressed by path. It does not have to exist yet:
// uploading creates it.
class RemoteFile {
public:
    RemoteFile(HttpClient& client, const Config::ClientConfig& config, const std::string& path);

    // The source must be seekable; without a size it is probed for one.
    void Upload(ContentSource& source, std::optional<uint64_t> size = std::nullopt);
    void Upload(const std::string& content);

    // Throws TransferFailedError on a non-2xx status.
    std::unique_ptr<FileDownload> Download();

    const std::string& Path() const { return path_; }
    std::string ContentUrl() const;
    std::string ChunkedContentUrl() const;

private:
    HttpClient& client_;
    Config::ClientConfig config_;
    std::string path_;
};

#endif // REMOTE_FILE_HPP
