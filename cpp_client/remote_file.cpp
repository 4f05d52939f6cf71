#include "remote_file.hpp"
#include "api_urls.hpp"
#include "logger.hpp"
#include "upload_engine.hpp"

RemoteFile::RemoteFile(HttpClient& client, const Config::ClientConfig& config, const std::string& path)
    : client_(client), config_(config), path_(path) {}

void RemoteFile::Upload(ContentSource& source, std::optional<uint64_t> size) {
    UploadEngine engine(client_, config_);
    engine.Upload(ContentUrl(), ChunkedContentUrl(), source, size);
}

void RemoteFile::Upload(const std::string& content) {
    MemoryContentSource source(content);
    Upload(source, content.size());
}

std::unique_ptr<FileDownload> RemoteFile::Download() {
    const std::string url = ContentUrl();
    Logger::Debug("Downloading " + url, "Download");

    std::unique_ptr<HttpStreamResponse> response = client_.GetStream(url, HttpHeaders());
    CheckResponse(*response, url);
    return std::make_unique<FileDownload>(std::move(response), config_.download_chunk_size);
}

std::string RemoteFile::ContentUrl() const {
    return BuildUrl(config_.base_url, FS_CONTENT_PATH, path_);
}

std::string RemoteFile::ChunkedContentUrl() const {
    return BuildUrl(config_.base_url, FS_CONTENT_CHUNKED_PATH, path_);
}
