#ifndef API_URLS_HPP
#define API_URLS_HPP

#include <string>

// Endpoint prefixes, followed by the file path.
constexpr const char* FS_CONTENT_PATH = "pubapi/v1/fs-content";
constexpr const char* FS_CONTENT_CHUNKED_PATH = "pubapi/v1/fs-content-chunked";

// Headers of the content endpoints.
constexpr const char* CONTENT_LENGTH_HEADER = "Content-Length";
constexpr const char* CONTENT_ENCODING_HEADER = "Content-Encoding";
constexpr const char* SHA512_CHECKSUM_HEADER = "X-Sha512-Checksum";
constexpr const char* CHUNK_NUM_HEADER = "x-egnyte-chunk-num";
constexpr const char* LAST_CHUNK_HEADER = "x-egnyte-last-chunk";
constexpr const char* UPLOAD_ID_HEADER = "x-egnyte-upload-id";
constexpr const char* CHUNK_CHECKSUM_HEADER = "x-egnyte-chunk-sha512-checksum";

// Percent-encodes every byte of a path except RFC 3986 unreserved characters
// and the '/' separators. A leading '/' is added when missing.
std::string EncodePath(const std::string& path);

// base_url + "/" + endpoint + encoded path, e.g.
// BuildUrl("https://acme.egnyte.com", FS_CONTENT_PATH, "/Shared/a b.txt")
//   -> "https://acme.egnyte.com/pubapi/v1/fs-content/Shared/a%20b.txt"
std::string BuildUrl(const std::string& base_url, const std::string& endpoint, const std::string& path);

#endif // API_URLS_HPP
