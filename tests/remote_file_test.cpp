#include "remote_file.hpp"
#include "fake_http_client.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

class RemoteFileTest : public ::testing::Test {
protected:
    FakeHttpClient client;
    Config::ClientConfig config;

    void SetUp() override {
        config.base_url = "https://acme.egnyte.com/";
        config.upload_chunk_threshold = 100;
        config.upload_chunk_size = 40;
    }
};

TEST_F(RemoteFileTest, UrlsAddressThePath) {
    RemoteFile file(client, config, "/Shared/Reports/q1 #2.csv");

    EXPECT_EQ(file.Path(), "/Shared/Reports/q1 #2.csv");
    EXPECT_EQ(file.ContentUrl(), "https://acme.egnyte.com/pubapi/v1/fs-content/Shared/Reports/q1%20%232.csv");
    EXPECT_EQ(file.ChunkedContentUrl(),
              "https://acme.egnyte.com/pubapi/v1/fs-content-chunked/Shared/Reports/q1%20%232.csv");
}

TEST_F(RemoteFileTest, SmallUploadGoesToTheContentEndpoint) {
    RemoteFile file(client, config, "/Private/notes.txt");

    file.Upload("hello");

    ASSERT_EQ(client.requests.size(), 1u);
    EXPECT_EQ(client.requests[0].url, file.ContentUrl());
    EXPECT_EQ(client.requests[0].body, "hello");
}

TEST_F(RemoteFileTest, LargeUploadGoesToTheChunkedEndpoint) {
    RemoteFile file(client, config, "/Private/big.bin");
    const std::string content = MakeContent(100);

    file.Upload(content);

    ASSERT_EQ(client.requests.size(), 3u);
    std::string received;
    for (const RecordedRequest& request : client.requests) {
        EXPECT_EQ(request.url, file.ChunkedContentUrl());
        received += request.body;
    }
    EXPECT_EQ(received, content);
}

TEST_F(RemoteFileTest, UploadFromStreamProbesItsSize) {
    RemoteFile file(client, config, "/Private/stream.txt");
    std::istringstream stream("streamed content");
    StreamContentSource source(stream);

    file.Upload(source);

    ASSERT_EQ(client.requests.size(), 1u);
    EXPECT_EQ(client.requests[0].body, "streamed content");
}

TEST_F(RemoteFileTest, DownloadStreamsTheContent) {
    HttpHeaders headers;
    headers["Content-Length"] = "11";
    client.QueueStream(200, headers, "hello\nworld", 3);
    RemoteFile file(client, config, "/Shared/greeting.txt");

    std::unique_ptr<FileDownload> download = file.Download();

    ASSERT_EQ(client.requests.size(), 1u);
    EXPECT_EQ(client.requests[0].method, "GET");
    EXPECT_EQ(client.requests[0].url, file.ContentUrl());
    EXPECT_EQ(download->Length(), 11u);
    EXPECT_EQ(download->NextLine(), "hello");
    EXPECT_EQ(download->NextLine(), "world");
    EXPECT_FALSE(download->NextLine().has_value());
}

TEST_F(RemoteFileTest, DownloadUsesConfiguredChunkSize) {
    config.download_chunk_size = 4;
    client.QueueStream(200, HttpHeaders(), "abcdefghij");
    RemoteFile file(client, config, "/Shared/letters.txt");

    std::unique_ptr<FileDownload> download = file.Download();

    EXPECT_EQ(download->NextChunk(), "abcd");
    EXPECT_EQ(download->NextChunk(), "efgh");
    EXPECT_EQ(download->NextChunk(), "ij");
}

TEST_F(RemoteFileTest, DownloadErrorStatusFailsAndReleasesTheResponse) {
    std::shared_ptr<int> close_calls = client.QueueStream(404, HttpHeaders(), "{\"errorMessage\":\"File not found\"}");
    RemoteFile file(client, config, "/Shared/missing.txt");

    try {
        file.Download();
        FAIL() << "Expected TransferFailedError";
    } catch (const TransferFailedError& e) {
        EXPECT_EQ(e.Status(), 404);
        EXPECT_EQ(e.Url(), file.ContentUrl());
        EXPECT_NE(e.Body().find("File not found"), std::string::npos);
    }
    EXPECT_GE(*close_calls, 1);
}

TEST_F(RemoteFileTest, DownloadConnectionErrorPropagates) {
    RemoteFile file(client, config, "/Shared/unreachable.txt");

    EXPECT_THROW(file.Download(), ConnectionError);
}
