// tests/DownloaderTest.cpp
#include <Neo4jCtl/Downloader.hpp>
#include <Neo4jCtl/Errors.hpp>

#include "TestSupport.hpp"

using namespace Neo4jCtl;
using namespace Neo4jCtl::Testing;

namespace {

const std::string kArchiveUrl = "http://dist.neo4j.org/neo4j-community-3.0.1-unix.tar.gz";
// sha256("neo4j")
const std::string kArchiveBody = "neo4j";
const std::string kArchiveSha256 = "13fd9e770be366985fd7e0ca5026434c7c3e4e84e111f09039889277534b4114";

} // namespace

class DownloaderTest : public ::testing::Test {
protected:
    FakeHttpClient http;
    std::vector<std::filesystem::path> created;

    void TearDown() override {
        for (const auto& path : created) {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }
    }
};

TEST_F(DownloaderTest, BuildsDownloadUrl) {
    Downloader downloader(http, "http://dist.neo4j.org");
    EXPECT_EQ(downloader.downloadUrl("community-3.0.1", Platform::posix()), kArchiveUrl);
    EXPECT_EQ(downloader.downloadUrl("enterprise-2.3.3", Platform::windows()),
              "http://dist.neo4j.org/neo4j-enterprise-2.3.3-windows.zip");
}

TEST_F(DownloaderTest, UnavailableArchiveThrowsWithoutDownloading) {
    http.heads[kArchiveUrl] = makeResponse(404);
    Downloader downloader(http, "http://dist.neo4j.org");

    try {
        downloader.download("community-3.0.1", Platform::posix());
        FAIL() << "expected DownloadError";
    } catch (const DownloadError& e) {
        EXPECT_NE(std::string(e.what()).find("community-3.0.1"), std::string::npos);
    }
    EXPECT_EQ(http.count("DOWNLOAD"), 0u);
}

TEST_F(DownloaderTest, StoresBinaryBodyInTemporaryFile) {
    const std::string body("\x1f\x8b\x00\r\n\xff", 6);
    http.heads[kArchiveUrl] = makeResponse(200);
    http.bodies[kArchiveUrl] = body;
    Downloader downloader(http, "http://dist.neo4j.org");

    auto archive = downloader.download("community-3.0.1", Platform::posix());
    created.push_back(archive);

    ASSERT_TRUE(std::filesystem::exists(archive));
    std::ifstream in(archive, std::ios::binary);
    std::string stored((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(stored, body);
}

TEST_F(DownloaderTest, FailedTransferThrows) {
    http.heads[kArchiveUrl] = makeResponse(200);
    Downloader downloader(http, "http://dist.neo4j.org");

    EXPECT_THROW(downloader.download("community-3.0.1", Platform::posix()), DownloadError);
}

TEST_F(DownloaderTest, MatchingChecksumIsAccepted) {
    http.heads[kArchiveUrl] = makeResponse(200);
    http.bodies[kArchiveUrl] = kArchiveBody;
    http.heads[kArchiveUrl + ".sha256"] = makeResponse(200);
    http.gets[kArchiveUrl + ".sha256"] = makeResponse(200, kArchiveSha256 + "  neo4j-community-3.0.1-unix.tar.gz\n");
    Downloader downloader(http, "http://dist.neo4j.org");

    auto archive = downloader.download("community-3.0.1", Platform::posix());
    created.push_back(archive);
    EXPECT_TRUE(std::filesystem::exists(archive));
}

TEST_F(DownloaderTest, ChecksumMismatchRemovesArchive) {
    http.heads[kArchiveUrl] = makeResponse(200);
    http.bodies[kArchiveUrl] = "tampered";
    http.heads[kArchiveUrl + ".sha256"] = makeResponse(200);
    http.gets[kArchiveUrl + ".sha256"] = makeResponse(200, kArchiveSha256);
    Downloader downloader(http, "http://dist.neo4j.org");

    EXPECT_THROW(downloader.download("community-3.0.1", Platform::posix()), DownloadError);
}

TEST_F(DownloaderTest, ChecksumSkippedWhenDisabled) {
    http.heads[kArchiveUrl] = makeResponse(200);
    http.bodies[kArchiveUrl] = "anything";
    Downloader downloader(http, "http://dist.neo4j.org", false);

    auto archive = downloader.download("community-3.0.1", Platform::posix());
    created.push_back(archive);
    EXPECT_EQ(http.count("HEAD " + kArchiveUrl + ".sha256"), 0u);
}
