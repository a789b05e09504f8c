// src/Downloader.cpp
#include <Neo4jCtl/Downloader.hpp>
#include <Neo4jCtl/Errors.hpp>
#include <Neo4jCtl/HttpClient.hpp>
#include <Neo4jCtl/Utils/Crypto.hpp>
#include <Neo4jCtl/Utils/Logger.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <vector>

#if defined(_WIN32) || defined(_WIN64)
#include <io.h>
#else
#include <stdlib.h>
#include <unistd.h>
#endif

namespace Neo4jCtl {

Downloader::Downloader(HttpClient& httpClient, std::string downloadBaseUrl, bool verifyChecksum)
    : m_httpClient(httpClient), m_downloadBaseUrl(std::move(downloadBaseUrl)), m_verifyChecksum(verifyChecksum) {
    m_logger = Utils::Logger::GetOrCreateLogger("Downloader");
}

std::string Downloader::downloadUrl(const std::string& version, const Platform& platform) const {
    return m_downloadBaseUrl + "/neo4j-" + version + "-" + platform.archiveSuffix;
}

std::filesystem::path Downloader::createTemporaryFile() const {
    std::filesystem::path pattern = std::filesystem::temp_directory_path() / "neo4j-download-XXXXXX";
#if defined(_WIN32) || defined(_WIN64)
    std::string name = pattern.string();
    if (_mktemp_s(name.data(), name.size() + 1) != 0) {
        throw DownloadError("Unable to create a temporary file for the download");
    }
    return name;
#else
    std::string name = pattern.string();
    std::vector<char> buffer(name.begin(), name.end());
    buffer.push_back('\0');
    int fd = mkstemp(buffer.data()); // created 0600
    if (fd == -1) {
        throw DownloadError(std::string("Unable to create a temporary file for the download: ") + std::strerror(errno));
    }
    close(fd);
    return std::filesystem::path(buffer.data());
#endif
}

std::filesystem::path Downloader::download(const std::string& version, const Platform& platform) {
    const std::string url = downloadUrl(version, platform);

    m_logger->debug("Checking availability of {}", url);
    cpr::Response head = m_httpClient.Head(cpr::Url{url});
    if (!isSuccessStatus(head.status_code)) {
        m_logger->error("Archive not available. Status: {}, URL: {}, Error: {}", head.status_code, url, head.error.message);
        throw DownloadError(version + " is not available to download");
    }

    std::filesystem::path archive = createTemporaryFile();
    m_logger->info("Downloading {} ...", url);
    cpr::Response response = m_httpClient.Download(archive, cpr::Url{url});
    if (response.error.code != cpr::ErrorCode::OK || !isSuccessStatus(response.status_code)) {
        std::error_code ec;
        std::filesystem::remove(archive, ec);
        throw DownloadError("Download of " + url + " failed (status " + std::to_string(response.status_code) +
                            (response.error.message.empty() ? "" : ", " + response.error.message) + ")");
    }

    if (m_verifyChecksum) {
        try {
            verifyChecksum(url, archive);
        } catch (const DownloadError&) {
            std::error_code ec;
            std::filesystem::remove(archive, ec);
            throw;
        }
    }

    m_logger->debug("Archive stored at {}", archive.string());
    return archive;
}

void Downloader::verifyChecksum(const std::string& url, const std::filesystem::path& archive) {
    const std::string digestUrl = url + ".sha256";
    cpr::Response head = m_httpClient.Head(cpr::Url{digestUrl});
    if (!isSuccessStatus(head.status_code)) {
        m_logger->info("No published checksum at {}; skipping verification.", digestUrl);
        return;
    }

    cpr::Response digest = m_httpClient.Get(cpr::Url{digestUrl});
    if (!isSuccessStatus(digest.status_code)) {
        throw DownloadError("Unable to fetch checksum " + digestUrl + " (status " + std::to_string(digest.status_code) + ")");
    }

    // "<hex>  <file name>" or just "<hex>"
    std::string expected;
    std::istringstream(digest.text) >> expected;
    std::transform(expected.begin(), expected.end(), expected.begin(), [](unsigned char c) { return std::tolower(c); });

    std::string actual = Utils::calculateFileSHA256(archive);
    if (actual.empty()) {
        throw DownloadError("SHA256 calculation failed for " + archive.string());
    }
    if (actual != expected) {
        m_logger->error("SHA256 hash mismatch! Expected: {}, Actual: {}", expected, actual);
        throw DownloadError("Checksum mismatch for " + url);
    }
    m_logger->info("SHA256 hash verified.");
}

} // namespace Neo4jCtl
