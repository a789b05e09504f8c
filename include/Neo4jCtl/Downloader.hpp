// include/Neo4jCtl/Downloader.hpp
#ifndef NEO4JCTL_DOWNLOADER_HPP
#define NEO4JCTL_DOWNLOADER_HPP

#include <Neo4jCtl/Types/Platform.hpp>
#include <filesystem>
#include <string>
#include <spdlog/logger.h>

namespace Neo4jCtl {

    class HttpClient;

    class Downloader {
    public:
        Downloader(HttpClient& httpClient, std::string downloadBaseUrl, bool verifyChecksum = true);

        // <base>/neo4j-<version>-<platform suffix>
        std::string downloadUrl(const std::string& version, const Platform& platform) const;

        // Checks availability with a HEAD request, then streams the archive into a
        // private temporary file and returns its path. The caller owns the file.
        // Throws DownloadError.
        std::filesystem::path download(const std::string& version, const Platform& platform);

    private:
        HttpClient& m_httpClient;
        std::string m_downloadBaseUrl;
        bool m_verifyChecksum;
        std::shared_ptr<spdlog::logger> m_logger;

        std::filesystem::path createTemporaryFile() const;
        void verifyChecksum(const std::string& url, const std::filesystem::path& archive);
    };

} // namespace Neo4jCtl

#endif // NEO4JCTL_DOWNLOADER_HPP
