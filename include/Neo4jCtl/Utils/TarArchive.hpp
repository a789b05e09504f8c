// include/Neo4jCtl/Utils/TarArchive.hpp
#ifndef NEO4JCTL_TAR_ARCHIVE_UTIL_HPP
#define NEO4JCTL_TAR_ARCHIVE_UTIL_HPP

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/logger.h>

namespace Neo4jCtl::Utils {

    // Reads compressed tarballs (.tar.gz and friends) through libarchive
    class TarArchive {
    public:
        TarArchive(const std::filesystem::path &archivePath);

        // Same contract as ZipFile::extractAll. Permissions and symlinks are restored.
        bool extractAll(const std::filesystem::path &outputDirectory, unsigned int stripComponents = 0);

        std::string getLastError() const;

    private:
        std::filesystem::path m_archivePath;
        std::shared_ptr<spdlog::logger> m_logger;
        std::string m_lastErrorMsg;

        void setError(const std::string &message);
    };

} // namespace Neo4jCtl::Utils

#endif // NEO4JCTL_TAR_ARCHIVE_UTIL_HPP
