// include/Neo4jCtl/Utils/ZipFile.hpp
#ifndef NEO4JCTL_ZIP_FILE_UTIL_HPP
#define NEO4JCTL_ZIP_FILE_UTIL_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/logger.h>

namespace Neo4jCtl::Utils {

    // Reads .zip archives through minizip-ng
    class ZipFile {
    public:
        ZipFile(const std::filesystem::path &archivePath);
        ~ZipFile();

        ZipFile(const ZipFile &) = delete;
        ZipFile &operator=(const ZipFile &) = delete;

        // Attempts to open the zip file. Returns true on success.
        bool open();

        // Extracts every entry below outputDirectory, dropping the first
        // stripComponents path elements of each entry name. Entries that would
        // escape outputDirectory are rejected.
        bool extractAll(const std::filesystem::path &outputDirectory, unsigned int stripComponents = 0);

        bool isOpen() const;
        std::string getLastError() const;

    private:
        std::filesystem::path m_archivePath;
        void *m_zipReader; // Opaque pointer to mz_zip_reader
        bool m_opened;
        std::shared_ptr<spdlog::logger> m_logger;
        std::string m_lastErrorMsg;

        bool ensureDirectoryExists(const std::filesystem::path &path);
        void logMzError(int32_t err, const std::string &context);
    };

} // namespace Neo4jCtl::Utils

#endif // NEO4JCTL_ZIP_FILE_UTIL_HPP
