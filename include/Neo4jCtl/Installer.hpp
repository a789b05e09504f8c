// include/Neo4jCtl/Installer.hpp
#ifndef NEO4JCTL_INSTALLER_HPP
#define NEO4JCTL_INSTALLER_HPP

#include <Neo4jCtl/Types/Platform.hpp>
#include <filesystem>
#include <spdlog/logger.h>

namespace Neo4jCtl {

    enum class InstallResult {
        Installed,
        AlreadyInstalled
    };

    class Installer {
    public:
        Installer(std::filesystem::path installPath, Platform platform);

        // bin/<server binary> exists
        bool isInstalled() const;

        std::filesystem::path serverBinaryPath() const;

        // Extracts the archive (its top-level directory stripped) into the
        // installation path and deletes it. When already installed the archive
        // is left untouched. Throws InstallError.
        InstallResult install(const std::filesystem::path& archivePath);

    private:
        std::filesystem::path m_installPath;
        Platform m_platform;
        std::shared_ptr<spdlog::logger> m_logger;

        bool extract(const std::filesystem::path& archivePath, std::string& error);
        void removeArchive(const std::filesystem::path& archivePath);
    };

} // namespace Neo4jCtl

#endif // NEO4JCTL_INSTALLER_HPP
