// src/Installer.cpp
#include <Neo4jCtl/Installer.hpp>
#include <Neo4jCtl/Errors.hpp>
#include <Neo4jCtl/Utils/Logger.hpp>
#include <Neo4jCtl/Utils/TarArchive.hpp>
#include <Neo4jCtl/Utils/ZipFile.hpp>

namespace Neo4jCtl {

Installer::Installer(std::filesystem::path installPath, Platform platform)
    : m_installPath(std::move(installPath)), m_platform(std::move(platform)) {
    m_logger = Utils::Logger::GetOrCreateLogger("Installer");
}

std::filesystem::path Installer::serverBinaryPath() const {
    return m_installPath / "bin" / m_platform.serverBinary;
}

bool Installer::isInstalled() const {
    return std::filesystem::exists(serverBinaryPath());
}

InstallResult Installer::install(const std::filesystem::path& archivePath) {
    if (isInstalled()) {
        m_logger->info("Neo4j already installed at {}", m_installPath.string());
        return InstallResult::AlreadyInstalled;
    }

    std::error_code ec;
    std::filesystem::create_directories(m_installPath, ec);
    if (ec) {
        throw InstallError("Unable to create " + m_installPath.string() + ": " + ec.message());
    }

    std::string error;
    if (!extract(archivePath, error)) {
        removeArchive(archivePath);
        throw InstallError("Failed to extract " + archivePath.string() + " into " + m_installPath.string() +
                           (error.empty() ? "" : ": " + error));
    }

    if (!isInstalled()) {
        removeArchive(archivePath);
        throw InstallError("Archive did not contain bin/" + m_platform.serverBinary);
    }

    removeArchive(archivePath);
    m_logger->info("Neo4j installed to: {}", m_installPath.string());
    return InstallResult::Installed;
}

bool Installer::extract(const std::filesystem::path& archivePath, std::string& error) {
    m_logger->debug("Extracting {} to {}", archivePath.string(), m_installPath.string());

    // Distribution archives wrap everything in neo4j-<edition>-<version>/
    constexpr unsigned int stripComponents = 1;

    if (m_platform.archiveFormat == ArchiveFormat::Zip) {
        Utils::ZipFile zipFile(archivePath);
        bool ok = zipFile.extractAll(m_installPath, stripComponents);
        error = zipFile.getLastError();
        return ok;
    }

    Utils::TarArchive tarball(archivePath);
    bool ok = tarball.extractAll(m_installPath, stripComponents);
    error = tarball.getLastError();
    return ok;
}

void Installer::removeArchive(const std::filesystem::path& archivePath) {
    std::error_code ec;
    std::filesystem::remove(archivePath, ec);
    if (ec) {
        m_logger->warn("Failed to remove downloaded archive {}: {}", archivePath.string(), ec.message());
    } else {
        m_logger->debug("Removed downloaded archive: {}", archivePath.string());
    }
}

} // namespace Neo4jCtl
