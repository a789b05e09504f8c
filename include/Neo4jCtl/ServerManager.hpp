// include/Neo4jCtl/ServerManager.hpp
#ifndef NEO4JCTL_SERVER_MANAGER_HPP
#define NEO4JCTL_SERVER_MANAGER_HPP

#include <Neo4jCtl/Config.hpp>
#include <Neo4jCtl/ConfigStore.hpp>
#include <Neo4jCtl/Downloader.hpp>
#include <Neo4jCtl/Installer.hpp>
#include <Neo4jCtl/PasswordChanger.hpp>
#include <Neo4jCtl/PermissionGate.hpp>
#include <Neo4jCtl/ProcessController.hpp>
#include <Neo4jCtl/Types/Platform.hpp>
#include <Neo4jCtl/VersionCatalog.hpp>
#include <Neo4jCtl/VersionResolver.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <spdlog/logger.h>

namespace Neo4jCtl {

    class CommandRunner;
    class HttpClient;
    class PromptPort;

    // One installation path, one manager. The command surface used by the CLI.
    class ServerManager {
    public:
        ServerManager(const Config& config, Platform platform, HttpClient& httpClient, CommandRunner& runner,
                      PermissionGate gate = PermissionGate());

        // Resolves the edition, downloads and extracts it. Nothing is fetched
        // when the installation already has a server binary.
        InstallResult install(const std::string& edition);

        void start(bool wait = true);
        StopOutcome stop(std::optional<std::chrono::milliseconds> timeout = std::nullopt);
        void console();
        void shell();
        void info();
        void restart();
        void reset();

        void setAuthEnabled(bool enabled);
        // HTTP on port, HTTPS on port - 1 (disabled)
        void setPort(int port);

        static PasswordChangeResult changePassword(PromptPort& prompt, HttpClient& httpClient);

        const Config& config() const { return m_config; }
        ProcessController& processController() { return m_processController; }

    private:
        Config m_config;
        Platform m_platform;
        VersionCatalog m_catalog;
        VersionResolver m_resolver;
        Downloader m_downloader;
        Installer m_installer;
        ProcessController m_processController;
        std::shared_ptr<spdlog::logger> m_logger;

        void modifyConfig(const PropertyList& properties);
    };

} // namespace Neo4jCtl

#endif // NEO4JCTL_SERVER_MANAGER_HPP
