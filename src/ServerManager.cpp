// src/ServerManager.cpp
#include <Neo4jCtl/ServerManager.hpp>
#include <Neo4jCtl/ConfigStore.hpp>
#include <Neo4jCtl/Errors.hpp>
#include <Neo4jCtl/VersionPolicy.hpp>
#include <Neo4jCtl/Utils/Logger.hpp>

namespace Neo4jCtl {

ServerManager::ServerManager(const Config& config, Platform platform, HttpClient& httpClient, CommandRunner& runner,
                             PermissionGate gate)
    : m_config(config),
      m_platform(platform),
      m_catalog(httpClient, config.versionsCatalogUrl),
      m_resolver(m_catalog),
      m_downloader(httpClient, config.downloadBaseUrl, config.verifyChecksum),
      m_installer(config.installPath, platform),
      m_processController(config.installPath, platform, runner, std::move(gate)) {
    m_logger = Utils::Logger::GetOrCreateLogger("ServerManager");

    std::error_code ec;
    if (!std::filesystem::exists(m_config.installPath, ec)) {
        m_logger->info("Installation directory {} does not exist. Creating.", m_config.installPath.string());
        std::filesystem::create_directories(m_config.installPath, ec);
        if (ec) {
            throw InstallError("Unable to create " + m_config.installPath.string() + ": " + ec.message());
        }
    }
}

InstallResult ServerManager::install(const std::string& edition) {
    if (m_installer.isInstalled()) {
        m_logger->info("Neo4j already installed to: {}", m_config.installPath.string());
        return InstallResult::AlreadyInstalled;
    }

    const std::string version = m_resolver.resolve(edition);
    m_logger->info("Installing neo4j-{}", version);

    const std::filesystem::path archive = m_downloader.download(version, m_platform);
    return m_installer.install(archive);
}

void ServerManager::start(bool wait) {
    m_processController.start(wait);
}

StopOutcome ServerManager::stop(std::optional<std::chrono::milliseconds> timeout) {
    return m_processController.stop(timeout);
}

void ServerManager::console() {
    m_processController.console();
}

void ServerManager::shell() {
    m_processController.shell();
}

void ServerManager::info() {
    m_processController.info();
}

void ServerManager::restart() {
    m_processController.restart();
}

void ServerManager::reset() {
    m_processController.reset();
}

void ServerManager::modifyConfig(const PropertyList& properties) {
    const VersionPolicy policy = VersionPolicy::forInstallation(m_config.installPath);
    ConfigStore store(m_config.installPath / policy.configPath());
    store.modify(properties);
}

void ServerManager::setAuthEnabled(bool enabled) {
    modifyConfig(VersionPolicy::authProperties(enabled));
    m_logger->info("Neo4j server authorization {}", enabled ? "enabled" : "disabled");
}

void ServerManager::setPort(int port) {
    if (port < 2 || port > 65535) {
        throw ConfigError("Invalid HTTP port: " + std::to_string(port));
    }
    const VersionPolicy policy = VersionPolicy::forInstallation(m_config.installPath);
    ConfigStore store(m_config.installPath / policy.configPath());
    store.modify(policy.portProperties(port));
    m_logger->info("Config ports {} / {}", port, port - 1);
}

PasswordChangeResult ServerManager::changePassword(PromptPort& prompt, HttpClient& httpClient) {
    PasswordChanger changer(prompt, httpClient);
    return changer.run();
}

} // namespace Neo4jCtl
