// src/VersionPolicy.cpp
#include <Neo4jCtl/VersionPolicy.hpp>
#include <Neo4jCtl/Errors.hpp>
#include <Neo4jCtl/Utils/Logger.hpp>

#include <algorithm>
#include <regex>
#include <vector>

namespace Neo4jCtl {

VersionPolicy::VersionPolicy(ServerVersion version) : m_version(std::move(version)) {}

const ServerVersion& VersionPolicy::threshold() {
    static const ServerVersion kThreshold{3, 0, 0};
    return kThreshold;
}

ServerVersion VersionPolicy::detectVersion(const std::filesystem::path& installPath) {
    const std::filesystem::path libDir = installPath / "lib";
    std::error_code ec;
    if (!std::filesystem::is_directory(libDir, ec)) {
        throw VersionUndetected("No Neo4j installation found at " + installPath.string() + " (missing lib/)");
    }

    static const std::regex kernelJar(R"(^neo4j-kernel-([\d\.]+)\.jar$)");

    // Sorted so the pick does not depend on directory order
    std::vector<std::string> names;
    for (const auto& entry : std::filesystem::directory_iterator(libDir, ec)) {
        names.push_back(entry.path().filename().string());
    }
    std::sort(names.begin(), names.end());

    for (const auto& name : names) {
        std::smatch match;
        if (std::regex_match(name, match, kernelJar)) {
            if (auto version = ServerVersion::parse(match[1].str())) {
                CORE_LOG_TRACE("[VersionPolicy] Detected server version {} from {}", version->str(), name);
                return *version;
            }
        }
    }

    throw VersionUndetected("Unable to determine the Neo4j version: no lib/neo4j-kernel-<version>.jar under " +
                            installPath.string());
}

VersionPolicy VersionPolicy::forInstallation(const std::filesystem::path& installPath) {
    return VersionPolicy(detectVersion(installPath));
}

bool VersionPolicy::usesModernLayout() const {
    return m_version >= threshold();
}

std::filesystem::path VersionPolicy::configPath() const {
    if (usesModernLayout()) {
        return std::filesystem::path("conf") / "neo4j.conf";
    }
    return std::filesystem::path("conf") / "neo4j-server.properties";
}

std::filesystem::path VersionPolicy::pidPath() const {
    if (usesModernLayout()) {
        return std::filesystem::path("run") / "neo4j.pid";
    }
    return std::filesystem::path("data") / "neo4j-service.pid";
}

PropertyList VersionPolicy::portProperties(int httpPort) const {
    const std::string http = std::to_string(httpPort);
    const std::string https = std::to_string(httpPort - 1);

    if (usesModernLayout()) {
        return {
            {"dbms.connector.https.enabled", "false"},
            {"dbms.connector.http.enabled", "true"},
            {"dbms.connector.http.address", "0.0.0.0:" + http},
            {"dbms.connector.https.address", "localhost:" + https},
        };
    }
    return {
        {"org.neo4j.server.webserver.https.enabled", "false"},
        {"org.neo4j.server.webserver.port", http},
        {"org.neo4j.server.webserver.https.port", https},
    };
}

PropertyList VersionPolicy::authProperties(bool enabled) {
    const std::string value = enabled ? "true" : "false";
    // Both spellings have shipped; only lines already in the file are touched
    return {
        {"dbms.security.authorization_enabled", value},
        {"dbms.security.auth_enabled", value},
    };
}

} // namespace Neo4jCtl
