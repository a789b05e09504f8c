// src/Config.cpp
#include <Neo4jCtl/Config.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace Neo4jCtl {

namespace {

std::optional<std::string> readEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

} // namespace

Config::Config(const std::filesystem::path& installation) {
    installPath = std::filesystem::absolute(installation).lexically_normal();
    logDir = installPath.parent_path() / "neo4jctl-logs";
}

Config Config::fromEnvironment(const std::filesystem::path& installation) {
    Config config(installation);

    if (auto url = readEnv("NEO4JCTL_VERSIONS_URL")) config.versionsCatalogUrl = *url;
    if (auto url = readEnv("NEO4JCTL_DOWNLOAD_URL")) config.downloadBaseUrl = *url;
    if (auto bundle = readEnv("NEO4JCTL_CA_BUNDLE")) config.caBundle = std::filesystem::path(*bundle);
    if (auto dir = readEnv("NEO4JCTL_LOG_DIR")) config.logDir = *dir;

    if (auto verify = readEnv("NEO4JCTL_VERIFY_CHECKSUM")) {
        std::string value = *verify;
        std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return std::tolower(c); });
        config.verifyChecksum = !(value == "0" || value == "false" || value == "no");
    }

    // Download URLs are built by appending "/neo4j-..."
    while (!config.downloadBaseUrl.empty() && config.downloadBaseUrl.back() == '/') {
        config.downloadBaseUrl.pop_back();
    }
    return config;
}

} // namespace Neo4jCtl
