// include/Neo4jCtl/Config.hpp
#ifndef NEO4JCTL_CONFIG_HPP
#define NEO4JCTL_CONFIG_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace Neo4jCtl {

    struct Config {
        std::filesystem::path installPath;
        std::filesystem::path logDir; // neo4jctl's own logs, not the server's

        std::string versionsCatalogUrl = "https://raw.githubusercontent.com/neo4jrb/neo4j-rake_tasks/master/neo4j_versions.yml";
        std::string downloadBaseUrl = "http://dist.neo4j.org";
        std::optional<std::filesystem::path> caBundle;
        bool verifyChecksum = true;

        Config(const std::filesystem::path& installation = "./db/neo4j/development");

        // Defaults overridden by NEO4JCTL_VERSIONS_URL, NEO4JCTL_DOWNLOAD_URL,
        // NEO4JCTL_CA_BUNDLE, NEO4JCTL_LOG_DIR and NEO4JCTL_VERIFY_CHECKSUM
        static Config fromEnvironment(const std::filesystem::path& installation);
    };

} // namespace Neo4jCtl

#endif // NEO4JCTL_CONFIG_HPP
