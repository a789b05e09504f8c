// include/Neo4jCtl/VersionPolicy.hpp
#ifndef NEO4JCTL_VERSION_POLICY_HPP
#define NEO4JCTL_VERSION_POLICY_HPP

#include <Neo4jCtl/ConfigStore.hpp>
#include <Neo4jCtl/Types/ServerVersion.hpp>
#include <filesystem>

namespace Neo4jCtl {

    // Every decision that depends on the 3.0.0 layout change lives here
    class VersionPolicy {
    public:
        explicit VersionPolicy(ServerVersion version);

        // Reads the version from lib/neo4j-kernel-<version>.jar. Throws VersionUndetected.
        static ServerVersion detectVersion(const std::filesystem::path& installPath);
        static VersionPolicy forInstallation(const std::filesystem::path& installPath);

        static const ServerVersion& threshold();

        const ServerVersion& version() const { return m_version; }
        bool usesModernLayout() const;

        // Relative to the installation path
        std::filesystem::path configPath() const;
        std::filesystem::path pidPath() const;

        // HTTP on httpPort, HTTPS on httpPort - 1 and disabled
        PropertyList portProperties(int httpPort) const;

        static PropertyList authProperties(bool enabled);

    private:
        ServerVersion m_version;
    };

} // namespace Neo4jCtl

#endif // NEO4JCTL_VERSION_POLICY_HPP
