// include/Neo4jCtl/Types/ServerVersion.hpp
#ifndef NEO4JCTL_SERVER_VERSION_HPP
#define NEO4JCTL_SERVER_VERSION_HPP

#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace Neo4jCtl {

    // Dotted numeric version as found in lib/neo4j-kernel-<version>.jar
    class ServerVersion {
    public:
        ServerVersion(std::initializer_list<unsigned int> components);

        // "3.0.1" -> {3,0,1}. Returns nullopt for anything but digits and dots.
        static std::optional<ServerVersion> parse(const std::string& text);

        const std::string& str() const { return m_text; }

        // Missing trailing components count as zero, so 3.0 == 3.0.0
        int compare(const ServerVersion& other) const;

        bool operator<(const ServerVersion& other) const { return compare(other) < 0; }
        bool operator>=(const ServerVersion& other) const { return compare(other) >= 0; }
        bool operator==(const ServerVersion& other) const { return compare(other) == 0; }

    private:
        ServerVersion() = default;

        std::vector<unsigned int> m_components;
        std::string m_text;
    };

} // namespace Neo4jCtl

#endif // NEO4JCTL_SERVER_VERSION_HPP
