// include/Neo4jCtl/VersionResolver.hpp
#ifndef NEO4JCTL_VERSION_RESOLVER_HPP
#define NEO4JCTL_VERSION_RESOLVER_HPP

#include <optional>
#include <string>
#include <spdlog/logger.h>

namespace Neo4jCtl {

    class VersionCatalog;

    // Turns an edition string such as "community-latest" into the version
    // string used in download URLs ("community-3.0.1").
    class VersionResolver {
    public:
        explicit VersionResolver(VersionCatalog& catalog);

        // The input is lowercased first. A trailing "-<letters>" segment is a
        // nickname and must be in the catalog. A hyphen-free, all-letter
        // string is looked up too but stays literal when the catalog lacks it.
        // Anything else is returned unchanged without touching the network.
        std::string resolve(const std::string& edition);

        // The trailing nickname-shaped segment of an edition, if any
        static std::optional<std::string> nicknameSuffix(const std::string& edition);

    private:
        VersionCatalog& m_catalog;
        std::shared_ptr<spdlog::logger> m_logger;

        std::string lookup(const std::string& nickname);
    };

} // namespace Neo4jCtl

#endif // NEO4JCTL_VERSION_RESOLVER_HPP
