// include/Neo4jCtl/VersionCatalog.hpp
#ifndef NEO4JCTL_VERSION_CATALOG_HPP
#define NEO4JCTL_VERSION_CATALOG_HPP

#include <map>
#include <optional>
#include <string>
#include <spdlog/logger.h>

namespace Neo4jCtl {

    class HttpClient;

    // nickname -> concrete version. A nickname may be listed without a version.
    using VersionMap = std::map<std::string, std::optional<std::string>>;

    // Remote nickname catalog, fetched on first use and kept for the lifetime of the object
    class VersionCatalog {
    public:
        VersionCatalog(HttpClient& httpClient, std::string catalogUrl);

        // Throws HttpError when the document cannot be fetched or is not a mapping
        const VersionMap& entries();

        bool isLoaded() const { return m_entries.has_value(); }

        // Parses the YAML mapping document served at the catalog URL
        static VersionMap parse(const std::string& document);

    private:
        HttpClient& m_httpClient;
        std::string m_catalogUrl;
        std::optional<VersionMap> m_entries;
        std::shared_ptr<spdlog::logger> m_logger;
    };

} // namespace Neo4jCtl

#endif // NEO4JCTL_VERSION_CATALOG_HPP
