// src/VersionCatalog.cpp
#include <Neo4jCtl/VersionCatalog.hpp>
#include <Neo4jCtl/Errors.hpp>
#include <Neo4jCtl/HttpClient.hpp>
#include <Neo4jCtl/Utils/Logger.hpp>

#include <yaml-cpp/yaml.h>

namespace Neo4jCtl {

VersionCatalog::VersionCatalog(HttpClient& httpClient, std::string catalogUrl)
    : m_httpClient(httpClient), m_catalogUrl(std::move(catalogUrl)) {
    m_logger = Utils::Logger::GetOrCreateLogger("VersionCatalog");
}

const VersionMap& VersionCatalog::entries() {
    if (m_entries) {
        return *m_entries;
    }

    m_logger->debug("Fetching version catalog from: {}", m_catalogUrl);
    cpr::Response response = m_httpClient.Get(cpr::Url{m_catalogUrl});
    if (response.error.code != cpr::ErrorCode::OK || !isSuccessStatus(response.status_code)) {
        std::string reason = response.error.message.empty() ? "HTTP status " + std::to_string(response.status_code)
                                                            : response.error.message;
        m_logger->error("Failed to fetch version catalog {}: {}", m_catalogUrl, reason);
        throw HttpError("Unable to fetch version catalog from " + m_catalogUrl + ": " + reason, response.status_code);
    }

    m_entries = parse(response.text);
    m_logger->debug("Version catalog holds {} nicknames.", m_entries->size());
    return *m_entries;
}

VersionMap VersionCatalog::parse(const std::string& document) {
    YAML::Node root;
    try {
        root = YAML::Load(document);
    } catch (const YAML::Exception& e) {
        throw HttpError(std::string("Version catalog is not valid YAML: ") + e.what());
    }

    if (!root.IsMap()) {
        throw HttpError("Version catalog is not a nickname -> version mapping");
    }

    VersionMap versions;
    try {
        for (const auto& item : root) {
            const std::string nickname = item.first.as<std::string>();
            const YAML::Node& value = item.second;
            if (!value.IsDefined() || value.IsNull()) {
                versions[nickname] = std::nullopt;
            } else if (value.IsScalar()) {
                versions[nickname] = value.as<std::string>();
            } else {
                throw HttpError("Version catalog entry '" + nickname + "' is not a scalar");
            }
        }
    } catch (const YAML::Exception& e) {
        throw HttpError(std::string("Version catalog has an unreadable entry: ") + e.what());
    }
    return versions;
}

} // namespace Neo4jCtl
