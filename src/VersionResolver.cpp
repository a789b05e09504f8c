// src/VersionResolver.cpp
#include <Neo4jCtl/VersionResolver.hpp>
#include <Neo4jCtl/Errors.hpp>
#include <Neo4jCtl/VersionCatalog.hpp>
#include <Neo4jCtl/Utils/Logger.hpp>

#include <algorithm>
#include <cctype>

namespace Neo4jCtl {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
    return text;
}

bool isNicknameShaped(const std::string& segment) {
    return !segment.empty() &&
           std::all_of(segment.begin(), segment.end(), [](unsigned char c) { return c >= 'a' && c <= 'z'; });
}

} // namespace

VersionResolver::VersionResolver(VersionCatalog& catalog) : m_catalog(catalog) {
    m_logger = Utils::Logger::GetOrCreateLogger("VersionResolver");
}

std::optional<std::string> VersionResolver::nicknameSuffix(const std::string& edition) {
    const std::string lowered = toLower(edition);
    const size_t hyphen = lowered.rfind('-');
    std::string segment = hyphen == std::string::npos ? lowered : lowered.substr(hyphen + 1);
    if (!isNicknameShaped(segment)) {
        return std::nullopt;
    }
    return segment;
}

std::string VersionResolver::lookup(const std::string& nickname) {
    m_logger->info("Retrieving {} version...", nickname);

    const VersionMap& versions = m_catalog.entries();
    auto it = versions.find(nickname);
    if (it == versions.end()) {
        throw VersionResolutionError(VersionResolutionError::Kind::UnknownNickname, nickname,
                                     "Invalid version identifier: " + nickname);
    }
    if (!it->second) {
        throw VersionResolutionError(VersionResolutionError::Kind::NicknameHasNoVersion, nickname,
                                     "There is not currently a version for " + nickname);
    }

    std::string label = nickname;
    label[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(label[0])));
    m_logger->info("{} version is: {}", label, *it->second);
    return *it->second;
}

std::string VersionResolver::resolve(const std::string& edition) {
    const std::string lowered = toLower(edition);
    std::optional<std::string> nickname = nicknameSuffix(lowered);
    if (!nickname) {
        return lowered;
    }

    const size_t hyphen = lowered.rfind('-');
    if (hyphen == std::string::npos) {
        // "enterprise" may itself be a catalog key; otherwise it is a literal edition
        try {
            const VersionMap& versions = m_catalog.entries();
            if (versions.find(*nickname) == versions.end()) {
                return lowered;
            }
        } catch (const HttpError& e) {
            m_logger->warn("Version catalog unavailable, using '{}' as given: {}", lowered, e.what());
            return lowered;
        }
        return lookup(*nickname);
    }

    return lowered.substr(0, hyphen) + "-" + lookup(*nickname);
}

} // namespace Neo4jCtl
