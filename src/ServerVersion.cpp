// src/ServerVersion.cpp
#include <Neo4jCtl/Types/ServerVersion.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace Neo4jCtl {

ServerVersion::ServerVersion(std::initializer_list<unsigned int> components) : m_components(components) {
    std::ostringstream ss;
    for (size_t i = 0; i < m_components.size(); ++i) {
        if (i > 0) ss << '.';
        ss << m_components[i];
    }
    m_text = ss.str();
}

std::optional<ServerVersion> ServerVersion::parse(const std::string& text) {
    if (text.empty() || text.front() == '.' || text.back() == '.') {
        return std::nullopt;
    }

    ServerVersion version;
    version.m_text = text;

    std::istringstream stream(text);
    std::string part;
    while (std::getline(stream, part, '.')) {
        if (part.empty() || !std::all_of(part.begin(), part.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return std::nullopt;
        }
        try {
            version.m_components.push_back(static_cast<unsigned int>(std::stoul(part)));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return version;
}

int ServerVersion::compare(const ServerVersion& other) const {
    const size_t count = std::max(m_components.size(), other.m_components.size());
    for (size_t i = 0; i < count; ++i) {
        unsigned int mine = i < m_components.size() ? m_components[i] : 0;
        unsigned int theirs = i < other.m_components.size() ? other.m_components[i] : 0;
        if (mine != theirs) {
            return mine < theirs ? -1 : 1;
        }
    }
    return 0;
}

} // namespace Neo4jCtl
