// src/ConfigStore.cpp
#include <Neo4jCtl/ConfigStore.hpp>
#include <Neo4jCtl/Errors.hpp>
#include <Neo4jCtl/Utils/Logger.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace Neo4jCtl {

namespace {

constexpr const char* kWhitespace = " \t\f\v";

std::string trim(const std::string& text) {
    const size_t first = text.find_first_not_of(kWhitespace);
    if (first == std::string::npos) {
        return "";
    }
    const size_t last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

} // namespace

ConfigStore::ConfigStore(std::filesystem::path path) : m_path(std::move(path)) {
    m_logger = Utils::Logger::GetOrCreateLogger("ConfigStore");
}

std::optional<std::string> ConfigStore::parseKey(const std::string& text) {
    std::string body = trim(text);
    if (!body.empty() && body.front() == '#') {
        body = trim(body.substr(1));
    }

    const size_t equals = body.find('=');
    if (equals == std::string::npos) {
        return std::nullopt;
    }

    std::string key = trim(body.substr(0, equals));
    if (key.empty() || key.find_first_of(kWhitespace) != std::string::npos || key.front() == '#') {
        return std::nullopt;
    }
    return key;
}

std::vector<ConfigLine> ConfigStore::parse(const std::string& contents) {
    std::vector<ConfigLine> lines;
    size_t start = 0;
    while (start < contents.size()) {
        ConfigLine line;
        const size_t newline = contents.find('\n', start);
        if (newline == std::string::npos) {
            line.text = contents.substr(start);
            start = contents.size();
        } else {
            size_t end = newline;
            line.terminator = "\n";
            if (end > start && contents[end - 1] == '\r') {
                --end;
                line.terminator = "\r\n";
            }
            line.text = contents.substr(start, end - start);
            start = newline + 1;
        }
        line.key = parseKey(line.text);
        lines.push_back(std::move(line));
    }
    return lines;
}

std::string ConfigStore::serialize(const std::vector<ConfigLine>& lines) {
    std::string out;
    for (const auto& line : lines) {
        out += line.text;
        out += line.terminator;
    }
    return out;
}

std::vector<std::string> ConfigStore::apply(std::vector<ConfigLine>& lines, const PropertyList& properties) {
    std::vector<std::string> written;
    for (const auto& [name, value] : properties) {
        for (auto& line : lines) {
            if (line.key && *line.key == name) {
                line.text = name + "=" + value;
                written.push_back(name);
                break;
            }
        }
    }
    return written;
}

std::vector<ConfigLine> ConfigStore::read() const {
    std::ifstream in(m_path, std::ios::binary);
    if (!in) {
        throw ConfigError("Unable to read " + m_path.string());
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad()) {
        throw ConfigError("Error while reading " + m_path.string());
    }
    return parse(contents.str());
}

void ConfigStore::write(const std::vector<ConfigLine>& lines) const {
    std::filesystem::path temporary = m_path;
    temporary += ".neo4jctl-tmp";

    {
        std::ofstream out(temporary, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw ConfigError("Unable to write " + temporary.string());
        }
        out << serialize(lines);
        out.flush();
        if (!out) {
            std::error_code ignored;
            std::filesystem::remove(temporary, ignored);
            throw ConfigError("Error while writing " + temporary.string());
        }
    }

    std::error_code ec;
    auto permissions = std::filesystem::status(m_path, ec).permissions();
    if (!ec) {
        std::filesystem::permissions(temporary, permissions, ec);
    }

    std::filesystem::rename(temporary, m_path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temporary, ignored);
        throw ConfigError("Unable to replace " + m_path.string() + ": " + ec.message());
    }
}

void ConfigStore::modify(const PropertyList& properties) {
    std::vector<ConfigLine> lines = read();
    std::vector<std::string> written = apply(lines, properties);

    if (written.size() != properties.size()) {
        for (const auto& [name, value] : properties) {
            if (std::find(written.begin(), written.end(), name) == written.end()) {
                m_logger->debug("{} not present in {}; left unset", name, m_path.filename().string());
            }
        }
    }

    write(lines);
    m_logger->debug("Updated {} of {} properties in {}", written.size(), properties.size(), m_path.string());
}

} // namespace Neo4jCtl
