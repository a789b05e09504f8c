// include/Neo4jCtl/ConfigStore.hpp
#ifndef NEO4JCTL_CONFIG_STORE_HPP
#define NEO4JCTL_CONFIG_STORE_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <spdlog/logger.h>

namespace Neo4jCtl {

    // One physical line of a property file. text excludes the line terminator,
    // which is kept separately so untouched lines serialize byte for byte.
    struct ConfigLine {
        std::string text;
        std::string terminator; // "\n", "\r\n" or "" for a final unterminated line
        std::optional<std::string> key; // set for "key=value" and "#key=value"
    };

    // Ordered name/value pairs; applied in order
    using PropertyList = std::vector<std::pair<std::string, std::string>>;

    class ConfigStore {
    public:
        explicit ConfigStore(std::filesystem::path path);

        const std::filesystem::path& path() const { return m_path; }

        // Reads the whole file, rewrites the first line keyed by each property
        // as "name=value" (uncommenting it) and writes the whole file back.
        // Properties with no matching line are not added. Throws ConfigError.
        void modify(const PropertyList& properties);

        std::vector<ConfigLine> read() const;
        void write(const std::vector<ConfigLine>& lines) const;

        static std::vector<ConfigLine> parse(const std::string& contents);
        static std::string serialize(const std::vector<ConfigLine>& lines);
        static std::optional<std::string> parseKey(const std::string& text);

        // Returns the names that were written; lines are updated in place
        static std::vector<std::string> apply(std::vector<ConfigLine>& lines, const PropertyList& properties);

    private:
        std::filesystem::path m_path;
        std::shared_ptr<spdlog::logger> m_logger;
    };

} // namespace Neo4jCtl

#endif // NEO4JCTL_CONFIG_STORE_HPP
