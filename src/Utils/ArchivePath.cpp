// src/Utils/ArchivePath.cpp
#include <Neo4jCtl/Utils/ArchivePath.hpp>

namespace Neo4jCtl::Utils {

    std::optional<std::filesystem::path> archiveEntryDestination(const std::filesystem::path &outputDirectory,
                                                                 const std::string &entryName,
                                                                 unsigned int stripComponents) {
        std::filesystem::path entry = std::filesystem::path(entryName).lexically_normal();
        if (entry.empty() || entry.has_root_path()) {
            return std::nullopt;
        }

        std::filesystem::path relative;
        unsigned int skipped = 0;
        for (const auto &part : entry) {
            if (part == "..") {
                return std::nullopt;
            }
            if (part.empty() || part == ".") {
                continue;
            }
            if (skipped < stripComponents) {
                ++skipped;
                continue;
            }
            relative /= part;
        }

        if (relative.empty()) {
            return std::nullopt;
        }
        return outputDirectory / relative;
    }

} // namespace Neo4jCtl::Utils
