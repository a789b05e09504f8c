// include/Neo4jCtl/Utils/ArchivePath.hpp
#ifndef NEO4JCTL_ARCHIVE_PATH_UTIL_HPP
#define NEO4JCTL_ARCHIVE_PATH_UTIL_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace Neo4jCtl::Utils {

    // Maps an archive entry name to its destination under outputDirectory.
    // Returns nullopt when nothing is left after stripping, or when the entry
    // is absolute or contains "..".
    std::optional<std::filesystem::path> archiveEntryDestination(const std::filesystem::path &outputDirectory,
                                                                 const std::string &entryName,
                                                                 unsigned int stripComponents);

} // namespace Neo4jCtl::Utils

#endif // NEO4JCTL_ARCHIVE_PATH_UTIL_HPP
