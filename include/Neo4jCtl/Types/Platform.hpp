// include/Neo4jCtl/Types/Platform.hpp
#ifndef NEO4JCTL_PLATFORM_HPP
#define NEO4JCTL_PLATFORM_HPP

#include <Neo4jCtl/Utils/OS.hpp>
#include <string>

namespace Neo4jCtl {

    enum class ArchiveFormat {
        TarGz,
        Zip
    };

    // OS-specific file names and archive conventions. Everything else joins
    // paths the same way on every platform.
    struct Platform {
        Utils::OperatingSystem os;
        std::string serverBinary;  // under bin/
        std::string shellBinary;   // under bin/
        std::string archiveSuffix; // appended to "neo4j-<version>-"
        ArchiveFormat archiveFormat;

        static Platform forOS(Utils::OperatingSystem os);
        static Platform current();

        static Platform posix();
        static Platform windows();
    };

} // namespace Neo4jCtl

#endif // NEO4JCTL_PLATFORM_HPP
