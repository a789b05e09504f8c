// include/Neo4jCtl/Utils/OS.hpp
#ifndef NEO4JCTL_OS_UTIL_HPP
#define NEO4JCTL_OS_UTIL_HPP

#include <string>

namespace Neo4jCtl {
    namespace Utils {

        enum class OperatingSystem {
            WINDOWS,
            MACOS,
            LINUX,
            UNKNOWN
        };

        OperatingSystem getCurrentOS();

        std::string toString(OperatingSystem os);

        // Effective uid 0 on POSIX; on Windows a member of the Administrators group
        bool isElevatedUser();

    } // namespace Utils
} // namespace Neo4jCtl

#endif // NEO4JCTL_OS_UTIL_HPP
