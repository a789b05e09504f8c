// src/OSUtil.cpp
#include <Neo4jCtl/Utils/OS.hpp>

#if defined(_WIN32) || defined(_WIN64)
#include <windows.h>
#include <shellapi.h>
#else
#include <unistd.h>
#endif

namespace Neo4jCtl {
namespace Utils {

OperatingSystem getCurrentOS() {
    #if defined(_WIN32) || defined(_WIN64)
        return OperatingSystem::WINDOWS;
    #elif defined(__APPLE__) || defined(__MACH__)
        return OperatingSystem::MACOS;
    #elif defined(__linux__)
        return OperatingSystem::LINUX;
    #else
        return OperatingSystem::UNKNOWN;
    #endif
}

std::string toString(OperatingSystem os) {
    switch (os) {
        case OperatingSystem::WINDOWS: return "windows";
        case OperatingSystem::MACOS: return "macos";
        case OperatingSystem::LINUX: return "linux";
        default: return "unknown";
    }
}

bool isElevatedUser() {
    #if defined(_WIN32) || defined(_WIN64)
        return IsUserAnAdmin() != FALSE;
    #else
        return geteuid() == 0;
    #endif
}

} // namespace Utils
} // namespace Neo4jCtl
