// src/Platform.cpp
#include <Neo4jCtl/Types/Platform.hpp>

namespace Neo4jCtl {

Platform Platform::posix() {
    return Platform{Utils::OperatingSystem::LINUX, "neo4j", "neo4j-shell", "unix.tar.gz", ArchiveFormat::TarGz};
}

Platform Platform::windows() {
    return Platform{Utils::OperatingSystem::WINDOWS, "Neo4j.bat", "Neo4jShell.bat", "windows.zip", ArchiveFormat::Zip};
}

Platform Platform::forOS(Utils::OperatingSystem os) {
    if (os == Utils::OperatingSystem::WINDOWS) {
        return windows();
    }
    // macOS and Linux share the unix distribution
    Platform platform = posix();
    platform.os = os;
    return platform;
}

Platform Platform::current() {
    return forOS(Utils::getCurrentOS());
}

} // namespace Neo4jCtl
