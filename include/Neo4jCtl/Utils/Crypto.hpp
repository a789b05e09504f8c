// include/Neo4jCtl/Utils/Crypto.hpp
#ifndef NEO4JCTL_CRYPTO_UTIL_HPP
#define NEO4JCTL_CRYPTO_UTIL_HPP

#include <filesystem>
#include <string>

namespace Neo4jCtl {
    namespace Utils {

        /**
         * @brief Calculates the SHA256 hash of a given file.
         * @param filePath The path to the file.
         * @return A lowercase hex-encoded string of the SHA256 hash. Returns an empty string on error (e.g., file not found, OpenSSL error).
         */
        std::string calculateFileSHA256(const std::filesystem::path& filePath);

    } // namespace Utils
} // namespace Neo4jCtl

#endif // NEO4JCTL_CRYPTO_UTIL_HPP
