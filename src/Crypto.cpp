// src/Crypto.cpp
#include <Neo4jCtl/Utils/Crypto.hpp>
#include <Neo4jCtl/Utils/Logger.hpp>

#include <openssl/evp.h>
#include <openssl/sha.h>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace Neo4jCtl::Utils {

    static std::string bytesToHexString(const unsigned char *bytes, size_t len) {
        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        for (size_t i = 0; i < len; ++i) {
            ss << std::setw(2) << static_cast<int>(bytes[i]);
        }
        return ss.str();
    }

    std::string calculateFileSHA256(const std::filesystem::path &filePath) {
        CORE_LOG_TRACE("[Crypto] Calculating SHA256 for file: {}", filePath.string());
        std::ifstream file(filePath, std::ios::binary);
        if (!file.is_open()) {
            CORE_LOG_ERROR("[Crypto] Could not open file for SHA256 calculation: {}", filePath.string());
            return "";
        }

        EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
        if (mdctx == nullptr) {
            CORE_LOG_ERROR("[Crypto] EVP_MD_CTX_new failed for SHA256 on file: {}", filePath.string());
            return "";
        }

        if (1 != EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr)) {
            CORE_LOG_ERROR("[Crypto] EVP_DigestInit_ex for SHA256 failed on file: {}", filePath.string());
            EVP_MD_CTX_free(mdctx);
            return "";
        }

        constexpr size_t bufferSize = 64 * 1024;
        std::vector<char> buffer(bufferSize);

        while (file.good()) {
            file.read(buffer.data(), bufferSize);
            std::streamsize bytesRead = file.gcount();
            if (bytesRead > 0) {
                if (1 != EVP_DigestUpdate(mdctx, buffer.data(), static_cast<size_t>(bytesRead))) {
                    CORE_LOG_ERROR("[Crypto] EVP_DigestUpdate failed for SHA256 on file: {}", filePath.string());
                    EVP_MD_CTX_free(mdctx);
                    return "";
                }
            }
        }

        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;

        if (1 != EVP_DigestFinal_ex(mdctx, hash, &hashLen)) {
            CORE_LOG_ERROR("[Crypto] EVP_DigestFinal_ex failed for SHA256 on file: {}", filePath.string());
            EVP_MD_CTX_free(mdctx);
            return "";
        }
        EVP_MD_CTX_free(mdctx);

        if (hashLen != SHA256_DIGEST_LENGTH) {
            CORE_LOG_WARN("[Crypto] SHA256 digest length is {}, expected {} for file: {}", hashLen,
                          SHA256_DIGEST_LENGTH, filePath.string());
        }

        std::string hexHash = bytesToHexString(hash, hashLen);
        CORE_LOG_TRACE("[Crypto] SHA256 for {}: {}", filePath.string(), hexHash);
        return hexHash;
    }

} // namespace Neo4jCtl::Utils
