#pragma once

#include <string>
#include <fstream>
#include <openssl/sha.h>
#include <openssl/evp.h>
#include <sstream>
#include <iomanip>

namespace docfetch::utils {

class HashUtils {
public:
    /**
     * SHA-256 of a file as lowercase hex
     * @return empty string when the file cannot be read or hashed
     */
    static std::string sha256File(const std::string& filePath) {
        std::ifstream file(filePath, std::ios::binary);
        if (!file.is_open()) return "";

        EVP_MD_CTX* ctx = EVP_MD_CTX_new();
        if (!ctx) return "";

        if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
            EVP_MD_CTX_free(ctx);
            return "";
        }

        char buffer[8192];
        while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
            if (EVP_DigestUpdate(ctx, buffer, static_cast<size_t>(file.gcount())) != 1) {
                EVP_MD_CTX_free(ctx);
                return "";
            }
        }

        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;
        int finalized = EVP_DigestFinal_ex(ctx, hash, &hashLen);
        EVP_MD_CTX_free(ctx);
        if (finalized != 1) return "";

        return toHex(hash, hashLen);
    }

    static std::string sha256String(const std::string& data) {
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
        return toHex(hash, SHA256_DIGEST_LENGTH);
    }

private:
    static std::string toHex(const unsigned char* bytes, unsigned int length) {
        std::ostringstream oss;
        for (unsigned int i = 0; i < length; ++i) {
            oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(bytes[i]);
        }
        return oss.str();
    }
};

} // namespace docfetch::utils
