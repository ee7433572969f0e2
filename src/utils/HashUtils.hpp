#pragma once

#include <string>
#include <fstream>
#include <memory>
#include <optional>
#include <openssl/evp.h>
#include <sstream>
#include <iomanip>

namespace bulkfetch::utils {

class HashUtils {
public:
    // Files are read in blocks of this size
    static constexpr std::size_t kBlockSize = 8192;

    static std::optional<std::string> md5File(const std::string& filePath) {
        return digestFile(filePath, EVP_md5());
    }

    static std::optional<std::string> sha1File(const std::string& filePath) {
        return digestFile(filePath, EVP_sha1());
    }

    static std::optional<std::string> sha256File(const std::string& filePath) {
        return digestFile(filePath, EVP_sha256());
    }

    static std::string md5String(const std::string& data) {
        return digestString(data, EVP_md5());
    }

private:
    using ContextPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

    static std::string toHex(const unsigned char* hash, unsigned int hashLen) {
        std::ostringstream oss;
        for (unsigned int i = 0; i < hashLen; ++i) {
            oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
        }
        return oss.str();
    }

    // nullopt when the file cannot be opened or read
    static std::optional<std::string> digestFile(const std::string& filePath, const EVP_MD* md) {
        std::ifstream file(filePath, std::ios::binary);
        if (!file.is_open()) return std::nullopt;

        ContextPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
        if (!ctx || EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
            return std::nullopt;
        }

        char buffer[kBlockSize];
        while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
            if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount())) != 1) {
                return std::nullopt;
            }
        }
        if (file.bad()) return std::nullopt;

        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;
        if (EVP_DigestFinal_ex(ctx.get(), hash, &hashLen) != 1) {
            return std::nullopt;
        }
        return toHex(hash, hashLen);
    }

    static std::string digestString(const std::string& data, const EVP_MD* md) {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;
        if (EVP_Digest(data.data(), data.size(), hash, &hashLen, md, nullptr) != 1) {
            return "";
        }
        return toHex(hash, hashLen);
    }
};

} // namespace bulkfetch::utils
