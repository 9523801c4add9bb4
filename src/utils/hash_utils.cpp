/**
 * @file hash_utils.cpp
 * @brief Implementation of SHA-256 helpers on top of OpenSSL
 *
 * @date 2025
 */

#include "sysgram/utils/hash_utils.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace sysgram {
namespace utils {

namespace {

/**
 * @brief Convert binary digest to lowercase hexadecimal
 */
std::string BinaryToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* context) const { EVP_MD_CTX_free(context); }
};

} // anonymous namespace

std::string HashUtils::ComputeSHA256(const std::string& data) {
    std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> context(EVP_MD_CTX_new());
    if (!context || EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA-256 context");
    }
    if (EVP_DigestUpdate(context.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }

    unsigned char hash[SHA256_DIGEST_LENGTH];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(context.get(), hash, &length) != 1) {
        throw std::runtime_error("SHA-256 finalization failed");
    }

    return BinaryToHex(hash, length);
}

} // namespace utils
} // namespace sysgram
