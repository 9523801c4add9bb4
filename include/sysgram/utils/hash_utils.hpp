/**
 * @file hash_utils.hpp
 * @brief SHA-256 digests for model artifact integrity
 *
 * The forest artifact records the digest of the vocabulary artifact it was
 * trained with, so a forest is never paired with a different vocabulary.
 *
 * @date 2025
 */

#pragma once

#include <string>

namespace sysgram {
namespace utils {

/**
 * @class HashUtils
 * @brief Static SHA-256 helpers (OpenSSL)
 *
 * **Usage**:
 * @code
 * std::string digest = HashUtils::ComputeSHA256(vocabulary_text);
 * @endcode
 */
class HashUtils {
public:
    /**
     * @brief SHA-256 of a byte string
     * @return Lowercase hex digest (64 characters)
     * @throws std::runtime_error if the digest cannot be computed
     */
    static std::string ComputeSHA256(const std::string& data);
};

} // namespace utils
} // namespace sysgram
