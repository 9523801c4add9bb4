/**
 * @file string_utils.hpp
 * @brief String helpers used by trace parsing and the command line
 *
 * All methods are static - no instantiation required.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace sysgram {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string manipulation helpers
 */
class StringUtils {
public:
    /**
     * @brief Trim leading and trailing whitespace
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Convert to lowercase (ASCII)
     */
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split on runs of whitespace, dropping empty fields
     */
    static std::vector<std::string> SplitWhitespace(const std::string& str);

    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    static bool StartsWith(const std::string& str, const std::string& prefix);
};

} // namespace utils
} // namespace sysgram
