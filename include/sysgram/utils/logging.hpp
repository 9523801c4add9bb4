/**
 * @file logging.hpp
 * @brief Process-wide spdlog setup
 *
 * @date 2025
 */

#pragma once

namespace sysgram {
namespace utils {

/**
 * @brief Install the default logger
 *
 * Pattern `[%H:%M:%S] [%^%l%$] %v`, `info` level or `debug` when verbose.
 * Logs go to stdout unless stdout carries data (a score feed written to
 * `-`), in which case they go to stderr.
 *
 * @param verbose Enable debug messages
 * @param to_stderr Write logs to stderr instead of stdout
 */
void ConfigureLogging(bool verbose, bool to_stderr);

} // namespace utils
} // namespace sysgram
