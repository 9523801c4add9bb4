/**
 * @file errors.hpp
 * @brief Fatal error types raised by the detector
 *
 * Only global failures are exceptions: invalid configuration and model
 * artifacts that do not belong together. Capture anomalies are logged and
 * counted where they happen and never reach these types.
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>

namespace sysgram {
namespace core {

/**
 * @class ConfigurationError
 * @brief Invalid configuration, empty training corpus or unreadable artifact
 *
 * Raised at startup and never retried.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error("configuration error: " + message) {}
};

/**
 * @class ModelMismatchError
 * @brief Vocabulary, forest and feature vectors disagree on shape
 *
 * Gram size or feature dimensionality differ between artifacts, or a
 * vector reaches a forest trained on another vocabulary. The model must be
 * retrained; inference refuses to continue.
 */
class ModelMismatchError : public std::runtime_error {
public:
    explicit ModelMismatchError(const std::string& message)
        : std::runtime_error("model mismatch: " + message) {}
};

} // namespace core
} // namespace sysgram
