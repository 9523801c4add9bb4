/**
 * @file config.hpp
 * @brief Detector configuration surface
 *
 * Every tunable of the detector lives in DetectorConfig: window cadence,
 * gram size, forest shape, alert threshold and score smoothing. Values come
 * from defaults, an optional JSON file and command-line overrides, and are
 * validated once at startup.
 *
 * **Example configuration file**:
 * @code
 * {
 *   "window_duration_ms": 2000,
 *   "gram_size": 3,
 *   "tree_count": 100,
 *   "sample_size": 256,
 *   "alert_threshold": 0.6,
 *   "seed": 42
 * }
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace sysgram {
namespace core {

/**
 * @struct DetectorConfig
 * @brief Configuration for training and inference
 */
struct DetectorConfig {
    // Windowing
    std::chrono::milliseconds window_duration{2000};  ///< Window length (fixed cadence)

    // Features
    std::size_t gram_size{3};             ///< N of the syscall n-grams (shared by training and inference)

    // Isolation Forest
    std::size_t tree_count{100};          ///< Number of isolation trees
    std::size_t sample_size{256};         ///< Training vectors drawn per tree
    std::size_t max_depth{0};             ///< Depth limit (0 = ceil(log2(sample_size)))
    std::uint64_t seed{42};               ///< Seed of the tree-building generator
    bool range_penalty{true};             ///< Isolate queries outside a node's training range

    // Alerting
    double alert_threshold{0.6};          ///< Alert when score > threshold, in [0,1]
    double contamination{0.001};          ///< Expected anomaly share used to suggest a threshold

    // Score smoothing (published alongside the raw score)
    double ewma_alpha{0.75};              ///< EWMA weight of the newest score
    std::size_t filter_history{5};        ///< Scores kept for peak clipping
    std::size_t filter_rank{2};           ///< Rank used when clipping a new peak

    // Processing stage
    std::size_t backlog_warning{16};      ///< Queue depth that triggers a backpressure warning

    // Identity
    std::string system_id{"localhost"};   ///< Identifier of the monitored system in the score feed

    /**
     * @brief Check every field
     * @throws ConfigurationError naming the first invalid field
     */
    void Validate() const;

    /**
     * @brief Load configuration from a JSON file
     *
     * Keys absent from the file keep their defaults. Unknown keys are
     * logged and ignored. The result is not validated.
     *
     * @param path JSON file
     * @return Loaded configuration
     * @throws ConfigurationError if the file cannot be read or parsed
     */
    static DetectorConfig LoadFromFile(const std::filesystem::path& path);

    /**
     * @brief Serialize to the JSON layout accepted by LoadFromFile
     */
    std::string ToJson() const;
};

} // namespace core
} // namespace sysgram
