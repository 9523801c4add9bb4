/**
 * @file threshold_alerting.hpp
 * @brief Turns anomaly scores into alerts
 *
 * A window alerts when its score is strictly above the threshold. Every
 * window is judged on its own score; there is no hysteresis and no
 * suppression of repeated alerts.
 *
 * @date 2025
 */

#pragma once

#include "sysgram/core/types.hpp"

#include <atomic>
#include <optional>

namespace sysgram {
namespace detection {

/**
 * @struct Alert
 * @brief Anomalous window notification
 *
 * A value: the threshold recorded is the one in force when the alert was
 * raised, later threshold changes do not affect it.
 */
struct Alert {
    core::WindowSpan window;  ///< Window that triggered the alert
    double score{0.0};        ///< Anomaly score of the window
    double threshold{0.0};    ///< Threshold in force at evaluation
};

/**
 * @brief Compare a window's score against a threshold
 * @param window Evaluated window
 * @param score Anomaly score in [0,1]
 * @param threshold Alert threshold in [0,1]
 * @return Alert if score > threshold
 */
std::optional<Alert> Evaluate(const core::WindowSpan& window, double score, double threshold);

/**
 * @class ThresholdAlerter
 * @brief Holds the current alert threshold
 *
 * **Thread Safety**: SetThreshold() may be called from any thread while
 * the processing stage evaluates windows.
 */
class ThresholdAlerter {
public:
    /**
     * @brief Construct alerter
     * @param threshold Initial threshold in [0,1]
     * @throws core::ConfigurationError if out of range
     */
    explicit ThresholdAlerter(double threshold);

    /// Evaluate against the current threshold
    std::optional<Alert> Evaluate(const core::WindowSpan& window, double score) const;

    /**
     * @brief Replace the threshold for subsequent windows
     * @throws core::ConfigurationError if out of range
     */
    void SetThreshold(double threshold);

    double GetThreshold() const { return threshold_.load(); }

private:
    std::atomic<double> threshold_;
};

} // namespace detection
} // namespace sysgram
