/**
 * @file threshold_alerting.cpp
 * @brief Implementation of threshold alerting
 *
 * @date 2025
 */

#include "sysgram/detection/threshold_alerting.hpp"
#include "sysgram/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <string>

namespace sysgram {
namespace detection {

namespace {

void CheckThreshold(double threshold) {
    if (!(threshold >= 0.0 && threshold <= 1.0)) {
        throw core::ConfigurationError("alert threshold " + std::to_string(threshold) +
                                       " is outside [0, 1]");
    }
}

} // anonymous namespace

std::optional<Alert> Evaluate(const core::WindowSpan& window, double score, double threshold) {
    if (score > threshold) {
        return Alert{window, score, threshold};
    }
    return std::nullopt;
}

ThresholdAlerter::ThresholdAlerter(double threshold)
    : threshold_(threshold) {
    CheckThreshold(threshold);
}

std::optional<Alert> ThresholdAlerter::Evaluate(const core::WindowSpan& window, double score) const {
    return detection::Evaluate(window, score, threshold_.load());
}

void ThresholdAlerter::SetThreshold(double threshold) {
    CheckThreshold(threshold);
    double previous = threshold_.exchange(threshold);
    spdlog::info("Alert threshold changed: {:.3f} -> {:.3f}", previous, threshold);
}

} // namespace detection
} // namespace sysgram
