/**
 * @file score_filter.cpp
 * @brief Implementation of score smoothing
 *
 * @date 2025
 */

#include "sysgram/detection/score_filter.hpp"
#include "sysgram/core/errors.hpp"

#include <algorithm>
#include <functional>
#include <vector>

namespace sysgram {
namespace detection {

ScoreFilter::ScoreFilter(double alpha, std::size_t history_size, std::size_t clip_rank)
    : alpha_(alpha)
    , history_size_(history_size)
    , clip_rank_(clip_rank) {

    if (!(alpha_ > 0.0 && alpha_ <= 1.0)) {
        throw core::ConfigurationError("EWMA alpha must be within (0, 1]");
    }
    if (history_size_ == 0) {
        throw core::ConfigurationError("filter history must be positive");
    }
    if (clip_rank_ == 0 || clip_rank_ > history_size_) {
        throw core::ConfigurationError("filter rank must be within [1, history size]");
    }
}

double ScoreFilter::Apply(double score) {
    observed_++;

    if (!ewma_) {
        ewma_ = score;
    } else {
        ewma_ = alpha_ * score + (1.0 - alpha_) * *ewma_;
    }

    const double value = *ewma_;
    history_.push_back(value);

    double filtered = value;
    if (history_.size() == history_size_) {
        auto previous_end = history_.end() - 1;
        if (history_.begin() != previous_end &&
            value > *std::max_element(history_.begin(), previous_end)) {
            std::vector<double> sorted(history_.begin(), history_.end());
            std::sort(sorted.begin(), sorted.end(), std::greater<double>());
            filtered = sorted[clip_rank_ - 1];
        }
        history_.pop_front();
    }

    return filtered;
}

void ScoreFilter::Reset() {
    ewma_.reset();
    history_.clear();
    observed_ = 0;
}

} // namespace detection
} // namespace sysgram
