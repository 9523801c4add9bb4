/**
 * @file score_filter.hpp
 * @brief Smoothed anomaly score for the score feed
 *
 * Raw per-window scores are noisy. The filter publishes a companion value:
 * an exponentially weighted moving average, with isolated peaks clipped to
 * a lower-ranked recent value. Alerting keeps using the raw score.
 *
 * **Algorithm**:
 * 1. `ewma = alpha * score + (1 - alpha) * ewma` (first score passes through)
 * 2. Append `ewma` to a history of the last `history_size` values
 * 3. With a full history, if `ewma` exceeds every earlier value in it, the
 *    output is the `clip_rank`-th largest value of the history instead
 *
 * The history holds the unclipped averages.
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <deque>
#include <optional>

namespace sysgram {
namespace detection {

/**
 * @class ScoreFilter
 * @brief EWMA + peak clipping over one score stream
 *
 * **Thread Safety**: NOT thread-safe; owned by the processing stage.
 */
class ScoreFilter {
public:
    /**
     * @brief Construct filter
     * @param alpha Weight of the newest score, in (0, 1]
     * @param history_size Number of averages kept for clipping, > 0
     * @param clip_rank Rank substituted for a new peak, in [1, history_size]
     * @throws core::ConfigurationError on invalid parameters
     */
    ScoreFilter(double alpha, std::size_t history_size, std::size_t clip_rank);

    /**
     * @brief Feed the next raw score
     * @return Filtered score
     */
    double Apply(double score);

    /// Forget all previous scores
    void Reset();

    std::size_t GetObserved() const { return observed_; }

private:
    double alpha_;
    std::size_t history_size_;
    std::size_t clip_rank_;

    std::optional<double> ewma_;
    std::deque<double> history_;
    std::size_t observed_{0};
};

} // namespace detection
} // namespace sysgram
