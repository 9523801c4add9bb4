/**
 * @file window_scoring.cpp
 * @brief Implementation of per-window scoring
 *
 * @date 2025
 */

#include "sysgram/core/window_scoring.hpp"

namespace sysgram {
namespace core {

double ScoreCounts(const features::TfidfVectorizer& vectorizer,
                   const models::IsolationForest& forest,
                   const features::NGramCounts& counts) {
    if (counts.Total() == 0) {
        return forest.GetBaselineScore();
    }
    return forest.Score(vectorizer.Transform(counts));
}

} // namespace core
} // namespace sysgram
