/**
 * @file window_scoring.hpp
 * @brief Anomaly score of one window's n-gram counts
 *
 * A window can map to the zero vector for two different reasons:
 * - it holds no n-gram at all (an idle period, a capture gap, or fewer
 *   syscalls than the gram size)
 * - every n-gram it holds is absent from the vocabulary
 *
 * The first is quiet behavior and gets the forest's baseline score, the
 * lowest score seen in training. The second is novel behavior and is scored
 * by the forest, where the range penalty isolates it early.
 *
 * @date 2025
 */

#pragma once

#include "sysgram/features/ngram_extractor.hpp"
#include "sysgram/features/tfidf_vectorizer.hpp"
#include "sysgram/models/isolation_forest.hpp"

namespace sysgram {
namespace core {

/**
 * @brief Score a window given its n-gram counts
 * @throws ModelMismatchError if the counts, vocabulary and forest disagree
 */
double ScoreCounts(const features::TfidfVectorizer& vectorizer,
                   const models::IsolationForest& forest,
                   const features::NGramCounts& counts);

} // namespace core
} // namespace sysgram
