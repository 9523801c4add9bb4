/**
 * @file tfidf_vectorizer.cpp
 * @brief Implementation of TF-IDF vocabulary fitting and weighting
 *
 * @date 2025
 */

#include "sysgram/features/tfidf_vectorizer.hpp"
#include "sysgram/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace sysgram {
namespace features {

double FeatureVector::Get(std::uint32_t index) const {
    auto it = std::lower_bound(entries.begin(), entries.end(), index,
        [](const Entry& entry, std::uint32_t value) { return entry.first < value; });
    if (it != entries.end() && it->first == index) {
        return it->second;
    }
    return 0.0;
}

double FeatureVector::Norm() const {
    double sum = 0.0;
    for (const auto& [index, weight] : entries) {
        sum += weight * weight;
    }
    return std::sqrt(sum);
}

Vocabulary::Vocabulary(std::size_t gram_size)
    : gram_size_(gram_size) {
}

std::uint32_t Vocabulary::Add(const NGram& gram) {
    auto it = index_.find(gram);
    if (it != index_.end()) {
        return it->second;
    }

    auto index = static_cast<std::uint32_t>(grams_.size());
    grams_.push_back(gram);
    index_.emplace(gram, index);
    return index;
}

std::optional<std::uint32_t> Vocabulary::Find(const NGram& gram) const {
    auto it = index_.find(gram);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

TfidfVectorizer::TfidfVectorizer(std::size_t gram_size)
    : gram_size_(gram_size)
    , vocabulary_(gram_size) {
    if (gram_size_ == 0) {
        throw core::ConfigurationError("gram size must be positive");
    }
}

void TfidfVectorizer::Fit(const std::vector<NGramCounts>& windows) {
    if (windows.empty()) {
        throw core::ConfigurationError("cannot fit vocabulary on zero training windows");
    }

    Vocabulary vocabulary(gram_size_);
    std::vector<std::uint64_t> document_frequency;

    for (const auto& counts : windows) {
        if (counts.GramSize() != gram_size_ && !counts.Empty()) {
            throw core::ModelMismatchError("training counts use gram size " +
                                           std::to_string(counts.GramSize()) +
                                           ", vectorizer expects " + std::to_string(gram_size_));
        }

        // Entries are distinct, so each gram counts once per window
        for (const auto& [gram, count] : counts.Entries()) {
            auto index = vocabulary.Add(gram);
            if (index >= document_frequency.size()) {
                document_frequency.resize(index + 1, 0);
            }
            document_frequency[index]++;
        }
    }

    vocabulary_ = std::move(vocabulary);
    document_frequency_ = std::move(document_frequency);
    training_windows_ = windows.size();
    ComputeIdf();
    fitted_ = true;

    spdlog::info("Vocabulary fitted: {} distinct {}-grams over {} windows",
                 vocabulary_.Size(), gram_size_, training_windows_);
}

FeatureVector TfidfVectorizer::Transform(const NGramCounts& counts) const {
    if (!fitted_) {
        throw std::runtime_error("TF-IDF vectorizer used before fitting");
    }
    if (counts.GramSize() != gram_size_ && !counts.Empty()) {
        throw core::ModelMismatchError("window counts use gram size " +
                                       std::to_string(counts.GramSize()) +
                                       ", vocabulary expects " + std::to_string(gram_size_));
    }

    FeatureVector vector;
    vector.dimension = vocabulary_.Size();

    const auto total = counts.Total();
    if (total == 0) {
        return vector;
    }

    for (const auto& [gram, count] : counts.Entries()) {
        auto index = vocabulary_.Find(gram);
        if (!index) {
            continue;
        }
        double tf = static_cast<double>(count) / static_cast<double>(total);
        vector.entries.emplace_back(*index, tf * idf_[*index]);
    }

    std::sort(vector.entries.begin(), vector.entries.end(),
              [](const FeatureVector::Entry& a, const FeatureVector::Entry& b) {
                  return a.first < b.first;
              });

    double norm = vector.Norm();
    if (norm > 0.0) {
        for (auto& entry : vector.entries) {
            entry.second /= norm;
        }
    }

    return vector;
}

std::vector<FeatureVector> TfidfVectorizer::TransformBatch(const std::vector<NGramCounts>& windows) const {
    std::vector<FeatureVector> vectors;
    vectors.reserve(windows.size());
    for (const auto& counts : windows) {
        vectors.push_back(Transform(counts));
    }
    return vectors;
}

TfidfVectorizer TfidfVectorizer::FromState(std::size_t gram_size,
                                           std::vector<NGram> grams,
                                           std::vector<std::uint64_t> document_frequency,
                                           std::uint64_t training_windows) {
    TfidfVectorizer vectorizer(gram_size);

    if (training_windows == 0) {
        throw core::ConfigurationError("vocabulary state has zero training windows");
    }
    if (grams.size() != document_frequency.size()) {
        throw core::ConfigurationError("vocabulary holds " + std::to_string(grams.size()) +
                                       " grams but " + std::to_string(document_frequency.size()) +
                                       " document frequencies");
    }

    Vocabulary vocabulary(gram_size);
    for (std::size_t i = 0; i < grams.size(); ++i) {
        if (grams[i].ids.size() != gram_size) {
            throw core::ConfigurationError("vocabulary entry " + std::to_string(i) +
                                           " is not a " + std::to_string(gram_size) + "-gram");
        }
        if (document_frequency[i] == 0 || document_frequency[i] > training_windows) {
            throw core::ConfigurationError("document frequency of entry " + std::to_string(i) +
                                           " is out of range");
        }
        if (vocabulary.Add(grams[i]) != i) {
            throw core::ConfigurationError("duplicate vocabulary entry " + grams[i].ToString());
        }
    }

    vectorizer.vocabulary_ = std::move(vocabulary);
    vectorizer.document_frequency_ = std::move(document_frequency);
    vectorizer.training_windows_ = training_windows;
    vectorizer.ComputeIdf();
    vectorizer.fitted_ = true;
    return vectorizer;
}

void TfidfVectorizer::ComputeIdf() {
    idf_.assign(document_frequency_.size(), 0.0);
    const double windows = static_cast<double>(training_windows_);
    for (std::size_t i = 0; i < document_frequency_.size(); ++i) {
        const double df = static_cast<double>(document_frequency_[i]);
        idf_[i] = std::log((1.0 + windows) / (1.0 + df)) + 1.0;
    }
}

} // namespace features
} // namespace sysgram
