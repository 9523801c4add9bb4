/**
 * @file tfidf_vectorizer.hpp
 * @brief TF-IDF weighting of window n-gram counts
 *
 * Fitting builds a closed vocabulary of n-grams (indexed in first-seen
 * order) and the document frequency of each gram over the training windows.
 * Transforming maps one window's counts to a sparse, L2-normalized feature
 * vector over that vocabulary.
 *
 * **Weighting**:
 * - tf(g)  = count(g) / total grams in the window (0 for an empty window)
 * - idf(g) = ln((1 + n_windows) / (1 + df(g))) + 1
 * - w(g)   = tf(g) * idf(g), then the vector is scaled to unit norm
 *
 * Grams absent from the vocabulary carry no weight, so a window made only of
 * unseen grams maps to the zero vector.
 *
 * @date 2025
 */

#pragma once

#include "sysgram/features/ngram_extractor.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sysgram {
namespace features {

/**
 * @struct FeatureVector
 * @brief Sparse non-negative vector over the vocabulary
 *
 * Entries are sorted by index, each index appears at most once and weights
 * are strictly positive. Missing indices are 0.
 */
struct FeatureVector {
    using Entry = std::pair<std::uint32_t, double>;

    std::size_t dimension{0};     ///< Vocabulary size the vector is expressed in
    std::vector<Entry> entries;   ///< (index, weight), ascending index

    /// Weight at @p index (0 if absent)
    double Get(std::uint32_t index) const;

    /// Euclidean norm
    double Norm() const;

    bool IsZero() const { return entries.empty(); }
};

/**
 * @class Vocabulary
 * @brief Dense arena of n-grams with a hash index
 *
 * Indices are stable: a gram keeps the index it received when first added.
 */
class Vocabulary {
public:
    explicit Vocabulary(std::size_t gram_size = 0);

    /**
     * @brief Add a gram if absent
     * @return Index of the gram
     */
    std::uint32_t Add(const NGram& gram);

    /// Index of @p gram, if known
    std::optional<std::uint32_t> Find(const NGram& gram) const;

    const NGram& At(std::uint32_t index) const { return grams_.at(index); }

    std::size_t Size() const { return grams_.size(); }
    std::size_t GramSize() const { return gram_size_; }
    const std::vector<NGram>& Grams() const { return grams_; }

private:
    std::size_t gram_size_;
    std::vector<NGram> grams_;
    std::unordered_map<NGram, std::uint32_t, NGramHash> index_;
};

/**
 * @class TfidfVectorizer
 * @brief Fitted vocabulary + document frequency table
 *
 * Immutable once fitted; Transform() is const and may be called from any
 * thread.
 *
 * **Usage Example**:
 * @code
 * NGramExtractor extractor(3);
 * std::vector<NGramCounts> corpus = {...};
 *
 * TfidfVectorizer vectorizer(3);
 * vectorizer.Fit(corpus);
 *
 * auto vector = vectorizer.Transform(extractor.Extract(window));
 * @endcode
 */
class TfidfVectorizer {
public:
    /**
     * @brief Construct an unfitted vectorizer
     * @param gram_size N the vocabulary is built for
     * @throws core::ConfigurationError if gram_size is 0
     */
    explicit TfidfVectorizer(std::size_t gram_size);

    /**
     * @brief Build vocabulary and document frequencies
     *
     * Replaces any previous fit.
     *
     * @param windows Training windows' n-gram counts
     * @throws core::ConfigurationError if @p windows is empty
     * @throws core::ModelMismatchError if counts use another gram size
     */
    void Fit(const std::vector<NGramCounts>& windows);

    /**
     * @brief Weight a window's counts
     * @param counts N-gram counts of one window
     * @return L2-normalized vector (or the zero vector)
     * @throws core::ModelMismatchError if counts use another gram size
     * @throws std::runtime_error if the vectorizer is not fitted
     */
    FeatureVector Transform(const NGramCounts& counts) const;

    /// Transform every window of a batch
    std::vector<FeatureVector> TransformBatch(const std::vector<NGramCounts>& windows) const;

    /**
     * @brief Rebuild a fitted vectorizer from persisted state
     * @param gram_size N
     * @param grams Vocabulary in index order
     * @param document_frequency Windows containing each gram
     * @param training_windows Number of training windows
     * @throws core::ConfigurationError if the state is inconsistent
     */
    static TfidfVectorizer FromState(std::size_t gram_size,
                                     std::vector<NGram> grams,
                                     std::vector<std::uint64_t> document_frequency,
                                     std::uint64_t training_windows);

    bool IsFitted() const { return fitted_; }

    /// Feature dimension (vocabulary size)
    std::size_t Dimension() const { return vocabulary_.Size(); }

    std::size_t GetGramSize() const { return gram_size_; }
    const Vocabulary& GetVocabulary() const { return vocabulary_; }
    const std::vector<std::uint64_t>& GetDocumentFrequency() const { return document_frequency_; }
    std::uint64_t GetTrainingWindows() const { return training_windows_; }

    /// Inverse document frequency of vocabulary entry @p index
    double Idf(std::uint32_t index) const { return idf_.at(index); }

private:
    std::size_t gram_size_;
    bool fitted_{false};
    Vocabulary vocabulary_;
    std::vector<std::uint64_t> document_frequency_;
    std::uint64_t training_windows_{0};
    std::vector<double> idf_;

    void ComputeIdf();
};

} // namespace features
} // namespace sysgram
