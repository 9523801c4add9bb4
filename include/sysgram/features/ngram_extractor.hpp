/**
 * @file ngram_extractor.hpp
 * @brief Contiguous syscall n-gram extraction
 *
 * Turns a window's syscall sequence into the multiset of its overlapping
 * subsequences of length N. A sequence of length L yields L-N+1 grams, or
 * none when L < N. Extraction is a pure function of the sequence.
 *
 * @date 2025
 */

#pragma once

#include "sysgram/core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sysgram {
namespace features {

/**
 * @struct NGram
 * @brief Ordered tuple of N syscall identifiers
 *
 * Equality and hashing are structural and order-sensitive:
 * (2,3,4) != (4,3,2).
 */
struct NGram {
    std::vector<core::SyscallId> ids;  ///< Syscall ids in call order

    bool operator==(const NGram& other) const { return ids == other.ids; }
    bool operator!=(const NGram& other) const { return ids != other.ids; }

    /// Human-readable form, e.g. "(2,3,4)"
    std::string ToString() const;
};

/**
 * @struct NGramHash
 * @brief Structural hash for NGram
 */
struct NGramHash {
    std::size_t operator()(const NGram& gram) const noexcept;
};

/**
 * @class NGramCounts
 * @brief Occurrence count of each n-gram within one window
 *
 * Entries are kept in order of first occurrence so that iteration, and
 * therefore vocabulary indices built from it, are deterministic.
 */
class NGramCounts {
public:
    using Entry = std::pair<NGram, std::uint32_t>;

    explicit NGramCounts(std::size_t gram_size = 0);

    /**
     * @brief Add occurrences of a gram
     * @param gram N-gram, its length must equal the gram size
     * @param count Occurrences to add
     */
    void Add(const NGram& gram, std::uint32_t count = 1);

    /// Occurrences of @p gram (0 if absent)
    std::uint32_t Count(const NGram& gram) const;

    /// Number of distinct grams
    std::size_t Distinct() const { return entries_.size(); }

    /// Sum of all counts
    std::uint64_t Total() const { return total_; }

    bool Empty() const { return entries_.empty(); }

    std::size_t GramSize() const { return gram_size_; }

    /// Grams with their counts, in first-occurrence order
    const std::vector<Entry>& Entries() const { return entries_; }

private:
    std::size_t gram_size_;
    std::vector<Entry> entries_;
    std::unordered_map<NGram, std::size_t, NGramHash> index_;
    std::uint64_t total_{0};
};

/**
 * @class NGramExtractor
 * @brief Stateless n-gram extractor with a fixed gram size
 *
 * **Usage Example**:
 * @code
 * NGramExtractor extractor(3);
 * auto counts = extractor.Extract(std::vector<core::SyscallId>{2, 3, 4, 2, 3});
 * // counts: (2,3,4) x1, (3,4,2) x1, (4,2,3) x1
 * @endcode
 */
class NGramExtractor {
public:
    /**
     * @brief Construct extractor
     * @param gram_size N, must be positive
     * @throws core::ConfigurationError if gram_size is 0
     */
    explicit NGramExtractor(std::size_t gram_size);

    /**
     * @brief Extract n-gram counts of a window
     * @param window Sealed window
     * @return Counts summing to max(0, L-N+1)
     */
    NGramCounts Extract(const core::Window& window) const;

    /**
     * @brief Extract n-gram counts of a raw sequence
     */
    NGramCounts Extract(const std::vector<core::SyscallId>& sequence) const;

    std::size_t GetGramSize() const { return gram_size_; }

private:
    std::size_t gram_size_;
};

} // namespace features
} // namespace sysgram
