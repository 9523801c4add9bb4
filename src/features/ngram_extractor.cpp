/**
 * @file ngram_extractor.cpp
 * @brief Implementation of syscall n-gram extraction
 *
 * @date 2025
 */

#include "sysgram/features/ngram_extractor.hpp"
#include "sysgram/core/errors.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <string>

namespace sysgram {
namespace features {

std::string NGram::ToString() const {
    std::ostringstream oss;
    oss << "(";
    for (std::size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) {
            oss << ",";
        }
        oss << ids[i];
    }
    oss << ")";
    return oss.str();
}

std::size_t NGramHash::operator()(const NGram& gram) const noexcept {
    // boost::hash_combine mixing over the ids
    std::size_t seed = gram.ids.size();
    for (auto id : gram.ids) {
        seed ^= static_cast<std::size_t>(id) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    }
    return seed;
}

NGramCounts::NGramCounts(std::size_t gram_size)
    : gram_size_(gram_size) {
}

void NGramCounts::Add(const NGram& gram, std::uint32_t count) {
    if (gram.ids.size() != gram_size_) {
        throw std::invalid_argument("n-gram length " + std::to_string(gram.ids.size()) +
                                    " does not match gram size " + std::to_string(gram_size_));
    }
    if (count == 0) {
        return;
    }

    auto it = index_.find(gram);
    if (it == index_.end()) {
        index_.emplace(gram, entries_.size());
        entries_.emplace_back(gram, count);
    } else {
        entries_[it->second].second += count;
    }
    total_ += count;
}

std::uint32_t NGramCounts::Count(const NGram& gram) const {
    auto it = index_.find(gram);
    return it == index_.end() ? 0 : entries_[it->second].second;
}

NGramExtractor::NGramExtractor(std::size_t gram_size)
    : gram_size_(gram_size) {
    if (gram_size_ == 0) {
        throw core::ConfigurationError("gram size must be positive");
    }
}

NGramCounts NGramExtractor::Extract(const core::Window& window) const {
    return Extract(window.syscalls);
}

NGramCounts NGramExtractor::Extract(const std::vector<core::SyscallId>& sequence) const {
    NGramCounts counts(gram_size_);

    if (sequence.size() < gram_size_) {
        return counts;
    }

    NGram gram;
    gram.ids.resize(gram_size_);
    for (std::size_t start = 0; start + gram_size_ <= sequence.size(); ++start) {
        std::copy(sequence.begin() + start, sequence.begin() + start + gram_size_, gram.ids.begin());
        counts.Add(gram);
    }

    return counts;
}

} // namespace features
} // namespace sysgram
