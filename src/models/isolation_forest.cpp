/**
 * @file isolation_forest.cpp
 * @brief Implementation of isolation tree construction and scoring
 *
 * @date 2025
 */

#include "sysgram/models/isolation_forest.hpp"
#include "sysgram/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>

namespace sysgram {
namespace models {

namespace {

constexpr double kEulerGamma = 0.5772156649;

/**
 * @brief Builds one isolation tree from a subsample
 */
class TreeBuilder {
public:
    TreeBuilder(const std::vector<FeatureVector>& data, std::size_t max_depth, std::mt19937_64& rng)
        : data_(data)
        , max_depth_(max_depth)
        , rng_(rng) {}

    IsolationTree Build(std::vector<std::uint32_t> sample) {
        sample_ = std::move(sample);
        tree_.nodes.clear();
        tree_.nodes.reserve(2 * sample_.size());
        BuildNode(0, sample_.size(), 0);
        return std::move(tree_);
    }

private:
    struct Extent {
        double lo{std::numeric_limits<double>::max()};
        double hi{std::numeric_limits<double>::lowest()};
        std::size_t nonzero{0};
    };

    const std::vector<FeatureVector>& data_;
    std::size_t max_depth_;
    std::mt19937_64& rng_;
    std::vector<std::uint32_t> sample_;
    IsolationTree tree_;

    // Per-dimension range of sample_[begin, end), absent entries count as 0.
    // Dimensions where every point is 0 are left out.
    std::map<std::uint32_t, Extent> Extents(std::size_t begin, std::size_t end) const {
        std::map<std::uint32_t, Extent> extents;
        for (std::size_t i = begin; i < end; ++i) {
            for (const auto& [feature, weight] : data_[sample_[i]].entries) {
                auto& extent = extents[feature];
                extent.lo = std::min(extent.lo, weight);
                extent.hi = std::max(extent.hi, weight);
                extent.nonzero++;
            }
        }

        const std::size_t count = end - begin;
        for (auto& [feature, extent] : extents) {
            if (extent.nonzero < count) {
                extent.lo = std::min(extent.lo, 0.0);
                extent.hi = std::max(extent.hi, 0.0);
            }
        }
        return extents;
    }

    std::int32_t MakeLeaf(std::size_t begin, std::size_t end, std::uint32_t depth,
                          const std::map<std::uint32_t, Extent>& extents) {
        auto index = static_cast<std::int32_t>(tree_.nodes.size());
        TreeNode leaf;
        leaf.depth = depth;
        leaf.size = static_cast<std::uint32_t>(end - begin);
        leaf.path_length = static_cast<double>(depth) + IsolationForest::AveragePathNormalizer(leaf.size);

        if (leaf.size > 1) {
            leaf.box.reserve(extents.size());
            for (const auto& [feature, extent] : extents) {
                leaf.box.push_back(BoxRange{feature, extent.lo, extent.hi});
            }
        }

        tree_.nodes.push_back(std::move(leaf));
        return index;
    }

    std::int32_t BuildNode(std::size_t begin, std::size_t end, std::uint32_t depth) {
        const std::size_t count = end - begin;

        if (count <= 1) {
            return MakeLeaf(begin, end, depth, {});
        }

        auto extents = Extents(begin, end);
        if (depth >= max_depth_) {
            return MakeLeaf(begin, end, depth, extents);
        }

        std::vector<std::uint32_t> candidates;
        for (const auto& [feature, extent] : extents) {
            if (extent.hi > extent.lo) {
                candidates.push_back(feature);
            }
        }

        // Every point identical: nothing left to isolate
        if (candidates.empty()) {
            return MakeLeaf(begin, end, depth, extents);
        }

        const std::uint32_t feature = candidates[UniformIndex(rng_, candidates.size())];
        const Extent& extent = extents.at(feature);

        // lo < split <= hi keeps both children non-empty
        double split = UniformReal(rng_, extent.lo, extent.hi);
        if (!(split > extent.lo && split <= extent.hi)) {
            split = extent.hi;
        }

        auto first = sample_.begin() + static_cast<std::ptrdiff_t>(begin);
        auto last = sample_.begin() + static_cast<std::ptrdiff_t>(end);
        auto middle = std::partition(first, last, [&](std::uint32_t point) {
            return data_[point].Get(feature) < split;
        });
        const auto mid = static_cast<std::size_t>(middle - sample_.begin());

        auto index = static_cast<std::int32_t>(tree_.nodes.size());
        TreeNode node;
        node.feature = feature;
        node.split = split;
        node.lo = extent.lo;
        node.hi = extent.hi;
        node.depth = depth;
        node.size = static_cast<std::uint32_t>(count);
        tree_.nodes.push_back(std::move(node));

        // Children may reallocate the node array; store indices afterwards
        std::int32_t left = BuildNode(begin, mid, depth + 1);
        std::int32_t right = BuildNode(mid, end, depth + 1);
        tree_.nodes[index].left = left;
        tree_.nodes[index].right = right;
        return index;
    }
};

bool OutsideBox(const std::vector<BoxRange>& box, const FeatureVector& vector) {
    std::size_t i = 0;
    std::size_t j = 0;
    const auto& entries = vector.entries;

    while (i < box.size() || j < entries.size()) {
        if (j == entries.size() || (i < box.size() && box[i].feature < entries[j].first)) {
            // Query is 0 on this dimension
            if (box[i].lo > 0.0 || box[i].hi < 0.0) {
                return true;
            }
            ++i;
        }
        else if (i == box.size() || entries[j].first < box[i].feature) {
            // Every training point in the leaf is 0 here
            if (entries[j].second != 0.0) {
                return true;
            }
            ++j;
        }
        else {
            const double value = entries[j].second;
            if (value < box[i].lo || value > box[i].hi) {
                return true;
            }
            ++i;
            ++j;
        }
    }
    return false;
}

} // anonymous namespace

std::size_t ForestParameters::EffectiveMaxDepth() const {
    if (max_depth > 0) {
        return max_depth;
    }

    std::size_t depth = 0;
    while ((std::size_t{1} << depth) < sample_size) {
        depth++;
    }
    return depth;
}

std::size_t UniformIndex(std::mt19937_64& rng, std::size_t n) {
    if (n <= 1) {
        return 0;
    }

    const std::uint64_t bound = static_cast<std::uint64_t>(n);
    const std::uint64_t limit = std::numeric_limits<std::uint64_t>::max() -
                                std::numeric_limits<std::uint64_t>::max() % bound;
    std::uint64_t value = rng();
    while (value >= limit) {
        value = rng();
    }
    return static_cast<std::size_t>(value % bound);
}

double UniformReal(std::mt19937_64& rng, double lo, double hi) {
    const double unit = static_cast<double>(rng() >> 11) * 0x1.0p-53;
    return lo + (hi - lo) * unit;
}

double IsolationTree::PathLength(const FeatureVector& vector, bool range_penalty) const {
    std::size_t index = 0;
    while (true) {
        const TreeNode& node = nodes[index];

        if (node.IsLeaf()) {
            if (range_penalty && node.size > 1 && OutsideBox(node.box, vector)) {
                return static_cast<double>(node.depth);
            }
            return node.path_length;
        }

        const double value = vector.Get(node.feature);
        if (range_penalty && (value < node.lo || value > node.hi)) {
            return static_cast<double>(node.depth);
        }

        index = static_cast<std::size_t>(value < node.split ? node.left : node.right);
    }
}

double IsolationForest::AveragePathNormalizer(std::size_t n) {
    if (n <= 1) {
        return 0.0;
    }

    const double harmonic = std::log(static_cast<double>(n - 1)) + kEulerGamma;
    return 2.0 * harmonic - 2.0 * static_cast<double>(n - 1) / static_cast<double>(n);
}

void IsolationForest::Fit(const std::vector<FeatureVector>& vectors,
                          const ForestParameters& params,
                          std::uint64_t seed) {
    if (vectors.empty()) {
        throw core::ConfigurationError("cannot fit isolation forest on zero vectors");
    }
    if (params.tree_count == 0) {
        throw core::ConfigurationError("tree_count must be positive");
    }
    if (params.sample_size == 0) {
        throw core::ConfigurationError("sample_size must be positive");
    }

    const std::size_t dimension = vectors.front().dimension;
    for (std::size_t i = 1; i < vectors.size(); ++i) {
        if (vectors[i].dimension != dimension) {
            throw core::ModelMismatchError("training vector " + std::to_string(i) +
                                           " has dimension " + std::to_string(vectors[i].dimension) +
                                           ", expected " + std::to_string(dimension));
        }
    }

    const std::size_t n = vectors.size();
    const std::size_t sample_size = params.sample_size;
    const std::size_t max_depth = params.EffectiveMaxDepth();

    spdlog::info("Building isolation forest: {} trees, {} samples/tree, depth limit {}",
                 params.tree_count, sample_size, max_depth);
    if (n < sample_size) {
        spdlog::debug("Only {} training vectors, sampling {} per tree with replacement",
                      n, sample_size);
    }

    std::mt19937_64 rng(seed);
    TreeBuilder builder(vectors, max_depth, rng);

    std::vector<IsolationTree> trees;
    trees.reserve(params.tree_count);

    std::vector<std::uint32_t> permutation(n);
    for (std::size_t t = 0; t < params.tree_count; ++t) {
        std::vector<std::uint32_t> sample;
        sample.reserve(sample_size);

        if (n >= sample_size) {
            // Partial Fisher-Yates over a fresh identity permutation
            std::iota(permutation.begin(), permutation.end(), 0u);
            for (std::size_t i = 0; i < sample_size; ++i) {
                std::size_t j = i + UniformIndex(rng, n - i);
                std::swap(permutation[i], permutation[j]);
                sample.push_back(permutation[i]);
            }
        }
        else {
            for (std::size_t i = 0; i < sample_size; ++i) {
                sample.push_back(static_cast<std::uint32_t>(UniformIndex(rng, n)));
            }
        }

        trees.push_back(builder.Build(std::move(sample)));
    }

    trees_ = std::move(trees);
    dimension_ = dimension;
    seed_ = seed;
    params_ = params;
    normalization_ = AveragePathNormalizer(sample_size);
    fitted_ = true;

    auto scores = ScoreBatch(vectors);
    baseline_score_ = *std::min_element(scores.begin(), scores.end());

    std::size_t total_nodes = 0;
    for (const auto& tree : trees_) {
        total_nodes += tree.nodes.size();
    }
    spdlog::info("✓ Isolation forest built ({} nodes, dimension {})", total_nodes, dimension_);
    spdlog::debug("Baseline score: {:.4f}", baseline_score_);
}

double IsolationForest::Score(const FeatureVector& vector) const {
    const double average = AveragePathLength(vector);
    if (normalization_ <= 0.0) {
        return 0.5;
    }
    return std::pow(2.0, -average / normalization_);
}

std::vector<double> IsolationForest::ScoreBatch(const std::vector<FeatureVector>& vectors) const {
    std::vector<double> scores;
    scores.reserve(vectors.size());
    for (const auto& vector : vectors) {
        scores.push_back(Score(vector));
    }
    return scores;
}

double IsolationForest::AveragePathLength(const FeatureVector& vector) const {
    if (!fitted_) {
        throw std::runtime_error("isolation forest used before fitting");
    }
    CheckDimension(vector);

    double total = 0.0;
    for (const auto& tree : trees_) {
        total += tree.PathLength(vector, params_.range_penalty);
    }
    return total / static_cast<double>(trees_.size());
}

IsolationForest IsolationForest::FromState(std::size_t dimension,
                                           const ForestParameters& params,
                                           std::uint64_t seed,
                                           std::vector<IsolationTree> trees,
                                           double baseline_score) {
    if (params.sample_size == 0) {
        throw core::ConfigurationError("forest sample_size must be positive");
    }
    if (!(baseline_score >= 0.0 && baseline_score <= 1.0)) {
        throw core::ConfigurationError("forest baseline score " + std::to_string(baseline_score) +
                                       " outside [0,1]");
    }
    if (trees.empty() || trees.size() != params.tree_count) {
        throw core::ConfigurationError("forest declares " + std::to_string(params.tree_count) +
                                       " trees but holds " + std::to_string(trees.size()));
    }

    for (std::size_t t = 0; t < trees.size(); ++t) {
        const auto& nodes = trees[t].nodes;
        if (nodes.empty()) {
            throw core::ConfigurationError("tree " + std::to_string(t) + " has no nodes");
        }

        for (std::size_t i = 0; i < nodes.size(); ++i) {
            const auto& node = nodes[i];
            const auto self = static_cast<std::int32_t>(i);
            const auto count = static_cast<std::int32_t>(nodes.size());

            if (node.IsLeaf()) {
                if (node.right >= 0) {
                    throw core::ConfigurationError("tree " + std::to_string(t) +
                                                   " has a half-linked node " + std::to_string(i));
                }
                for (const auto& range : node.box) {
                    if (range.feature >= dimension) {
                        throw core::ConfigurationError("tree " + std::to_string(t) +
                                                       " references feature " +
                                                       std::to_string(range.feature) +
                                                       " beyond dimension " + std::to_string(dimension));
                    }
                }
                continue;
            }

            // Children always follow their parent, which also rules out cycles
            if (node.left <= self || node.left >= count || node.right <= self || node.right >= count) {
                throw core::ConfigurationError("tree " + std::to_string(t) +
                                               " has invalid children at node " + std::to_string(i));
            }
            if (node.feature >= dimension) {
                throw core::ConfigurationError("tree " + std::to_string(t) + " splits on feature " +
                                               std::to_string(node.feature) +
                                               " beyond dimension " + std::to_string(dimension));
            }
        }
    }

    IsolationForest forest;
    forest.trees_ = std::move(trees);
    forest.dimension_ = dimension;
    forest.seed_ = seed;
    forest.params_ = params;
    forest.normalization_ = AveragePathNormalizer(params.sample_size);
    forest.baseline_score_ = baseline_score;
    forest.fitted_ = true;
    return forest;
}

void IsolationForest::CheckDimension(const FeatureVector& vector) const {
    if (vector.dimension != dimension_) {
        throw core::ModelMismatchError("feature vector has dimension " +
                                       std::to_string(vector.dimension) +
                                       ", forest was trained on " + std::to_string(dimension_));
    }
}

} // namespace models
} // namespace sysgram
