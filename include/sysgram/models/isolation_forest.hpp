/**
 * @file isolation_forest.hpp
 * @brief Isolation Forest anomaly scorer over sparse feature vectors
 *
 * An ensemble of random isolation trees. Each tree recursively splits a
 * random subsample of the training vectors on a random non-constant
 * dimension at a random value between the subset's minimum and maximum.
 * Points that are easy to isolate (short average path) are anomalous.
 *
 * **Score**:
 * ```
 * s(x) = 2 ^ ( -E[h(x)] / c(sample_size) )
 * c(n) = 2 H(n-1) - 2 (n-1) / n     (n > 1, else 0)
 * H(i) = ln(i) + 0.5772156649
 * ```
 * Scores lie in [0,1]; values near 1 are anomalous, values well below 0.5
 * are normal.
 *
 * **Range penalty**: each internal node remembers the range its training
 * points spanned on the split dimension, and each multi-point leaf the
 * bounding box of its points. A query outside those ranges stops at that
 * node instead of descending, so it is isolated at that depth.
 *
 * **Baseline**: the lowest score over the training vectors, kept with the
 * forest. Windows without any n-gram are given this score.
 *
 * Trees are flat node arrays, children are addressed by index.
 *
 * @date 2025
 */

#pragma once

#include "sysgram/features/tfidf_vectorizer.hpp"

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace sysgram {
namespace models {

using features::FeatureVector;

/**
 * @struct ForestParameters
 * @brief Build parameters of an isolation forest
 */
struct ForestParameters {
    std::size_t tree_count{100};   ///< Number of trees
    std::size_t sample_size{256};  ///< Vectors drawn per tree
    std::size_t max_depth{0};      ///< Depth limit (0 = ceil(log2(sample_size)))
    bool range_penalty{true};      ///< Stop queries outside training ranges

    /// max_depth, or ceil(log2(sample_size)) when 0
    std::size_t EffectiveMaxDepth() const;
};

/**
 * @struct BoxRange
 * @brief Extent of a leaf's training points on one dimension
 */
struct BoxRange {
    std::uint32_t feature{0};
    double lo{0.0};
    double hi{0.0};
};

/**
 * @struct TreeNode
 * @brief Node of an isolation tree
 *
 * Internal nodes: `feature`, `split`, training range `[lo, hi]`, children.
 * Leaves: `left == right == -1`, `size` training points and `path_length`
 * = depth + c(size). Leaves holding more than one point also keep the
 * sparse bounding box of those points (dimensions absent from the box are
 * 0 for every point).
 */
struct TreeNode {
    std::int32_t left{-1};       ///< Index of the `< split` child, -1 for leaves
    std::int32_t right{-1};      ///< Index of the `>= split` child, -1 for leaves
    std::uint32_t feature{0};    ///< Split dimension
    double split{0.0};           ///< Split value
    double lo{0.0};              ///< Training minimum on `feature`
    double hi{0.0};              ///< Training maximum on `feature`
    std::uint32_t depth{0};      ///< Edges from the root
    std::uint32_t size{0};       ///< Training points that reached the node
    double path_length{0.0};     ///< Leaf only: depth + c(size)
    std::vector<BoxRange> box;   ///< Leaf only: bounding box, ascending feature

    bool IsLeaf() const { return left < 0; }
};

/**
 * @struct IsolationTree
 * @brief Flat node array, node 0 is the root
 */
struct IsolationTree {
    std::vector<TreeNode> nodes;

    /**
     * @brief Path length of a query
     * @param vector Query (dimension already checked)
     * @param range_penalty Stop at nodes whose training range excludes the query
     */
    double PathLength(const FeatureVector& vector, bool range_penalty) const;
};

/**
 * @class IsolationForest
 * @brief Trained ensemble of isolation trees
 *
 * Training is deterministic for a given seed: the same vectors, parameters
 * and seed produce identical trees, bit for bit. A fitted forest is
 * immutable; Score() is const and safe to call concurrently.
 *
 * **Usage Example**:
 * @code
 * IsolationForest forest;
 * forest.Fit(training_vectors, ForestParameters{}, 42);
 *
 * double score = forest.Score(vectorizer.Transform(counts));
 * if (score > 0.6) {
 *     // anomalous window
 * }
 * @endcode
 */
class IsolationForest {
public:
    IsolationForest() = default;

    /**
     * @brief Build the forest
     *
     * With at least `sample_size` vectors each tree draws `sample_size` of
     * them without replacement; with fewer, it draws `sample_size` with
     * replacement. Normalization always uses c(sample_size).
     *
     * @param vectors Training vectors, all of the same dimension
     * @param params Build parameters
     * @param seed Seed of the tree-building generator
     * @throws core::ConfigurationError on empty input or invalid parameters
     * @throws core::ModelMismatchError if vector dimensions differ
     */
    void Fit(const std::vector<FeatureVector>& vectors,
             const ForestParameters& params,
             std::uint64_t seed);

    /**
     * @brief Anomaly score of a vector
     * @param vector Feature vector of the forest's dimension
     * @return Score in [0,1]
     * @throws core::ModelMismatchError if the dimension differs
     * @throws std::runtime_error if the forest is not fitted
     */
    double Score(const FeatureVector& vector) const;

    /// Score several vectors
    std::vector<double> ScoreBatch(const std::vector<FeatureVector>& vectors) const;

    /**
     * @brief Mean path length of a vector over all trees
     */
    double AveragePathLength(const FeatureVector& vector) const;

    /**
     * @brief Rebuild a fitted forest from persisted state
     * @throws core::ConfigurationError if the trees are malformed or the
     *         baseline is outside [0,1]
     */
    static IsolationForest FromState(std::size_t dimension,
                                     const ForestParameters& params,
                                     std::uint64_t seed,
                                     std::vector<IsolationTree> trees,
                                     double baseline_score);

    /**
     * @brief Average unsuccessful-search path length of a BST with n keys
     */
    static double AveragePathNormalizer(std::size_t n);

    bool IsFitted() const { return fitted_; }
    std::size_t Dimension() const { return dimension_; }
    std::uint64_t GetSeed() const { return seed_; }
    const ForestParameters& GetParameters() const { return params_; }
    double GetNormalization() const { return normalization_; }

    /// Lowest score of any training vector
    double GetBaselineScore() const { return baseline_score_; }
    const std::vector<IsolationTree>& GetTrees() const { return trees_; }

private:
    bool fitted_{false};
    std::size_t dimension_{0};
    std::uint64_t seed_{0};
    ForestParameters params_;
    double normalization_{0.0};   ///< c(sample_size)
    double baseline_score_{0.5};  ///< Minimum training score
    std::vector<IsolationTree> trees_;

    void CheckDimension(const FeatureVector& vector) const;
};

/**
 * @brief Uniform index in [0, n) from raw generator output
 *
 * Rejection sampling on the 64-bit output, so the sequence only depends on
 * the generator, not on the standard library's distributions.
 */
std::size_t UniformIndex(std::mt19937_64& rng, std::size_t n);

/**
 * @brief Uniform real in [lo, hi) from the top 53 bits of one draw
 */
double UniformReal(std::mt19937_64& rng, double lo, double hi);

} // namespace models
} // namespace sysgram
