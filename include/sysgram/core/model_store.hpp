/**
 * @file model_store.hpp
 * @brief Persistence of the trained vocabulary and isolation forest
 *
 * A model directory holds two versioned JSON artifacts:
 * - `vocabulary.json`: gram size, vocabulary in index order and the
 *   document frequency table
 * - `forest.json`: forest parameters, trees, the baseline score, and the
 *   SHA-256 digest of the vocabulary file it was trained against
 *
 * Loading refuses artifacts that do not belong together.
 *
 * @date 2025
 */

#pragma once

#include "sysgram/features/tfidf_vectorizer.hpp"
#include "sysgram/models/isolation_forest.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace sysgram {
namespace core {

/**
 * @struct ModelBundle
 * @brief Loaded artifacts, shared read-only
 */
struct ModelBundle {
    std::shared_ptr<const features::TfidfVectorizer> vectorizer;
    std::shared_ptr<const models::IsolationForest> forest;
    std::string vocabulary_sha256;   ///< Digest of vocabulary.json
};

/**
 * @class ModelStore
 * @brief Reads and writes a model directory
 *
 * **Usage Example**:
 * @code
 * ModelStore store("/var/lib/sysgram/model");
 * store.Save(*result.vectorizer, *result.forest);
 *
 * auto bundle = store.Load();
 * DetectionPipeline pipeline(config, bundle.vectorizer, bundle.forest);
 * @endcode
 */
class ModelStore {
public:
    static constexpr const char* kVocabularyFile = "vocabulary.json";
    static constexpr const char* kForestFile = "forest.json";
    static constexpr const char* kVocabularyFormat = "sysgram-vocabulary";
    static constexpr const char* kForestFormat = "sysgram-forest";
    static constexpr int kFormatVersion = 1;

    explicit ModelStore(std::filesystem::path directory);

    /**
     * @brief Write both artifacts, creating the directory if needed
     * @throws ModelMismatchError if the forest does not match the vocabulary
     * @throws std::runtime_error on I/O failure
     */
    void Save(const features::TfidfVectorizer& vectorizer,
              const models::IsolationForest& forest) const;

    /**
     * @brief Read and cross-check both artifacts
     * @throws ConfigurationError if a file is missing, unreadable or malformed
     * @throws ModelMismatchError on format, version, gram size, dimension
     *         or vocabulary digest mismatch
     */
    ModelBundle Load() const;

    /// Whether both artifact files exist
    bool Exists() const;

    const std::filesystem::path& GetDirectory() const { return directory_; }
    std::filesystem::path VocabularyPath() const { return directory_ / kVocabularyFile; }
    std::filesystem::path ForestPath() const { return directory_ / kForestFile; }

    /// vocabulary.json content for a fitted vectorizer
    static std::string SerializeVocabulary(const features::TfidfVectorizer& vectorizer);

    /// forest.json content, bound to a vocabulary digest
    static std::string SerializeForest(const models::IsolationForest& forest,
                                       std::size_t gram_size,
                                       const std::string& vocabulary_sha256);

private:
    std::filesystem::path directory_;
};

} // namespace core
} // namespace sysgram
