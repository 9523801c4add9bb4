/**
 * @file model_store.cpp
 * @brief Implementation of model artifact persistence
 *
 * **vocabulary.json**:
 * ```json
 * {
 *   "format": "sysgram-vocabulary", "version": 1,
 *   "gram_size": 3, "idf_smoothing": 1, "training_windows": 1800,
 *   "grams": [[2,3,4], [3,4,2]],
 *   "document_frequency": [1200, 1180]
 * }
 * ```
 *
 * **forest.json** (tree nodes):
 * ```json
 * {"d": 0, "n": 256, "f": 17, "s": 0.31, "lo": 0.0, "hi": 0.72, "l": 1, "r": 6}
 * {"d": 3, "n": 4, "p": 4.85, "box": [[17, 0.33, 0.41]]}
 * ```
 * Internal nodes carry split feature, value, training range and children;
 * leaves carry size, path length and the bounding box of their points.
 *
 * @date 2025
 */

#include "sysgram/core/model_store.hpp"
#include "sysgram/core/errors.hpp"
#include "sysgram/utils/hash_utils.hpp"
#include "sysgram/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace sysgram {
namespace core {

namespace {

std::string ReadArtifact(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw ConfigurationError("model artifact not found: " + path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw ConfigurationError("cannot open model artifact: " + path.string());
    }

    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

void WriteArtifact(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open " + path.string() + " for writing");
    }
    file << content;
    file.flush();
    if (!file.good()) {
        throw std::runtime_error("Failed to write " + path.string());
    }
}

json ParseArtifact(const std::string& text, const std::filesystem::path& path) {
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            throw ConfigurationError("model artifact is not a JSON object: " + path.string());
        }
        return j;
    }
    catch (const json::parse_error& e) {
        throw ConfigurationError("cannot parse model artifact " + path.string() + ": " + e.what());
    }
}

void CheckHeader(const json& j, const char* format, const std::filesystem::path& path) {
    std::string found_format;
    int version = 0;
    try {
        found_format = j.value("format", std::string());
        version = j.value("version", 0);
    }
    catch (const json::exception& e) {
        throw ConfigurationError("malformed header in " + path.string() + ": " + e.what());
    }

    if (found_format != format) {
        throw ModelMismatchError(path.string() + " has format '" + found_format +
                                 "', expected '" + format + "'");
    }

    if (version != ModelStore::kFormatVersion) {
        throw ModelMismatchError(path.string() + " has version " + std::to_string(version) +
                                 ", this build reads version " +
                                 std::to_string(ModelStore::kFormatVersion));
    }
}

json NodeToJson(const models::TreeNode& node) {
    json j = {{"d", node.depth}, {"n", node.size}};

    if (node.IsLeaf()) {
        j["p"] = node.path_length;
        if (!node.box.empty()) {
            json box = json::array();
            for (const auto& range : node.box) {
                box.push_back({range.feature, range.lo, range.hi});
            }
            j["box"] = std::move(box);
        }
    } else {
        j["f"] = node.feature;
        j["s"] = node.split;
        j["lo"] = node.lo;
        j["hi"] = node.hi;
        j["l"] = node.left;
        j["r"] = node.right;
    }
    return j;
}

models::TreeNode NodeFromJson(const json& j) {
    models::TreeNode node;
    node.depth = j.at("d").get<std::uint32_t>();
    node.size = j.at("n").get<std::uint32_t>();

    if (j.contains("l")) {
        node.feature = j.at("f").get<std::uint32_t>();
        node.split = j.at("s").get<double>();
        node.lo = j.at("lo").get<double>();
        node.hi = j.at("hi").get<double>();
        node.left = j.at("l").get<std::int32_t>();
        node.right = j.at("r").get<std::int32_t>();
    } else {
        node.path_length = j.at("p").get<double>();
        if (j.contains("box")) {
            for (const auto& range : j.at("box")) {
                node.box.push_back(models::BoxRange{range.at(0).get<std::uint32_t>(),
                                                    range.at(1).get<double>(),
                                                    range.at(2).get<double>()});
            }
        }
    }
    return node;
}

} // anonymous namespace

ModelStore::ModelStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {
}

bool ModelStore::Exists() const {
    return std::filesystem::exists(VocabularyPath()) && std::filesystem::exists(ForestPath());
}

std::string ModelStore::SerializeVocabulary(const features::TfidfVectorizer& vectorizer) {
    if (!vectorizer.IsFitted()) {
        throw std::runtime_error("cannot save an unfitted vocabulary");
    }

    json grams = json::array();
    for (const auto& gram : vectorizer.GetVocabulary().Grams()) {
        grams.push_back(gram.ids);
    }

    json j = {
        {"format", kVocabularyFormat},
        {"version", kFormatVersion},
        {"gram_size", vectorizer.GetGramSize()},
        {"idf_smoothing", 1},
        {"training_windows", vectorizer.GetTrainingWindows()},
        {"grams", std::move(grams)},
        {"document_frequency", vectorizer.GetDocumentFrequency()}
    };
    return j.dump();
}

std::string ModelStore::SerializeForest(const models::IsolationForest& forest,
                                        std::size_t gram_size,
                                        const std::string& vocabulary_sha256) {
    if (!forest.IsFitted()) {
        throw std::runtime_error("cannot save an unfitted forest");
    }

    const auto& params = forest.GetParameters();

    json trees = json::array();
    for (const auto& tree : forest.GetTrees()) {
        json nodes = json::array();
        for (const auto& node : tree.nodes) {
            nodes.push_back(NodeToJson(node));
        }
        trees.push_back(std::move(nodes));
    }

    json j = {
        {"format", kForestFormat},
        {"version", kFormatVersion},
        {"gram_size", gram_size},
        {"dimension", forest.Dimension()},
        {"tree_count", params.tree_count},
        {"sample_size", params.sample_size},
        {"max_depth", params.max_depth},
        {"seed", forest.GetSeed()},
        {"range_penalty", params.range_penalty},
        {"normalization", forest.GetNormalization()},
        {"baseline_score", forest.GetBaselineScore()},
        {"vocabulary_sha256", vocabulary_sha256},
        {"trees", std::move(trees)}
    };
    return j.dump();
}

void ModelStore::Save(const features::TfidfVectorizer& vectorizer,
                      const models::IsolationForest& forest) const {
    if (forest.Dimension() != vectorizer.Dimension()) {
        throw ModelMismatchError("forest dimension " + std::to_string(forest.Dimension()) +
                                 " differs from vocabulary size " +
                                 std::to_string(vectorizer.Dimension()));
    }

    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw std::runtime_error("Failed to create model directory " + directory_.string() +
                                 ": " + ec.message());
    }

    const std::string vocabulary = SerializeVocabulary(vectorizer);
    const std::string digest = utils::HashUtils::ComputeSHA256(vocabulary);
    WriteArtifact(VocabularyPath(), vocabulary);
    WriteArtifact(ForestPath(), SerializeForest(forest, vectorizer.GetGramSize(), digest));

    spdlog::info("✓ Model saved to {}", directory_.string());
    spdlog::debug("  Vocabulary: {} grams, SHA256 {}", vectorizer.Dimension(), digest);
    spdlog::debug("  Forest: {} trees", forest.GetTrees().size());
}

ModelBundle ModelStore::Load() const {
    spdlog::info("Loading model from {}", directory_.string());

    // Vocabulary
    const auto vocabulary_path = VocabularyPath();
    const std::string vocabulary_text = ReadArtifact(vocabulary_path);
    const json vocabulary = ParseArtifact(vocabulary_text, vocabulary_path);
    CheckHeader(vocabulary, kVocabularyFormat, vocabulary_path);

    std::shared_ptr<const features::TfidfVectorizer> vectorizer;
    try {
        const auto gram_size = vocabulary.at("gram_size").get<std::size_t>();

        std::vector<features::NGram> grams;
        for (const auto& gram : vocabulary.at("grams")) {
            grams.push_back(features::NGram{gram.get<std::vector<SyscallId>>()});
        }

        vectorizer = std::make_shared<const features::TfidfVectorizer>(
            features::TfidfVectorizer::FromState(
                gram_size,
                std::move(grams),
                vocabulary.at("document_frequency").get<std::vector<std::uint64_t>>(),
                vocabulary.at("training_windows").get<std::uint64_t>()));
    }
    catch (const json::exception& e) {
        throw ConfigurationError("malformed vocabulary " + vocabulary_path.string() + ": " + e.what());
    }

    // Forest
    const auto forest_path = ForestPath();
    const json forest = ParseArtifact(ReadArtifact(forest_path), forest_path);
    CheckHeader(forest, kForestFormat, forest_path);

    std::shared_ptr<const models::IsolationForest> model;
    std::string digest;
    try {
        const auto gram_size = forest.at("gram_size").get<std::size_t>();
        if (gram_size != vectorizer->GetGramSize()) {
            throw ModelMismatchError("forest was trained on " + std::to_string(gram_size) +
                                     "-grams, vocabulary holds " +
                                     std::to_string(vectorizer->GetGramSize()) + "-grams");
        }

        const auto dimension = forest.at("dimension").get<std::size_t>();
        if (dimension != vectorizer->Dimension()) {
            throw ModelMismatchError("forest dimension " + std::to_string(dimension) +
                                     " differs from vocabulary size " +
                                     std::to_string(vectorizer->Dimension()));
        }

        // Hash the bytes that were parsed above, not a second read of the file
        digest = utils::StringUtils::ToLower(forest.at("vocabulary_sha256").get<std::string>());
        if (utils::HashUtils::ComputeSHA256(vocabulary_text) != digest) {
            throw ModelMismatchError("forest was trained against a different vocabulary (" +
                                     vocabulary_path.string() + " digest differs)");
        }

        models::ForestParameters params;
        params.tree_count = forest.at("tree_count").get<std::size_t>();
        params.sample_size = forest.at("sample_size").get<std::size_t>();
        params.max_depth = forest.at("max_depth").get<std::size_t>();
        params.range_penalty = forest.at("range_penalty").get<bool>();

        std::vector<models::IsolationTree> trees;
        for (const auto& nodes : forest.at("trees")) {
            models::IsolationTree tree;
            for (const auto& node : nodes) {
                tree.nodes.push_back(NodeFromJson(node));
            }
            trees.push_back(std::move(tree));
        }

        model = std::make_shared<const models::IsolationForest>(
            models::IsolationForest::FromState(dimension, params,
                                               forest.at("seed").get<std::uint64_t>(),
                                               std::move(trees),
                                               forest.at("baseline_score").get<double>()));
    }
    catch (const json::exception& e) {
        throw ConfigurationError("malformed forest " + forest_path.string() + ": " + e.what());
    }

    spdlog::info("✓ Model loaded: {} {}-grams, {} trees",
                 vectorizer->Dimension(), vectorizer->GetGramSize(), model->GetTrees().size());

    return ModelBundle{vectorizer, model, digest};
}

} // namespace core
} // namespace sysgram
