/**
 * @file trainer.hpp
 * @brief Offline training of the vocabulary and isolation forest
 *
 * Training consumes traces of normal behavior. Each trace is cut into
 * windows on its own timeline (no window spans two traces), windows are
 * reduced to n-gram counts, the TF-IDF vocabulary is fitted on them and the
 * isolation forest is grown on their vectors.
 *
 * **Training Flow**:
 * ```
 * traces → windows → n-gram counts → Fit(vocabulary) → vectors → Fit(forest)
 *                                                                 │
 *                           training scores → suggested threshold ┘
 * ```
 *
 * @date 2025
 */

#pragma once

#include "sysgram/capture/trace_file_source.hpp"
#include "sysgram/core/config.hpp"
#include "sysgram/features/ngram_extractor.hpp"
#include "sysgram/features/tfidf_vectorizer.hpp"
#include "sysgram/models/isolation_forest.hpp"
#include "sysgram/parsers/syscall_table.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

namespace sysgram {
namespace core {

/**
 * @struct TrainingReport
 * @brief Summary of a training run
 */
struct TrainingReport {
    std::size_t traces{0};              ///< Traces added
    std::size_t windows{0};             ///< Training windows
    std::size_t empty_windows{0};       ///< Windows without syscalls
    std::uint64_t rejected_events{0};   ///< Out-of-order events dropped
    std::size_t vocabulary_size{0};     ///< Distinct n-grams
    double score_min{0.0};              ///< Lowest training score
    double score_mean{0.0};             ///< Mean training score
    double score_max{0.0};              ///< Highest training score
    double suggested_threshold{0.0};    ///< (1 - contamination) quantile of training scores
};

/**
 * @struct TrainingResult
 * @brief Trained artifacts and their report
 */
struct TrainingResult {
    std::shared_ptr<const features::TfidfVectorizer> vectorizer;
    std::shared_ptr<const models::IsolationForest> forest;
    TrainingReport report;
};

/**
 * @class Trainer
 * @brief Collects training windows and fits the model
 *
 * **Usage Example**:
 * @code
 * Trainer trainer(config);
 * trainer.AddTraceFile("normal-1.strace", capture::TraceFormat::STRACE);
 * trainer.AddTraceFile("normal-2.strace", capture::TraceFormat::STRACE);
 *
 * auto result = trainer.Train();
 * ModelStore("model").Save(*result.vectorizer, *result.forest);
 * @endcode
 */
class Trainer {
public:
    /**
     * @brief Construct trainer
     * @throws ConfigurationError if the configuration is invalid
     */
    explicit Trainer(const DetectorConfig& config);

    /**
     * @brief Window one trace and add its windows to the corpus
     * @param events Trace in timestamp order
     * @return Number of windows added
     */
    std::size_t AddTrace(const std::vector<SyscallEvent>& events);

    /**
     * @brief Read a trace file and add its windows
     * @throws ConfigurationError if the file cannot be read
     */
    std::size_t AddTraceFile(const std::filesystem::path& path,
                             capture::TraceFormat format,
                             std::shared_ptr<const parsers::SyscallTable> table = nullptr);

    /**
     * @brief Add one pre-cut window
     * @param syscalls Syscall ids of the window, in order
     */
    void AddWindow(const std::vector<SyscallId>& syscalls);

    /**
     * @brief Fit vocabulary and forest on every window added so far
     * @throws ConfigurationError if no window was added
     */
    TrainingResult Train() const;

    std::size_t WindowCount() const { return corpus_.size(); }

    /**
     * @brief Nearest-rank quantile
     * @param values Samples (copied and sorted)
     * @param q Quantile in [0,1]
     */
    static double Quantile(std::vector<double> values, double q);

private:
    DetectorConfig config_;
    features::NGramExtractor extractor_;
    std::vector<features::NGramCounts> corpus_;
    std::size_t traces_{0};
    std::size_t empty_windows_{0};
    std::uint64_t rejected_events_{0};
};

} // namespace core
} // namespace sysgram
