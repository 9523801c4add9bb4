/**
 * @file trainer.cpp
 * @brief Implementation of offline training
 *
 * @date 2025
 */

#include "sysgram/core/trainer.hpp"
#include "sysgram/core/errors.hpp"
#include "sysgram/core/window_scoring.hpp"
#include "sysgram/core/windowing_engine.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <numeric>
#include <utility>

namespace sysgram {
namespace core {

namespace {

const DetectorConfig& Validated(const DetectorConfig& config) {
    config.Validate();
    return config;
}

} // anonymous namespace

Trainer::Trainer(const DetectorConfig& config)
    : config_(Validated(config))
    , extractor_(config_.gram_size) {
}

std::size_t Trainer::AddTrace(const std::vector<SyscallEvent>& events) {
    std::size_t added = 0;

    WindowingEngine engine(config_.window_duration, [this, &added](Window&& window) {
        if (window.syscalls.empty()) {
            empty_windows_++;
        }
        corpus_.push_back(extractor_.Extract(window));
        added++;
    });

    for (const auto& event : events) {
        engine.Observe(event);
    }
    engine.Flush();

    traces_++;
    rejected_events_ += engine.GetStatistics().events_rejected;

    spdlog::debug("Trace {}: {} events → {} windows", traces_, events.size(), added);
    return added;
}

std::size_t Trainer::AddTraceFile(const std::filesystem::path& path,
                                  capture::TraceFormat format,
                                  std::shared_ptr<const parsers::SyscallTable> table) {
    capture::TraceFileSource source(path, format, std::move(table));
    auto events = source.ReadAll();
    auto added = AddTrace(events);
    spdlog::info("  {}: {} events, {} windows", path.filename().string(), events.size(), added);
    return added;
}

void Trainer::AddWindow(const std::vector<SyscallId>& syscalls) {
    if (syscalls.empty()) {
        empty_windows_++;
    }
    corpus_.push_back(extractor_.Extract(syscalls));
}

TrainingResult Trainer::Train() const {
    if (corpus_.empty()) {
        throw ConfigurationError("no training windows: add at least one non-empty trace");
    }

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("TRAINING ON {} WINDOWS", corpus_.size());
    spdlog::info("═══════════════════════════════════════════════════════════════");

    // Vocabulary
    auto vectorizer = std::make_shared<features::TfidfVectorizer>(config_.gram_size);
    vectorizer->Fit(corpus_);
    if (vectorizer->Dimension() == 0) {
        spdlog::warn("Training windows hold no {}-grams; every window will look alike",
                     config_.gram_size);
    }

    // Forest
    auto vectors = vectorizer->TransformBatch(corpus_);

    models::ForestParameters params;
    params.tree_count = config_.tree_count;
    params.sample_size = config_.sample_size;
    params.max_depth = config_.max_depth;
    params.range_penalty = config_.range_penalty;

    auto forest = std::make_shared<models::IsolationForest>();
    forest->Fit(vectors, params, config_.seed);

    // Training score distribution, empty windows at the baseline
    std::vector<double> scores;
    scores.reserve(corpus_.size());
    for (const auto& counts : corpus_) {
        scores.push_back(ScoreCounts(*vectorizer, *forest, counts));
    }

    TrainingReport report;
    report.traces = traces_;
    report.windows = corpus_.size();
    report.empty_windows = empty_windows_;
    report.rejected_events = rejected_events_;
    report.vocabulary_size = vectorizer->Dimension();
    report.score_min = *std::min_element(scores.begin(), scores.end());
    report.score_max = *std::max_element(scores.begin(), scores.end());
    report.score_mean = std::accumulate(scores.begin(), scores.end(), 0.0) /
                        static_cast<double>(scores.size());
    report.suggested_threshold = Quantile(scores, 1.0 - config_.contamination);

    spdlog::info("✓ Training complete");
    spdlog::info("  Windows: {} ({} empty)", report.windows, report.empty_windows);
    spdlog::info("  Vocabulary: {} distinct {}-grams", report.vocabulary_size, config_.gram_size);
    spdlog::info("  Training scores: min {:.4f}, mean {:.4f}, max {:.4f}",
                 report.score_min, report.score_mean, report.score_max);
    spdlog::info("  Suggested threshold (contamination {}): {:.4f}",
                 config_.contamination, report.suggested_threshold);

    spdlog::debug("  Windows without n-grams score at the baseline {:.4f}", forest->GetBaselineScore());

    return TrainingResult{vectorizer, forest, report};
}

double Trainer::Quantile(std::vector<double> values, double q) {
    if (values.empty()) {
        return 0.0;
    }

    std::sort(values.begin(), values.end());
    auto index = static_cast<std::size_t>(q * static_cast<double>(values.size()));
    if (index >= values.size()) {
        index = values.size() - 1;
    }
    return values[index];
}

} // namespace core
} // namespace sysgram
