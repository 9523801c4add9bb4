/**
 * @file detection_pipeline.cpp
 * @brief Implementation of the streaming detection pipeline
 *
 * **Per-window processing**:
 * 1. Extract n-gram counts of the window
 * 2. Transform to a TF-IDF vector over the trained vocabulary
 * 3. Score with the isolation forest
 * 4. Compare against the current threshold
 * 5. Update the smoothed score
 * 6. Publish a ScoreRecord to every sink and flush it, so the feed keeps
 *    the window cadence
 *
 * Live windows are sealed a short grace period after their end so that
 * events still in flight from the tracer land in the right window.
 *
 * @date 2025
 */

#include "sysgram/core/detection_pipeline.hpp"
#include "sysgram/core/errors.hpp"
#include "sysgram/core/window_scoring.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace sysgram {
namespace core {

namespace {

constexpr std::chrono::milliseconds kSealGrace{100};

const DetectorConfig& Validated(const DetectorConfig& config) {
    config.Validate();
    return config;
}

Timestamp SteadyNow() {
    return std::chrono::duration_cast<Timestamp>(
        std::chrono::steady_clock::now().time_since_epoch());
}

std::chrono::steady_clock::time_point ToSteady(Timestamp timestamp) {
    return std::chrono::steady_clock::time_point(
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(timestamp));
}

} // anonymous namespace

DetectionPipeline::DetectionPipeline(const DetectorConfig& config,
                                     std::shared_ptr<const features::TfidfVectorizer> vectorizer,
                                     std::shared_ptr<const models::IsolationForest> forest)
    : config_(Validated(config))
    , vectorizer_(std::move(vectorizer))
    , forest_(std::move(forest))
    , extractor_(config_.gram_size)
    , alerter_(config_.alert_threshold)
    , filter_(config_.ewma_alpha, config_.filter_history, config_.filter_rank)
    , engine_(config_.window_duration, [this](Window&& window) { Enqueue(std::move(window)); }) {

    if (!vectorizer_ || !vectorizer_->IsFitted()) {
        throw ConfigurationError("detection pipeline needs a fitted vocabulary");
    }
    if (!forest_ || !forest_->IsFitted()) {
        throw ConfigurationError("detection pipeline needs a fitted isolation forest");
    }
    if (vectorizer_->GetGramSize() != config_.gram_size) {
        throw ModelMismatchError("vocabulary was built with gram size " +
                                 std::to_string(vectorizer_->GetGramSize()) +
                                 ", configuration uses " + std::to_string(config_.gram_size));
    }
    if (forest_->Dimension() != vectorizer_->Dimension()) {
        throw ModelMismatchError("forest dimension " + std::to_string(forest_->Dimension()) +
                                 " differs from vocabulary size " +
                                 std::to_string(vectorizer_->Dimension()));
    }

    spdlog::info("Detection pipeline initialized");
    spdlog::debug("Window: {} ms, gram size: {}, vocabulary: {}, threshold: {:.3f}",
                  config_.window_duration.count(), config_.gram_size,
                  vectorizer_->Dimension(), config_.alert_threshold);
}

DetectionPipeline::~DetectionPipeline() {
    Stop();
}

void DetectionPipeline::AddSink(std::shared_ptr<reporters::ScoreSink> sink) {
    if (sink) {
        sinks_.push_back(std::move(sink));
    }
}

void DetectionPipeline::SetAlertCallback(AlertCallback callback) {
    alert_callback_ = std::move(callback);
}

bool DetectionPipeline::Start(capture::SyscallSource& source) {
    if (source_) {
        spdlog::warn("Detection pipeline already attached to {}", source_->Name());
        return true;
    }

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("STARTING DETECTION ({})", source.Name());
    spdlog::info("═══════════════════════════════════════════════════════════════");

    EnsureWorker();

    {
        std::lock_guard<std::mutex> lock(engine_mutex_);
        engine_.SetOrigin(SteadyNow());
    }

    auto callback = [this](const SyscallEvent& event) {
        std::lock_guard<std::mutex> lock(engine_mutex_);
        engine_.Observe(event);
    };

    if (!source.Start(callback)) {
        spdlog::error("Failed to start capture source {}", source.Name());
        return false;
    }
    source_ = &source;

    {
        std::lock_guard<std::mutex> lock(ticker_mutex_);
        ticker_stop_ = false;
    }
    ticker_ = std::thread(&DetectionPipeline::TickerLoop, this);

    spdlog::info("✓ Detection running, windows of {} ms", config_.window_duration.count());
    return true;
}

void DetectionPipeline::ProcessEvents(const std::vector<SyscallEvent>& events) {
    EnsureWorker();

    {
        std::lock_guard<std::mutex> lock(engine_mutex_);
        for (const auto& event : events) {
            engine_.Observe(event);
        }
        engine_.Flush();
    }

    Drain();
}

bool DetectionPipeline::Replay(capture::SyscallSource& source) {
    EnsureWorker();

    auto callback = [this](const SyscallEvent& event) {
        std::lock_guard<std::mutex> lock(engine_mutex_);
        engine_.Observe(event);
    };

    if (!source.Start(callback)) {
        spdlog::error("Failed to replay {}", source.Name());
        return false;
    }

    FlushWindow();
    Drain();
    return true;
}

void DetectionPipeline::FlushWindow() {
    std::lock_guard<std::mutex> lock(engine_mutex_);
    engine_.Flush();
}

void DetectionPipeline::Drain() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this] {
        return (queue_.empty() && !busy_) || !worker_running_;
    });
}

void DetectionPipeline::Stop() {
    if (source_) {
        source_->Stop();
        source_ = nullptr;
    }

    if (ticker_.joinable()) {
        {
            std::lock_guard<std::mutex> lock(ticker_mutex_);
            ticker_stop_ = true;
        }
        ticker_cv_.notify_all();
        ticker_.join();
    }

    bool was_running = false;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        was_running = worker_running_ || worker_.joinable();
        stopping_ = true;
        if (!queue_.empty()) {
            spdlog::info("Discarding {} pending windows", queue_.size());
            statistics_.windows_discarded += queue_.size();
            queue_.clear();
        }
    }
    queue_cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }

    if (was_running) {
        auto stats = GetStatistics();
        spdlog::info("✓ Detection stopped");
        spdlog::info("  Windows scored: {} (failed: {}, discarded: {})",
                     stats.windows_scored, stats.windows_failed, stats.windows_discarded);
        spdlog::info("  Alerts: {}", stats.alerts);
        spdlog::info("  Events accepted: {} (rejected: {})",
                     stats.events_accepted, stats.events_rejected);
    }
}

std::string DetectionPipeline::LastError() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
}

PipelineStatistics DetectionPipeline::GetStatistics() const {
    PipelineStatistics snapshot;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        snapshot = statistics_;
        snapshot.queue_depth = queue_.size();
    }
    {
        std::lock_guard<std::mutex> lock(engine_mutex_);
        const auto& windowing = engine_.GetStatistics();
        snapshot.events_accepted = windowing.events_accepted;
        snapshot.events_rejected = windowing.events_rejected;
        snapshot.windows_sealed = windowing.windows_sealed;
    }
    return snapshot;
}

double DetectionPipeline::ScoreWindow(const Window& window) const {
    return ScoreCounts(*vectorizer_, *forest_, extractor_.Extract(window));
}

// Private methods

void DetectionPipeline::Enqueue(Window&& window) {
    std::size_t depth = 0;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_ || failed_) {
            statistics_.windows_discarded++;
            return;
        }

        queue_.push_back(QueuedWindow{std::move(window), std::chrono::steady_clock::now()});
        depth = queue_.size();
        statistics_.peak_queue_depth = std::max(statistics_.peak_queue_depth, depth);
    }
    queue_cv_.notify_one();

    if (depth == config_.backlog_warning + 1) {
        spdlog::warn("Processing backlog: {} windows waiting (latency growing)", depth);
    }
}

void DetectionPipeline::EnsureWorker() {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (worker_running_ || stopping_ || failed_) {
        return;
    }
    worker_running_ = true;
    worker_ = std::thread(&DetectionPipeline::WorkerLoop, this);
}

void DetectionPipeline::WorkerLoop() {
    spdlog::debug("Detection worker started");

    while (true) {
        QueuedWindow item;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (stopping_) {
                break;
            }
            item = std::move(queue_.front());
            queue_.pop_front();
            busy_ = true;
        }

        bool fatal = false;
        try {
            ProcessWindow(item);
        }
        catch (const ModelMismatchError& e) {
            spdlog::critical("Window {}: {}", item.window.index, e.what());
            Fail(e.what());
            fatal = true;
        }
        catch (const std::exception& e) {
            spdlog::error("Window {} failed: {}", item.window.index, e.what());
            std::lock_guard<std::mutex> lock(queue_mutex_);
            statistics_.windows_failed++;
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            busy_ = false;
            if (fatal) {
                statistics_.windows_failed++;
                statistics_.windows_discarded += queue_.size();
                queue_.clear();
                worker_running_ = false;
            }
        }
        idle_cv_.notify_all();

        if (fatal) {
            return;
        }
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        worker_running_ = false;
    }
    idle_cv_.notify_all();
    spdlog::debug("Detection worker stopped");
}

void DetectionPipeline::TickerLoop() {
    std::unique_lock<std::mutex> lock(ticker_mutex_);

    while (!ticker_stop_) {
        Timestamp deadline;
        {
            std::lock_guard<std::mutex> engine_lock(engine_mutex_);
            auto open = engine_.OpenWindow();
            deadline = open ? open->end : SteadyNow() + engine_.GetDuration();
        }

        ticker_cv_.wait_until(lock, ToSteady(deadline + kSealGrace),
                              [this] { return ticker_stop_; });
        if (ticker_stop_) {
            break;
        }

        std::lock_guard<std::mutex> engine_lock(engine_mutex_);
        engine_.Advance(SteadyNow() - kSealGrace);
    }
}

void DetectionPipeline::ProcessWindow(QueuedWindow& item) {
    const Window& window = item.window;
    const WindowSpan span = window.Span();

    const double score = ScoreWindow(window);
    const double threshold = alerter_.GetThreshold();
    auto alert = detection::Evaluate(span, score, threshold);
    const double filtered = filter_.Apply(score);

    reporters::ScoreRecord record;
    record.system_id = config_.system_id;
    record.window = span;
    record.syscall_count = window.syscalls.size();
    record.score = score;
    record.filtered_score = filtered;
    record.threshold = threshold;
    record.alert = alert.has_value();
    record.latency = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - item.sealed_at);

    if (alert && alert_callback_) {
        alert_callback_(*alert);
    }
    for (const auto& sink : sinks_) {
        sink->Emit(record);
        sink->Flush();
    }

    std::lock_guard<std::mutex> lock(queue_mutex_);
    statistics_.windows_scored++;
    if (alert) {
        statistics_.alerts++;
    }
    statistics_.last_latency = record.latency;
    statistics_.max_latency = std::max(statistics_.max_latency, record.latency);
}

void DetectionPipeline::Fail(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        last_error_ = message;
    }
    failed_ = true;
}

} // namespace core
} // namespace sysgram
