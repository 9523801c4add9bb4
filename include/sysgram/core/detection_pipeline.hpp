/**
 * @file detection_pipeline.hpp
 * @brief Streaming inference: capture → windows → scores → alerts
 *
 * The pipeline owns the windowing engine and a single processing worker.
 * Capture delivers events into the engine on the capture thread; sealed
 * windows are queued and the worker extracts n-grams, vectorizes, scores,
 * evaluates the threshold and publishes a ScoreRecord for each window, in
 * window order.
 *
 * **Threads (live mode)**:
 * ```
 * capture thread ──Observe()──> WindowingEngine ──sealed──┐
 * ticker thread  ──Advance()──>        (mutex)            │
 *                                                         v
 *                                      FIFO queue (unbounded, mutex + condvar)
 *                                                         │
 * worker thread  <────────────────────────────────────────┘
 *   extract → transform → score → alert → filter → sinks
 * ```
 * The queue never drops a window: under overload, latency grows and the
 * queue depth is reported.
 *
 * @date 2025
 */

#pragma once

#include "sysgram/capture/syscall_source.hpp"
#include "sysgram/core/config.hpp"
#include "sysgram/core/windowing_engine.hpp"
#include "sysgram/detection/score_filter.hpp"
#include "sysgram/detection/threshold_alerting.hpp"
#include "sysgram/features/ngram_extractor.hpp"
#include "sysgram/features/tfidf_vectorizer.hpp"
#include "sysgram/models/isolation_forest.hpp"
#include "sysgram/reporters/score_reporter.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sysgram {
namespace core {

/**
 * @struct PipelineStatistics
 * @brief Snapshot of pipeline counters
 */
struct PipelineStatistics {
    std::uint64_t events_accepted{0};     ///< Events placed into windows
    std::uint64_t events_rejected{0};     ///< Out-of-order events dropped
    std::uint64_t windows_sealed{0};      ///< Windows produced by the engine
    std::uint64_t windows_scored{0};      ///< Windows published to the sinks
    std::uint64_t windows_failed{0};      ///< Windows whose processing threw
    std::uint64_t windows_discarded{0};   ///< Pending windows dropped by Stop()
    std::uint64_t alerts{0};              ///< Windows above the threshold
    std::size_t queue_depth{0};           ///< Windows waiting for the worker
    std::size_t peak_queue_depth{0};      ///< Largest queue depth observed
    std::chrono::microseconds last_latency{0};  ///< Seal to publication, last window
    std::chrono::microseconds max_latency{0};   ///< Seal to publication, worst window
};

/// Receives every alert raised by the pipeline (worker thread)
using AlertCallback = std::function<void(const detection::Alert&)>;

/**
 * @class DetectionPipeline
 * @brief Windowed anomaly scoring of a syscall stream
 *
 * **Error handling**:
 * - An exception while processing one window is logged and counted; the
 *   next window is processed normally.
 * - ModelMismatchError is global: the pipeline records it, discards the
 *   queue and stops processing. HasFailed() and LastError() report it.
 *
 * **Usage Example** (offline):
 * @code
 * DetectionPipeline pipeline(config, vectorizer, forest);
 * pipeline.AddSink(std::make_shared<reporters::LogScoreSink>());
 * pipeline.ProcessEvents(events);   // flushes and drains
 * pipeline.Stop();
 * @endcode
 *
 * **Usage Example** (live):
 * @code
 * capture::StraceSource source(strace_config, table);
 * pipeline.Start(source);
 * // ... until interrupted
 * pipeline.Stop();
 * @endcode
 *
 * Sinks and the alert callback must be registered before processing starts.
 * A pipeline is not restartable after Stop().
 */
class DetectionPipeline {
public:
    /**
     * @brief Construct pipeline around trained artifacts
     * @param config Detector configuration (validated here)
     * @param vectorizer Fitted vectorizer
     * @param forest Fitted forest
     * @throws ConfigurationError if the configuration is invalid or an artifact is missing
     * @throws ModelMismatchError if gram size or dimension disagree
     */
    DetectionPipeline(const DetectorConfig& config,
                      std::shared_ptr<const features::TfidfVectorizer> vectorizer,
                      std::shared_ptr<const models::IsolationForest> forest);

    ~DetectionPipeline();

    DetectionPipeline(const DetectionPipeline&) = delete;
    DetectionPipeline& operator=(const DetectionPipeline&) = delete;

    /// Register a score feed destination
    void AddSink(std::shared_ptr<reporters::ScoreSink> sink);

    /// Register an alert consumer
    void SetAlertCallback(AlertCallback callback);

    /**
     * @brief Live mode: window a running source on the steady clock
     *
     * Windows start at the current steady-clock time and are sealed on a
     * fixed cadence, whether or not events arrive.
     *
     * @param source Capture source, must outlive the pipeline's activity
     * @return false if the source failed to start
     */
    bool Start(capture::SyscallSource& source);

    /**
     * @brief Offline mode: window recorded events by their timestamps
     *
     * Flushes the last window and waits until every window is published.
     */
    void ProcessEvents(const std::vector<SyscallEvent>& events);

    /**
     * @brief Offline mode: replay a synchronous source (e.g. a trace file)
     * @return false if the source failed to start
     */
    bool Replay(capture::SyscallSource& source);

    /**
     * @brief Seal the open window now
     */
    void FlushWindow();

    /**
     * @brief Block until the queue is empty and no window is in flight
     */
    void Drain();

    /**
     * @brief Stop capture, ticker and worker
     *
     * Pending windows are discarded; the window in flight finishes.
     */
    void Stop();

    /// Whether a global error stopped processing
    bool HasFailed() const { return failed_.load(); }

    /// Message of the global error, empty if none
    std::string LastError() const;

    PipelineStatistics GetStatistics() const;

    /// Threshold holder, SetThreshold() applies to subsequent windows
    detection::ThresholdAlerter& GetAlerter() { return alerter_; }

    /**
     * @brief Score a single window without queueing or publishing
     */
    double ScoreWindow(const Window& window) const;

private:
    struct QueuedWindow {
        Window window;
        std::chrono::steady_clock::time_point sealed_at;
    };

    DetectorConfig config_;
    std::shared_ptr<const features::TfidfVectorizer> vectorizer_;
    std::shared_ptr<const models::IsolationForest> forest_;
    features::NGramExtractor extractor_;
    detection::ThresholdAlerter alerter_;
    detection::ScoreFilter filter_;                         ///< Worker thread only
    std::vector<std::shared_ptr<reporters::ScoreSink>> sinks_;
    AlertCallback alert_callback_;

    // Windowing (capture + ticker threads)
    mutable std::mutex engine_mutex_;
    WindowingEngine engine_;
    capture::SyscallSource* source_{nullptr};

    // Ticker
    std::thread ticker_;
    std::mutex ticker_mutex_;
    std::condition_variable ticker_cv_;
    bool ticker_stop_{false};

    // Processing queue
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<QueuedWindow> queue_;
    bool busy_{false};
    bool stopping_{false};
    bool worker_running_{false};
    std::thread worker_;

    // Failure state
    std::atomic<bool> failed_{false};
    mutable std::mutex error_mutex_;
    std::string last_error_;

    // Worker-side counters (guarded by queue_mutex_)
    PipelineStatistics statistics_;

    void Enqueue(Window&& window);
    void EnsureWorker();
    void WorkerLoop();
    void TickerLoop();
    void ProcessWindow(QueuedWindow& item);
    void Fail(const std::string& message);
};

} // namespace core
} // namespace sysgram
