/**
 * @file score_reporter.hpp
 * @brief Score feed: one record per scored window
 *
 * The detection pipeline publishes a ScoreRecord for every window it
 * scores, alerting or not. Sinks decide where records go: a JSON Lines
 * stream for downstream dashboards, the log, or an arbitrary callback.
 *
 * **JSON Lines record**:
 * ```json
 * {"system_id":"plc-01","window_index":42,"window_start_ns":84000000000,
 *  "window_end_ns":86000000000,"syscall_count":311,"score":0.41,
 *  "filtered_score":0.39,"threshold":0.6,"alert":false,"latency_ms":0.8}
 * ```
 *
 * @date 2025
 */

#pragma once

#include "sysgram/core/types.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iosfwd>
#include <mutex>
#include <string>

namespace sysgram {
namespace reporters {

/**
 * @struct ScoreRecord
 * @brief Score feed item for one window
 */
struct ScoreRecord {
    std::string system_id;              ///< Monitored system
    core::WindowSpan window;            ///< Scored window
    std::size_t syscall_count{0};       ///< Syscalls in the window
    double score{0.0};                  ///< Raw anomaly score
    double filtered_score{0.0};         ///< Smoothed score
    double threshold{0.0};              ///< Threshold in force
    bool alert{false};                  ///< score > threshold
    std::chrono::microseconds latency{0};  ///< Window seal to publication
};

/**
 * @brief Serialize a record as one line of JSON (no trailing newline)
 */
std::string ToJsonLine(const ScoreRecord& record);

/**
 * @class ScoreSink
 * @brief Destination of the score feed
 *
 * Emit() is called from the pipeline's processing thread, in window order.
 */
class ScoreSink {
public:
    virtual ~ScoreSink() = default;

    /// Publish one record
    virtual void Emit(const ScoreRecord& record) = 0;

    /// Push buffered records out, called after every published window
    virtual void Flush() {}
};

/**
 * @class JsonLinesScoreSink
 * @brief Writes one JSON object per line to a stream or file
 */
class JsonLinesScoreSink : public ScoreSink {
public:
    /**
     * @brief Write to an existing stream (not owned)
     */
    explicit JsonLinesScoreSink(std::ostream& stream);

    /**
     * @brief Write to a file, truncating it
     * @throws std::runtime_error if the file cannot be opened
     */
    explicit JsonLinesScoreSink(const std::filesystem::path& path);

    void Emit(const ScoreRecord& record) override;
    void Flush() override;

    std::size_t GetWritten() const { return written_; }

private:
    std::ofstream file_;
    std::ostream* stream_;
    std::mutex mutex_;
    std::size_t written_{0};
};

/**
 * @class CallbackScoreSink
 * @brief Forwards records to a function
 */
class CallbackScoreSink : public ScoreSink {
public:
    using Callback = std::function<void(const ScoreRecord&)>;

    explicit CallbackScoreSink(Callback callback);

    void Emit(const ScoreRecord& record) override;

private:
    Callback callback_;
};

/**
 * @class LogScoreSink
 * @brief Logs alerts at warn level and other windows at debug level
 */
class LogScoreSink : public ScoreSink {
public:
    void Emit(const ScoreRecord& record) override;
};

} // namespace reporters
} // namespace sysgram
