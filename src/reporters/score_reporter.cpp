/**
 * @file score_reporter.cpp
 * @brief Implementation of score feed sinks
 *
 * @date 2025
 */

#include "sysgram/reporters/score_reporter.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <ostream>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace sysgram {
namespace reporters {

std::string ToJsonLine(const ScoreRecord& record) {
    json j = {
        {"system_id", record.system_id},
        {"window_index", record.window.index},
        {"window_start_ns", record.window.start.count()},
        {"window_end_ns", record.window.end.count()},
        {"syscall_count", record.syscall_count},
        {"score", record.score},
        {"filtered_score", record.filtered_score},
        {"threshold", record.threshold},
        {"alert", record.alert},
        {"latency_ms", static_cast<double>(record.latency.count()) / 1000.0}
    };
    return j.dump();
}

// JsonLinesScoreSink

JsonLinesScoreSink::JsonLinesScoreSink(std::ostream& stream)
    : stream_(&stream) {
}

JsonLinesScoreSink::JsonLinesScoreSink(const std::filesystem::path& path)
    : file_(path, std::ios::out | std::ios::trunc)
    , stream_(&file_) {
    if (!file_.is_open()) {
        throw std::runtime_error("Failed to open score feed file: " + path.string());
    }
    spdlog::info("Writing score feed to {}", path.string());
}

void JsonLinesScoreSink::Emit(const ScoreRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    *stream_ << ToJsonLine(record) << '\n';
    written_++;
}

void JsonLinesScoreSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    stream_->flush();
}

// CallbackScoreSink

CallbackScoreSink::CallbackScoreSink(Callback callback)
    : callback_(std::move(callback)) {
}

void CallbackScoreSink::Emit(const ScoreRecord& record) {
    if (callback_) {
        callback_(record);
    }
}

// LogScoreSink

void LogScoreSink::Emit(const ScoreRecord& record) {
    if (record.alert) {
        spdlog::warn("ALERT [{}] window {} score {:.3f} > {:.3f} ({} syscalls, filtered {:.3f})",
                     record.system_id, record.window.index, record.score, record.threshold,
                     record.syscall_count, record.filtered_score);
    } else {
        spdlog::debug("[{}] window {} score {:.3f} ({} syscalls, filtered {:.3f})",
                      record.system_id, record.window.index, record.score,
                      record.syscall_count, record.filtered_score);
    }
}

} // namespace reporters
} // namespace sysgram
