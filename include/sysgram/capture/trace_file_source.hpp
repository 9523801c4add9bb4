/**
 * @file trace_file_source.hpp
 * @brief Replays recorded syscall traces
 *
 * Training corpora and offline detection read traces from files. Two
 * layouts are understood:
 *
 * **ID_RECORDS** (one event per line, `#` starts a comment):
 * ```
 * # timestamp_ns syscall_id
 * 1000000 0
 * 1000450 1
 * ```
 *
 * **STRACE**: output of `strace -f -ttt`, names resolved through a
 * SyscallTable.
 *
 * @date 2025
 */

#pragma once

#include "sysgram/capture/syscall_source.hpp"
#include "sysgram/parsers/syscall_table.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sysgram {
namespace capture {

/**
 * @enum TraceFormat
 * @brief Layout of a trace file
 */
enum class TraceFormat {
    ID_RECORDS,   ///< "timestamp_ns syscall_id" per line
    STRACE        ///< strace -ttt output
};

/**
 * @brief Parse a format name ("ids" or "strace", case-insensitive)
 */
std::optional<TraceFormat> ParseTraceFormat(const std::string& name);

/// Format name accepted by ParseTraceFormat()
std::string TraceFormatName(TraceFormat format);

/**
 * @class TraceFileSource
 * @brief SyscallSource reading a trace file
 *
 * Start() delivers every event synchronously on the calling thread and
 * returns once the file is exhausted.
 *
 * **Usage Example**:
 * @code
 * auto table = std::make_shared<parsers::SyscallTable>(parsers::SyscallTable::BuiltIn());
 * TraceFileSource source("normal.strace", TraceFormat::STRACE, table);
 * auto events = source.ReadAll();
 * @endcode
 */
class TraceFileSource : public SyscallSource {
public:
    /**
     * @brief Construct source
     * @param path Trace file
     * @param format File layout
     * @param table Name/id mapping (null selects the built-in table)
     */
    TraceFileSource(std::filesystem::path path,
                    TraceFormat format,
                    std::shared_ptr<const parsers::SyscallTable> table);

    /**
     * @brief Read every event of the file
     * @return Events in file order
     * @throws core::ConfigurationError if the file cannot be read
     */
    std::vector<core::SyscallEvent> ReadAll();

    bool Start(EventCallback callback) override;
    void Stop() override;
    bool IsRunning() const override { return running_.load(); }
    std::string Name() const override;
    CaptureStatistics GetStatistics() const override { return statistics_; }

    const std::filesystem::path& GetPath() const { return path_; }
    TraceFormat GetFormat() const { return format_; }

private:
    std::filesystem::path path_;
    TraceFormat format_;
    std::shared_ptr<const parsers::SyscallTable> table_;
    CaptureStatistics statistics_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};

    std::vector<core::SyscallEvent> ReadIdRecords();
    std::vector<core::SyscallEvent> ReadStrace();
};

} // namespace capture
} // namespace sysgram
