/**
 * @file strace_source.hpp
 * @brief Live syscall capture through strace
 *
 * Runs `strace -f -ttt -qq` either attached to a running process or
 * spawning a command, reads its trace output through a pipe on a reader
 * thread and turns every syscall line into a SyscallEvent.
 *
 * strace prints wall-clock times. The source ignores them and stamps each
 * event with the steady clock when its line is read, so event timestamps
 * follow the pipeline's window clock even if the system clock is stepped.
 *
 * **Requirements**:
 * - strace installed and in PATH
 * - ptrace permission on the target (CAP_SYS_PTRACE or same user with
 *   kernel.yama.ptrace_scope=0) when attaching to a pid
 *
 * @date 2025
 */

#pragma once

#include "sysgram/capture/syscall_source.hpp"
#include "sysgram/parsers/strace_parser.hpp"
#include "sysgram/parsers/syscall_table.hpp"

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace sysgram {
namespace capture {

/**
 * @struct StraceSourceConfig
 * @brief What to trace and how
 */
struct StraceSourceConfig {
    std::string strace_binary{"strace"};                       ///< strace executable
    std::vector<std::string> strace_args{"-f", "-ttt", "-qq"}; ///< Tracing flags
    int pid{0};                                                ///< Attach to this pid (0 = spawn command)
    std::vector<std::string> command;                          ///< Command to spawn when pid is 0
};

/**
 * @class StraceSource
 * @brief SyscallSource backed by an strace child process
 *
 * Events are delivered on the reader thread. The source stops by itself
 * when strace exits (traced command finished or pid gone).
 *
 * **Usage Example**:
 * @code
 * StraceSourceConfig config;
 * config.command = {"/usr/sbin/sshd", "-D"};
 *
 * StraceSource source(config, table);
 * source.Start([&](const core::SyscallEvent& event) { engine.Observe(event); });
 * // ...
 * source.Stop();
 * @endcode
 */
class StraceSource : public SyscallSource {
public:
    /**
     * @brief Construct source
     * @param config Target and strace options
     * @param table Syscall name mapping (null selects the built-in table)
     */
    StraceSource(StraceSourceConfig config,
                 std::shared_ptr<const parsers::SyscallTable> table);

    ~StraceSource() override;

    StraceSource(const StraceSource&) = delete;
    StraceSource& operator=(const StraceSource&) = delete;

    bool Start(EventCallback callback) override;
    void Stop() override;
    bool IsRunning() const override { return running_.load(); }
    std::string Name() const override;
    CaptureStatistics GetStatistics() const override;

    /**
     * @brief Parse and resolve one line of strace output
     *
     * Counts invalid lines and unknown syscalls. The event carries the
     * steady-clock time of the call.
     *
     * @return The event, or nullopt if the line describes no known syscall
     */
    std::optional<core::SyscallEvent> ParseEvent(const std::string& line);

    /**
     * @brief Handle one line of strace output
     *
     * Parses, resolves and delivers the syscall it describes, if any.
     *
     * @return true if an event was delivered
     */
    bool ProcessLine(const std::string& line);

private:
    StraceSourceConfig config_;
    std::shared_ptr<const parsers::SyscallTable> table_;
    parsers::StraceParser parser_;
    EventCallback callback_;

    pid_t strace_pid_{-1};
    int strace_output_fd_{-1};
    std::thread reader_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::mutex lifecycle_mutex_;                 ///< Serializes Start/Stop

    mutable std::mutex statistics_mutex_;
    CaptureStatistics statistics_;
    std::set<std::string> unknown_names_;

    bool LaunchStrace();
    void ReadStraceOutput();
    void StopStrace();
};

} // namespace capture
} // namespace sysgram
