/**
 * @file strace_source.cpp
 * @brief Implementation of live strace capture
 *
 * **Process layout**:
 * ```
 * sysgram ──fork──> strace -f -ttt -qq [-p pid | command...]
 *    ^                   │ stderr
 *    └──── pipe ─────────┘
 * ```
 * The reader thread polls the pipe so that it notices a stop request or
 * strace exiting even when a traced descendant keeps the pipe open.
 *
 * @date 2025
 */

#include "sysgram/capture/strace_source.hpp"
#include "sysgram/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <utility>

#ifndef _WIN32
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace sysgram {
namespace capture {

namespace {

constexpr int kPollIntervalMs = 100;

} // anonymous namespace

StraceSource::StraceSource(StraceSourceConfig config,
                           std::shared_ptr<const parsers::SyscallTable> table)
    : config_(std::move(config))
    , table_(std::move(table)) {
    if (!table_) {
        table_ = std::make_shared<const parsers::SyscallTable>(parsers::SyscallTable::BuiltIn());
    }
    spdlog::debug("strace source initialized ({} known syscalls)", table_->Size());
}

StraceSource::~StraceSource() {
    Stop();
}

bool StraceSource::Start(EventCallback callback) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (running_) {
        spdlog::warn("strace source already running");
        return true;
    }
    if (reader_.joinable()) {
        reader_.join();
    }

    if (config_.pid <= 0 && config_.command.empty()) {
        spdlog::error("strace source needs a pid or a command to trace");
        return false;
    }

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("STARTING SYSCALL CAPTURE");
    spdlog::info("═══════════════════════════════════════════════════════════════");

    callback_ = std::move(callback);
    stop_requested_ = false;
    {
        std::lock_guard<std::mutex> stats_lock(statistics_mutex_);
        statistics_ = CaptureStatistics{};
        unknown_names_.clear();
    }

    if (!LaunchStrace()) {
        spdlog::error("Failed to launch strace");
        return false;
    }

    running_ = true;
    reader_ = std::thread(&StraceSource::ReadStraceOutput, this);

    spdlog::info("✓ Syscall capture started ({})", Name());
    return true;
}

void StraceSource::Stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    stop_requested_ = true;
    if (reader_.joinable()) {
        reader_.join();
    }
    StopStrace();

    if (running_.exchange(false)) {
        spdlog::info("✓ Syscall capture stopped");
    }

    auto stats = GetStatistics();
    if (stats.events_delivered > 0 || stats.unknown_syscalls > 0) {
        spdlog::info("  Events delivered: {}", stats.events_delivered);
        spdlog::info("  Unknown syscalls dropped: {}", stats.unknown_syscalls);
    }
}

std::string StraceSource::Name() const {
    if (config_.pid > 0) {
        return "strace:pid " + std::to_string(config_.pid);
    }
    return "strace:" + utils::StringUtils::Join(config_.command, " ");
}

CaptureStatistics StraceSource::GetStatistics() const {
    std::lock_guard<std::mutex> lock(statistics_mutex_);
    return statistics_;
}

std::optional<core::SyscallEvent> StraceSource::ParseEvent(const std::string& line) {
    auto record = parser_.ParseLine(line);
    if (!record) {
        if (!parser_.IsSkippable(line) && !utils::StringUtils::Trim(line).empty()) {
            std::lock_guard<std::mutex> lock(statistics_mutex_);
            statistics_.invalid_records++;
        }
        return std::nullopt;
    }

    auto id = table_->Resolve(record->name);
    if (!id) {
        std::lock_guard<std::mutex> lock(statistics_mutex_);
        statistics_.unknown_syscalls++;
        if (unknown_names_.insert(record->name).second) {
            spdlog::warn("Dropping unknown syscall '{}'", record->name);
        }
        return std::nullopt;
    }

    // Steady-clock read time, not the wall-clock field strace printed
    auto now = std::chrono::duration_cast<core::Timestamp>(
        std::chrono::steady_clock::now().time_since_epoch());
    return core::SyscallEvent{now, *id};
}

bool StraceSource::ProcessLine(const std::string& line) {
    auto event = ParseEvent(line);
    if (!event || !callback_) {
        return false;
    }

    callback_(*event);
    std::lock_guard<std::mutex> lock(statistics_mutex_);
    statistics_.events_delivered++;
    return true;
}

// Private methods

bool StraceSource::LaunchStrace() {
#ifdef _WIN32
    spdlog::error("strace not available on Windows");
    return false;
#else
    // Build the argument vector before forking
    std::vector<std::string> arguments;
    arguments.push_back(config_.strace_binary);
    arguments.insert(arguments.end(), config_.strace_args.begin(), config_.strace_args.end());
    if (config_.pid > 0) {
        arguments.push_back("-p");
        arguments.push_back(std::to_string(config_.pid));
    } else {
        arguments.push_back("--");
        arguments.insert(arguments.end(), config_.command.begin(), config_.command.end());
    }

    std::vector<char*> argv;
    for (auto& argument : arguments) {
        argv.push_back(argument.data());
    }
    argv.push_back(nullptr);

    int pipe_fds[2];
    if (pipe(pipe_fds) < 0) {
        spdlog::error("Failed to create pipe: {}", std::strerror(errno));
        return false;
    }

    strace_pid_ = fork();

    if (strace_pid_ < 0) {
        spdlog::error("Failed to fork: {}", std::strerror(errno));
        close(pipe_fds[0]);
        close(pipe_fds[1]);
        return false;
    }

    if (strace_pid_ == 0) {
        // Child: strace writes its trace to stderr
        close(pipe_fds[0]);
        dup2(pipe_fds[1], STDERR_FILENO);
        close(pipe_fds[1]);

        execvp(argv[0], argv.data());
        _exit(127);
    }

    // Parent
    close(pipe_fds[1]);
    strace_output_fd_ = pipe_fds[0];

    spdlog::info("strace launched with PID: {}", strace_pid_);
    return true;
#endif
}

void StraceSource::ReadStraceOutput() {
#ifndef _WIN32
    char buffer[4096];
    std::string line_buffer;

    while (!stop_requested_) {
        pollfd descriptor{strace_output_fd_, POLLIN, 0};
        int ready = poll(&descriptor, 1, kPollIntervalMs);

        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("Polling strace output failed: {}", std::strerror(errno));
            break;
        }

        if (ready == 0) {
            // Descendants may hold the pipe open after strace is gone
            int status = 0;
            if (waitpid(strace_pid_, &status, WNOHANG) == strace_pid_) {
                spdlog::info("strace exited (status {})",
                             WIFEXITED(status) ? WEXITSTATUS(status) : -1);
                strace_pid_ = -1;
                break;
            }
            continue;
        }

        ssize_t bytes_read = read(strace_output_fd_, buffer, sizeof(buffer));
        if (bytes_read < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("Reading strace output failed: {}", std::strerror(errno));
            break;
        }
        if (bytes_read == 0) {
            break;  // EOF
        }

        line_buffer.append(buffer, static_cast<std::size_t>(bytes_read));

        std::size_t pos;
        while ((pos = line_buffer.find('\n')) != std::string::npos) {
            std::string line = line_buffer.substr(0, pos);
            line_buffer.erase(0, pos + 1);
            ProcessLine(line);
        }
    }

    if (!line_buffer.empty() && !stop_requested_) {
        ProcessLine(line_buffer);
    }

    running_ = false;
    spdlog::debug("strace reader finished");
#endif
}

void StraceSource::StopStrace() {
#ifndef _WIN32
    if (strace_pid_ > 0) {
        if (waitpid(strace_pid_, nullptr, WNOHANG) == 0) {
            kill(strace_pid_, SIGTERM);
            waitpid(strace_pid_, nullptr, 0);
        }
        strace_pid_ = -1;
    }

    if (strace_output_fd_ >= 0) {
        close(strace_output_fd_);
        strace_output_fd_ = -1;
    }
#endif
}

} // namespace capture
} // namespace sysgram
