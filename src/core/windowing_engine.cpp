/**
 * @file windowing_engine.cpp
 * @brief Implementation of fixed-duration windowing of the syscall stream
 *
 * **Tiling**:
 * ```
 * origin        origin+d      origin+2d     origin+3d
 *   |  window 0   |  window 1   |  window 2   |
 *   [ 1 4 4 0 ... )[           )[ 3 3 59 ... )
 *                    (empty)
 * ```
 * Window k covers `[origin + k*d, origin + (k+1)*d)`. An event at exactly
 * `origin + d` belongs to window 1.
 *
 * @date 2025
 */

#include "sysgram/core/windowing_engine.hpp"
#include "sysgram/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace sysgram {
namespace core {

WindowingEngine::WindowingEngine(std::chrono::nanoseconds duration, WindowCallback on_sealed)
    : duration_(duration)
    , on_sealed_(std::move(on_sealed)) {

    if (duration_.count() <= 0) {
        throw ConfigurationError("window duration must be positive");
    }

    spdlog::debug("Windowing engine initialized (window = {} ms)",
                  std::chrono::duration_cast<std::chrono::milliseconds>(duration_).count());
}

void WindowingEngine::SetOrigin(Timestamp origin) {
    if (started_) {
        spdlog::warn("Window origin already fixed, ignoring new origin");
        return;
    }

    started_ = true;
    next_start_ = origin;
    next_index_ = 0;
    OpenNext();
}

bool WindowingEngine::Observe(const SyscallEvent& event) {
    if (!started_) {
        SetOrigin(event.timestamp);
    }

    if (last_timestamp_ && event.timestamp < *last_timestamp_) {
        statistics_.events_rejected++;
        spdlog::warn("Rejected out-of-order syscall {} at {} ns (last accepted {} ns)",
                     event.syscall_id, event.timestamp.count(), last_timestamp_->count());
        return false;
    }

    const Timestamp window_start = open_ ? current_.start : next_start_;
    if (event.timestamp < window_start) {
        statistics_.events_rejected++;
        spdlog::warn("Rejected syscall {} at {} ns: window starting at {} ns already sealed",
                     event.syscall_id, event.timestamp.count(), window_start.count());
        return false;
    }

    if (!open_) {
        OpenNext();
    }

    while (event.timestamp >= current_.end) {
        SealCurrent();
        OpenNext();
    }

    current_.syscalls.push_back(event.syscall_id);
    last_timestamp_ = event.timestamp;
    statistics_.events_accepted++;
    return true;
}

std::size_t WindowingEngine::Advance(Timestamp now) {
    if (!started_) {
        return 0;
    }

    if (!open_) {
        if (now < next_start_ + duration_) {
            return 0;
        }
        OpenNext();
    }

    std::size_t sealed = 0;
    while (now >= current_.end) {
        SealCurrent();
        OpenNext();
        sealed++;
    }
    return sealed;
}

std::size_t WindowingEngine::Flush() {
    if (!open_) {
        return 0;
    }

    SealCurrent();
    return 1;
}

std::optional<WindowSpan> WindowingEngine::OpenWindow() const {
    if (!open_) {
        return std::nullopt;
    }
    return current_.Span();
}

void WindowingEngine::OpenNext() {
    current_ = Window{};
    current_.index = next_index_;
    current_.start = next_start_;
    current_.end = next_start_ + duration_;
    open_ = true;

    next_index_++;
    next_start_ = current_.end;
}

void WindowingEngine::SealCurrent() {
    open_ = false;
    statistics_.windows_sealed++;
    if (current_.syscalls.empty()) {
        statistics_.empty_windows++;
    }

    spdlog::debug("Sealed window {} [{} ns, {} ns) with {} syscalls",
                  current_.index, current_.start.count(), current_.end.count(),
                  current_.syscalls.size());

    if (on_sealed_) {
        on_sealed_(std::move(current_));
    }
    current_ = Window{};
}

} // namespace core
} // namespace sysgram
