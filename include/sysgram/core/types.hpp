/**
 * @file types.hpp
 * @brief Value types shared by the capture, windowing and scoring stages
 *
 * Defines the system call event produced by capture sources and the fixed
 * duration window that the windowing engine hands to feature extraction.
 * Both are plain values: they are copied or moved between stages, never
 * shared by reference across threads.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <vector>

namespace sysgram {
namespace core {

/// System call identifier (small non-negative integer, e.g. x86_64 syscall number)
using SyscallId = std::uint32_t;

/// Monotonic instant, nanoseconds since an arbitrary epoch chosen by the source
using Timestamp = std::chrono::nanoseconds;

/**
 * @struct SyscallEvent
 * @brief One system call observed by a capture source
 */
struct SyscallEvent {
    Timestamp timestamp{0};  ///< When the call was issued
    SyscallId syscall_id{0}; ///< Canonical syscall identifier
};

/**
 * @struct WindowSpan
 * @brief Position of a window on the time axis
 */
struct WindowSpan {
    std::uint64_t index{0};  ///< Ordinal of the window since the engine origin
    Timestamp start{0};      ///< Inclusive start
    Timestamp end{0};        ///< Exclusive end
};

/**
 * @struct Window
 * @brief Fixed-duration slice of the syscall stream
 *
 * Invariant: `end - start` equals the engine's window duration and
 * `syscalls` holds the identifiers in arrival order.
 */
struct Window {
    std::uint64_t index{0};          ///< Ordinal of the window since the engine origin
    Timestamp start{0};              ///< Inclusive start
    Timestamp end{0};                ///< Exclusive end
    std::vector<SyscallId> syscalls; ///< Syscall ids in arrival order

    WindowSpan Span() const { return WindowSpan{index, start, end}; }
};

} // namespace core
} // namespace sysgram
