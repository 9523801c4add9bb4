/**
 * @file syscall_source.hpp
 * @brief Capture feed abstraction
 *
 * The detector does not depend on any tracing mechanism. A SyscallSource
 * delivers SyscallEvent values, in timestamp order, to a callback; the
 * concrete source may be a live tracer or a recorded trace.
 *
 * @date 2025
 */

#pragma once

#include "sysgram/core/types.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace sysgram {
namespace capture {

/// Receives captured events on the source's delivery thread
using EventCallback = std::function<void(const core::SyscallEvent&)>;

/**
 * @struct CaptureStatistics
 * @brief Capture-side counters
 */
struct CaptureStatistics {
    std::uint64_t events_delivered{0};   ///< Events handed to the callback
    std::uint64_t unknown_syscalls{0};   ///< Syscalls without a known id (dropped)
    std::uint64_t invalid_records{0};    ///< Unparsable lines or records
};

/**
 * @class SyscallSource
 * @brief Strategy interface of capture sources
 *
 * Start() returns false (and logs) when the source cannot be started;
 * capture problems after that are logged and counted, never thrown.
 */
class SyscallSource {
public:
    virtual ~SyscallSource() = default;

    /**
     * @brief Begin delivering events
     * @param callback Event consumer, must outlive the source's activity
     * @return true if capture started
     */
    virtual bool Start(EventCallback callback) = 0;

    /// Stop delivering events; no callback runs after Stop() returns
    virtual void Stop() = 0;

    /// Whether the source may still deliver events
    virtual bool IsRunning() const = 0;

    /// Short description for logs
    virtual std::string Name() const = 0;

    virtual CaptureStatistics GetStatistics() const = 0;
};

} // namespace capture
} // namespace sysgram
