/**
 * @file windowing_engine.hpp
 * @brief Partitions the syscall stream into fixed-duration windows
 *
 * The engine tiles the time axis into contiguous, non-overlapping windows
 * `[start, start + duration)` beginning at an origin. Events are appended to
 * the open window; once an event or the clock reaches the window end, the
 * window is sealed and handed to the registered callback, and the next one
 * opens exactly where the previous ended. Windows without events are still
 * sealed, as empty sequences.
 *
 * @date 2025
 */

#pragma once

#include "sysgram/core/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>

namespace sysgram {
namespace core {

/// Receives each sealed window, in time order
using WindowCallback = std::function<void(Window&&)>;

/**
 * @struct WindowingStatistics
 * @brief Counters maintained by the windowing engine
 */
struct WindowingStatistics {
    std::uint64_t events_accepted{0};   ///< Events appended to a window
    std::uint64_t events_rejected{0};   ///< Out-of-order events dropped
    std::uint64_t windows_sealed{0};    ///< Windows handed downstream
    std::uint64_t empty_windows{0};     ///< Sealed windows without events
};

/**
 * @class WindowingEngine
 * @brief Fixed-cadence window builder
 *
 * Timestamps must be monotonic. An event older than the last accepted
 * event, or older than the open window's start, is rejected and logged;
 * it is never reordered into an earlier window.
 *
 * **Thread Safety**: NOT thread-safe. The detection pipeline serializes
 * Observe() and Advance() under its own lock.
 *
 * **Usage Example**:
 * @code
 * WindowingEngine engine(std::chrono::seconds(2), [](Window&& w) {
 *     std::cout << w.index << ": " << w.syscalls.size() << " calls\n";
 * });
 *
 * engine.Observe({Timestamp{0}, 1});
 * engine.Observe({std::chrono::seconds(3), 2});  // seals window 0
 * engine.Flush();                                 // seals window 1
 * @endcode
 */
class WindowingEngine {
public:
    /**
     * @brief Construct engine
     * @param duration Window length, must be positive
     * @param on_sealed Callback receiving sealed windows
     * @throws ConfigurationError if duration is not positive
     */
    WindowingEngine(std::chrono::nanoseconds duration, WindowCallback on_sealed);

    /**
     * @brief Fix the start of the first window
     *
     * Without an explicit origin the first accepted event defines it.
     * Ignored (with a warning) once windowing has started.
     *
     * @param origin Start of window 0
     */
    void SetOrigin(Timestamp origin);

    /**
     * @brief Append an event to the open window
     *
     * Seals every window that ends at or before the event's timestamp
     * first, including empty ones.
     *
     * @param event Captured syscall
     * @return false if the event was rejected as out of order
     */
    bool Observe(const SyscallEvent& event);

    /**
     * @brief Seal every window ending at or before @p now
     * @param now Current monotonic time
     * @return Number of windows sealed
     */
    std::size_t Advance(Timestamp now);

    /**
     * @brief Seal the open window even if its end has not been reached
     *
     * Tiling continues with the next window if more events arrive.
     *
     * @return Number of windows sealed (0 or 1)
     */
    std::size_t Flush();

    /**
     * @brief Bounds of the window currently accepting events
     */
    std::optional<WindowSpan> OpenWindow() const;

    std::chrono::nanoseconds GetDuration() const { return duration_; }

    const WindowingStatistics& GetStatistics() const { return statistics_; }

private:
    std::chrono::nanoseconds duration_;
    WindowCallback on_sealed_;
    WindowingStatistics statistics_;

    bool started_{false};             ///< Origin known
    bool open_{false};                ///< current_ accepts events
    Window current_;                  ///< Open window
    Timestamp next_start_{0};         ///< Start of the window opened next
    std::uint64_t next_index_{0};     ///< Index of the window opened next
    std::optional<Timestamp> last_timestamp_;  ///< Last accepted event time

    void OpenNext();
    void SealCurrent();
};

} // namespace core
} // namespace sysgram
