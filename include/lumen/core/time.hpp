#pragma once

/// @file time.hpp
/// @brief Injectable time source for ages, intervals and frame timing

#include "fwd.hpp"
#include <chrono>

namespace lumen_core {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = Clock::duration;
using Milliseconds = std::chrono::milliseconds;

/// Convert a duration to fractional milliseconds
[[nodiscard]] inline double to_millis(Duration d) noexcept {
    return std::chrono::duration<double, std::milli>(d).count();
}

// =============================================================================
// TimeSource
// =============================================================================

/// Interface for reading the current time
class TimeSource {
public:
    virtual ~TimeSource() = default;

    /// Current monotonic time
    [[nodiscard]] virtual TimePoint now() const = 0;
};

/// Time source backed by std::chrono::steady_clock
class SystemTimeSource : public TimeSource {
public:
    [[nodiscard]] TimePoint now() const override { return Clock::now(); }
};

// =============================================================================
// ManualTimeSource (Test Implementation)
// =============================================================================

/// Time source that only moves when told to
class ManualTimeSource : public TimeSource {
public:
    ManualTimeSource() : m_now(Clock::now()) {}
    explicit ManualTimeSource(TimePoint start) : m_now(start) {}

    [[nodiscard]] TimePoint now() const override { return m_now; }

    /// Move time forward
    void advance(Duration delta) { m_now += delta; }

    /// Jump to an absolute time
    void set(TimePoint t) { m_now = t; }

private:
    TimePoint m_now;
};

/// Process-wide steady clock source
[[nodiscard]] const TimeSource& system_time();

} // namespace lumen_core
