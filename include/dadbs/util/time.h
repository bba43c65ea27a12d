// DADBS - Time Utilities
// Copyright (c) 2024 DADBS Developers
// MIT License
//
// Wall-clock timestamps (with a mock clock for tests), elapsed-time
// measurement and deadlines for bounded waits.

#ifndef DADBS_UTIL_TIME_H
#define DADBS_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace dadbs {
namespace util {

// ============================================================================
// Type Aliases
// ============================================================================

using Seconds = std::chrono::seconds;
using Milliseconds = std::chrono::milliseconds;
using Nanoseconds = std::chrono::nanoseconds;

using SystemClock = std::chrono::system_clock;
using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = std::chrono::steady_clock::time_point;

constexpr int64_t MILLIS_PER_SECOND = 1000;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Current Unix timestamp in seconds (honours mock time)
int64_t GetTime();

/// Current Unix timestamp in milliseconds (honours mock time)
int64_t GetTimeMillis();

// ============================================================================
// Mock Time (for testing)
// ============================================================================

/// Freeze wall-clock readings; starts from the real time unless already set
void EnableMockTime();

void DisableMockTime();

bool IsMockTimeEnabled();

/// Set the mock clock, in Unix milliseconds
void SetMockTimeMillis(int64_t timestampMs);

void AdvanceMockTime(Milliseconds duration);

// ============================================================================
// Formatting
// ============================================================================

/// Human-readable duration, e.g. "1m 5.250s" or "340ms"
std::string FormatDurationMillis(Milliseconds duration);

// ============================================================================
// Timer
// ============================================================================

/// Monotonic stopwatch, started on construction
class Timer {
public:
    Timer();

    void Reset();

    int64_t ElapsedMillis() const;

    Nanoseconds Elapsed() const;

private:
    SteadyTimePoint start_;
};

// ============================================================================
// Deadline Timer
// ============================================================================

/// Tracks the time left until a fixed point on the steady clock
class DeadlineTimer {
public:
    explicit DeadlineTimer(Milliseconds timeout);

    explicit DeadlineTimer(SteadyTimePoint deadline);

    bool IsExpired() const;

    /// Time until the deadline, zero once expired
    Milliseconds Remaining() const;

    SteadyTimePoint GetDeadline() const { return deadline_; }

private:
    SteadyTimePoint deadline_;
};

// ============================================================================
// Sleep Functions
// ============================================================================

void SleepMillis(int64_t milliseconds);

} // namespace util
} // namespace dadbs

#endif // DADBS_UTIL_TIME_H
