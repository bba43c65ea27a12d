// DADBS - Time Utilities Implementation
// Copyright (c) 2024 DADBS Developers
// MIT License

#include <dadbs/util/time.h>

#include <atomic>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <thread>

namespace dadbs {
namespace util {

// ============================================================================
// Mock Time State
// ============================================================================

namespace {
    std::atomic<bool> g_mockTimeEnabled{false};
    std::atomic<int64_t> g_mockTimeMillis{0};
    std::mutex g_mockTimeMutex;

    int64_t RealTimeMillis() {
        return std::chrono::duration_cast<Milliseconds>(
            SystemClock::now().time_since_epoch()).count();
    }
}

// ============================================================================
// Unix Timestamps
// ============================================================================

int64_t GetTime() {
    return GetTimeMillis() / MILLIS_PER_SECOND;
}

int64_t GetTimeMillis() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTimeMillis.load();
    }
    return RealTimeMillis();
}

// ============================================================================
// Mock Time
// ============================================================================

void EnableMockTime() {
    std::lock_guard<std::mutex> lock(g_mockTimeMutex);
    if (g_mockTimeMillis.load() == 0) {
        g_mockTimeMillis.store(RealTimeMillis());
    }
    g_mockTimeEnabled.store(true);
}

void DisableMockTime() {
    std::lock_guard<std::mutex> lock(g_mockTimeMutex);
    g_mockTimeEnabled.store(false);
    g_mockTimeMillis.store(0);
}

bool IsMockTimeEnabled() {
    return g_mockTimeEnabled.load();
}

void SetMockTimeMillis(int64_t timestampMs) {
    g_mockTimeMillis.store(timestampMs);
}

void AdvanceMockTime(Milliseconds duration) {
    g_mockTimeMillis.fetch_add(duration.count());
}

// ============================================================================
// Formatting
// ============================================================================

std::string FormatDurationMillis(Milliseconds duration) {
    int64_t total = duration.count();
    bool negative = total < 0;
    if (negative) {
        total = -total;
    }

    std::ostringstream oss;
    if (negative) {
        oss << "-";
    }

    if (total < MILLIS_PER_SECOND) {
        oss << total << "ms";
        return oss.str();
    }

    int64_t minutes = total / 60000;
    int64_t seconds = (total / MILLIS_PER_SECOND) % 60;
    int64_t millis = total % MILLIS_PER_SECOND;

    if (minutes > 0) {
        oss << minutes << "m ";
    }
    oss << seconds << "." << std::setfill('0') << std::setw(3) << millis << "s";
    return oss.str();
}

// ============================================================================
// Timer Implementation
// ============================================================================

Timer::Timer() : start_(SteadyClock::now()) {}

void Timer::Reset() {
    start_ = SteadyClock::now();
}

int64_t Timer::ElapsedMillis() const {
    return std::chrono::duration_cast<Milliseconds>(Elapsed()).count();
}

Nanoseconds Timer::Elapsed() const {
    return std::chrono::duration_cast<Nanoseconds>(SteadyClock::now() - start_);
}

// ============================================================================
// DeadlineTimer Implementation
// ============================================================================

DeadlineTimer::DeadlineTimer(Milliseconds timeout)
    : deadline_(SteadyClock::now() + timeout) {}

DeadlineTimer::DeadlineTimer(SteadyTimePoint deadline)
    : deadline_(deadline) {}

bool DeadlineTimer::IsExpired() const {
    return SteadyClock::now() >= deadline_;
}

Milliseconds DeadlineTimer::Remaining() const {
    auto now = SteadyClock::now();
    if (now >= deadline_) {
        return Milliseconds{0};
    }
    return std::chrono::duration_cast<Milliseconds>(deadline_ - now);
}

// ============================================================================
// Sleep Functions
// ============================================================================

void SleepMillis(int64_t milliseconds) {
    if (milliseconds > 0) {
        std::this_thread::sleep_for(Milliseconds(milliseconds));
    }
}

} // namespace util
} // namespace dadbs
