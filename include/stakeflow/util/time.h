// STAKEFLOW - Time Utilities
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License
//
// Provides the clock the staking engine reads:
// - Unix timestamps (seconds)
// - Mock time for tests and the simulator
// - Duration and date formatting for logs and reports

#ifndef STAKEFLOW_UTIL_TIME_H
#define STAKEFLOW_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace stakeflow {
namespace util {

using Seconds = std::chrono::seconds;
using SystemClock = std::chrono::system_clock;
using SystemTimePoint = std::chrono::system_clock::time_point;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Current Unix timestamp in seconds (mock time when enabled)
int64_t GetTime();

/// Convert Unix timestamp to system time point
SystemTimePoint FromUnixTime(int64_t timestamp);

// ============================================================================
// Formatting
// ============================================================================

/// ISO 8601 UTC ("2024-01-31T12:00:00Z")
std::string FormatISO8601(int64_t timestamp);

/// Compact duration ("10d 2h 3m 4s"); negative durations get a leading '-'
std::string FormatDuration(Seconds duration);

/// Parse a duration such as "90", "30s", "15m", "12h", "7d"
/// @throws std::invalid_argument on malformed input
Seconds ParseDuration(const std::string& str);

// ============================================================================
// Mock Time (for testing)
// ============================================================================

void EnableMockTime();
void DisableMockTime();
bool IsMockTimeEnabled();
void SetMockTime(int64_t timestamp);
void AdvanceMockTime(Seconds duration);
int64_t GetMockTime();

/// RAII helper: enables mock time at a fixed start and restores real time
class ScopedMockTime {
public:
    explicit ScopedMockTime(int64_t start) {
        EnableMockTime();
        SetMockTime(start);
    }
    ~ScopedMockTime() { DisableMockTime(); }

    ScopedMockTime(const ScopedMockTime&) = delete;
    ScopedMockTime& operator=(const ScopedMockTime&) = delete;

    void Advance(Seconds duration) { AdvanceMockTime(duration); }
    void Set(int64_t timestamp) { SetMockTime(timestamp); }
    int64_t Now() const { return GetMockTime(); }
};

} // namespace util
} // namespace stakeflow

#endif // STAKEFLOW_UTIL_TIME_H
