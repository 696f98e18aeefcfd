// STAKEFLOW - Time Utilities Implementation
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License

#include "stakeflow/util/time.h"

#include <atomic>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace stakeflow {
namespace util {

namespace {
    constexpr int64_t SECONDS_PER_MINUTE = 60;
    constexpr int64_t SECONDS_PER_HOUR = 3600;
    constexpr int64_t SECONDS_PER_DAY = 86400;

    std::atomic<bool> g_mockTimeEnabled{false};
    std::atomic<int64_t> g_mockTime{0};
}

// ============================================================================
// Unix Timestamps
// ============================================================================

int64_t GetTime() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load();
    }
    return std::chrono::duration_cast<Seconds>(
        SystemClock::now().time_since_epoch()).count();
}

SystemTimePoint FromUnixTime(int64_t timestamp) {
    return SystemTimePoint(Seconds(timestamp));
}

// ============================================================================
// Formatting
// ============================================================================

std::string FormatISO8601(int64_t timestamp) {
    std::time_t time = static_cast<std::time_t>(timestamp);
    std::tm tm_buf;
    gmtime_r(&time, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string FormatDuration(Seconds duration) {
    int64_t total = duration.count();
    if (total < 0) {
        return "-" + FormatDuration(Seconds{-total});
    }
    if (total == 0) {
        return "0s";
    }

    int64_t days = total / SECONDS_PER_DAY;
    total %= SECONDS_PER_DAY;
    int64_t hours = total / SECONDS_PER_HOUR;
    total %= SECONDS_PER_HOUR;
    int64_t minutes = total / SECONDS_PER_MINUTE;
    int64_t seconds = total % SECONDS_PER_MINUTE;

    std::ostringstream oss;
    const char* sep = "";
    if (days > 0)    { oss << sep << days << "d";    sep = " "; }
    if (hours > 0)   { oss << sep << hours << "h";   sep = " "; }
    if (minutes > 0) { oss << sep << minutes << "m"; sep = " "; }
    if (seconds > 0) { oss << sep << seconds << "s"; }
    return oss.str();
}

Seconds ParseDuration(const std::string& str) {
    if (str.empty()) {
        throw std::invalid_argument("Empty duration");
    }

    size_t digits = 0;
    while (digits < str.size() && std::isdigit(static_cast<unsigned char>(str[digits]))) {
        ++digits;
    }
    if (digits == 0 || str.size() - digits > 1) {
        throw std::invalid_argument("Invalid duration: '" + str + "'");
    }

    int64_t value = std::stoll(str.substr(0, digits));
    char unit = digits < str.size() ? str[digits] : 's';
    switch (unit) {
        case 's': return Seconds(value);
        case 'm': return Seconds(value * SECONDS_PER_MINUTE);
        case 'h': return Seconds(value * SECONDS_PER_HOUR);
        case 'd': return Seconds(value * SECONDS_PER_DAY);
        default:
            throw std::invalid_argument("Unknown duration unit in '" + str + "'");
    }
}

// ============================================================================
// Mock Time
// ============================================================================

void EnableMockTime() {
    if (!g_mockTimeEnabled.exchange(true) && g_mockTime.load() == 0) {
        g_mockTime.store(std::chrono::duration_cast<Seconds>(
            SystemClock::now().time_since_epoch()).count());
    }
}

void DisableMockTime() {
    g_mockTimeEnabled.store(false);
}

bool IsMockTimeEnabled() {
    return g_mockTimeEnabled.load();
}

void SetMockTime(int64_t timestamp) {
    g_mockTime.store(timestamp);
}

void AdvanceMockTime(Seconds duration) {
    g_mockTime.fetch_add(duration.count());
}

int64_t GetMockTime() {
    return g_mockTime.load();
}

} // namespace util
} // namespace stakeflow
