// HYDROSTAKE - Time Utilities Implementation
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License

#include "hydrostake/util/time.h"

#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace hydrostake {
namespace util {

namespace {

/// Process-wide clock override; the engine and tests share one instance
struct MockClock {
    std::mutex mutex;
    bool enabled{false};
    int64_t now{0};
};

MockClock& Clock() {
    static MockClock clock;
    return clock;
}

int64_t WallClockSeconds() {
    return std::chrono::duration_cast<Seconds>(
        SystemClock::now().time_since_epoch()).count();
}

struct DurationUnit {
    int64_t seconds;
    char suffix;
};

constexpr DurationUnit DURATION_UNITS[] = {
    {SECONDS_PER_DAY, 'd'},
    {SECONDS_PER_HOUR, 'h'},
    {SECONDS_PER_MINUTE, 'm'},
    {1, 's'},
};

} // namespace

// ============================================================================
// Unix Timestamps
// ============================================================================

int64_t GetTime() {
    MockClock& clock = Clock();
    {
        std::lock_guard<std::mutex> lock(clock.mutex);
        if (clock.enabled) {
            return clock.now;
        }
    }
    return WallClockSeconds();
}

SystemTimePoint FromUnixTime(int64_t timestamp) {
    return SystemTimePoint(Seconds(timestamp));
}

int64_t ToUnixTime(SystemTimePoint tp) {
    return std::chrono::duration_cast<Seconds>(tp.time_since_epoch()).count();
}

// ============================================================================
// Formatting
// ============================================================================

std::string FormatISO8601(int64_t timestamp) {
    const std::time_t raw = static_cast<std::time_t>(timestamp);
    std::tm utc{};
    gmtime_r(&raw, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

std::string FormatDuration(Seconds duration) {
    int64_t remaining = duration.count();
    if (remaining == 0) {
        return "0s";
    }

    std::string out;
    if (remaining < 0) {
        out = "-";
        remaining = -remaining;
    }

    bool first = true;
    for (const DurationUnit& unit : DURATION_UNITS) {
        const int64_t count = remaining / unit.seconds;
        remaining %= unit.seconds;
        if (count == 0) {
            continue;
        }
        if (!first) {
            out += ' ';
        }
        out += std::to_string(count);
        out += unit.suffix;
        first = false;
    }
    return out;
}

// ============================================================================
// Mock Time
// ============================================================================

void EnableMockTime() {
    MockClock& clock = Clock();
    std::lock_guard<std::mutex> lock(clock.mutex);
    if (clock.now == 0) {
        clock.now = WallClockSeconds();
    }
    clock.enabled = true;
}

void DisableMockTime() {
    MockClock& clock = Clock();
    std::lock_guard<std::mutex> lock(clock.mutex);
    clock.enabled = false;
}

bool IsMockTimeEnabled() {
    MockClock& clock = Clock();
    std::lock_guard<std::mutex> lock(clock.mutex);
    return clock.enabled;
}

void SetMockTime(int64_t timestamp) {
    MockClock& clock = Clock();
    std::lock_guard<std::mutex> lock(clock.mutex);
    clock.now = timestamp;
}

void AdvanceMockTime(Seconds duration) {
    MockClock& clock = Clock();
    std::lock_guard<std::mutex> lock(clock.mutex);
    clock.now += duration.count();
}

int64_t GetMockTime() {
    MockClock& clock = Clock();
    std::lock_guard<std::mutex> lock(clock.mutex);
    return clock.now;
}

} // namespace util
} // namespace hydrostake
