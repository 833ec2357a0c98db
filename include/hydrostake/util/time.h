// HYDROSTAKE - Time Utilities
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License
//
// Wall-clock access for the staking engine. All engine timestamps are read
// through GetTime() so tests and the simulator can drive a mock clock.

#ifndef HYDROSTAKE_UTIL_TIME_H
#define HYDROSTAKE_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace hydrostake {
namespace util {

// ============================================================================
// Type Aliases
// ============================================================================

using Seconds = std::chrono::seconds;
using Minutes = std::chrono::minutes;
using SystemClock = std::chrono::system_clock;
using SystemTimePoint = std::chrono::system_clock::time_point;

// ============================================================================
// Constants
// ============================================================================

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 3600;
constexpr int64_t SECONDS_PER_DAY = 86400;
constexpr int64_t SECONDS_PER_WEEK = 604800;
constexpr int64_t MINUTES_PER_YEAR = 525600;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Current Unix timestamp in seconds (mock time when enabled)
int64_t GetTime();

SystemTimePoint FromUnixTime(int64_t timestamp);
int64_t ToUnixTime(SystemTimePoint tp);

// ============================================================================
// Formatting
// ============================================================================

/// "2024-01-15T10:30:00Z"
std::string FormatISO8601(int64_t timestamp);

/// "6d 23h 59m 59s"; "0s" for zero, leading '-' for negatives
std::string FormatDuration(Seconds duration);

// ============================================================================
// Mock Time (for testing)
// ============================================================================

/// Freeze the clock. Starts from the real time unless SetMockTime was called.
void EnableMockTime();
void DisableMockTime();
bool IsMockTimeEnabled();

void SetMockTime(int64_t timestamp);
void AdvanceMockTime(Seconds duration);
int64_t GetMockTime();

} // namespace util
} // namespace hydrostake

#endif // HYDROSTAKE_UTIL_TIME_H
