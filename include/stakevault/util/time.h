// STAKEVAULT - Time Utilities
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// Wall-clock source for the vault clock and the CLI, with a process-wide
// mock override used by tests and simulations.

#ifndef STAKEVAULT_UTIL_TIME_H
#define STAKEVAULT_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace stakevault {
namespace util {

using Seconds = std::chrono::seconds;

constexpr int64_t SECONDS_PER_HOUR = 3600;

/// Current Unix time in seconds, or the mock time while it is enabled
int64_t GetTime();

/// "2024-01-15T10:30:00Z"
std::string FormatISO8601(int64_t timestamp);

/// "1d 2h 3m 4s"; zero components are left out
std::string FormatDuration(Seconds duration);

// ============================================================================
// Mock Time
// ============================================================================

/// Route GetTime() to the mock value. An unset mock starts at the real time.
void EnableMockTime();
void DisableMockTime();
bool IsMockTimeEnabled();

/// Set the mock value; it takes effect once mock time is enabled
void SetMockTime(int64_t timestamp);

} // namespace util
} // namespace stakevault

#endif // STAKEVAULT_UTIL_TIME_H
