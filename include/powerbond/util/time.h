// POWERBOND - Time Utilities
// Copyright (c) 2024 POWERBOND Developers
// MIT License
//
// Provides time-related utilities:
// - Unix timestamps
// - ISO-8601 formatting and parsing
// - Mock time for testing

#ifndef POWERBOND_UTIL_TIME_H
#define POWERBOND_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace powerbond {
namespace util {

using Seconds = std::chrono::seconds;
using SystemClock = std::chrono::system_clock;

/// Seconds per day
constexpr int64_t SECONDS_PER_DAY = 86400;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Current Unix timestamp in seconds (mock time when enabled)
int64_t GetTime();

/// Current Unix timestamp in milliseconds (mock time when enabled)
int64_t GetTimeMillis();

// ============================================================================
// Formatting and Parsing
// ============================================================================

/// "YYYY-MM-DDTHH:MM:SSZ" (UTC)
std::string FormatISO8601(int64_t timestamp);

/// Parse "YYYY-MM-DDTHH:MM:SS[Z]" or "YYYY-MM-DD HH:MM:SS" as UTC
std::optional<int64_t> ParseISO8601(const std::string& str);

// ============================================================================
// Mock Time
// ============================================================================

/// Freeze GetTime() at the current mock time (initialised to now if unset)
void EnableMockTime();

/// Return to the system clock
void DisableMockTime();

bool IsMockTimeEnabled();

/// Set the mock clock (does not enable it)
void SetMockTime(int64_t timestamp);

/// Move the mock clock forward (or backward for negative durations)
void AdvanceMockTime(Seconds duration);

} // namespace util
} // namespace powerbond

#endif // POWERBOND_UTIL_TIME_H
