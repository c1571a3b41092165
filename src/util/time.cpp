// POWERBOND - Time Utilities Implementation
// Copyright (c) 2024 POWERBOND Developers
// MIT License

#include "powerbond/util/time.h"

#include <atomic>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace powerbond {
namespace util {

// ============================================================================
// Mock Time State
// ============================================================================

namespace {
    std::atomic<bool> g_mockTimeEnabled{false};
    std::atomic<int64_t> g_mockTime{0};
    std::mutex g_mockTimeMutex;
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

int64_t GetTimeMillis() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load() * 1000;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        SystemClock::now().time_since_epoch()).count();
}

// ============================================================================
// Formatting and Parsing
// ============================================================================

std::string FormatISO8601(int64_t timestamp) {
    std::time_t time = static_cast<std::time_t>(timestamp);
    std::tm tm_buf;
    gmtime_r(&time, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::optional<int64_t> ParseISO8601(const std::string& str) {
    std::tm tm_buf = {};

    std::istringstream iss(str);
    iss >> std::get_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        iss.clear();
        iss.str(str);
        tm_buf = {};
        iss >> std::get_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    }
    if (iss.fail()) {
        return std::nullopt;
    }

    // Only an optional trailing 'Z' may follow
    std::string rest;
    iss >> rest;
    if (!rest.empty() && rest != "Z") {
        return std::nullopt;
    }

    std::time_t time = timegm(&tm_buf);
    if (time == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return static_cast<int64_t>(time);
}

// ============================================================================
// Mock Time
// ============================================================================

void EnableMockTime() {
    std::lock_guard<std::mutex> lock(g_mockTimeMutex);
    if (g_mockTime.load() == 0) {
        g_mockTime.store(std::chrono::duration_cast<Seconds>(
            SystemClock::now().time_since_epoch()).count());
    }
    g_mockTimeEnabled.store(true);
}

void DisableMockTime() {
    std::lock_guard<std::mutex> lock(g_mockTimeMutex);
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

} // namespace util
} // namespace powerbond
