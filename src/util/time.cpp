// STAKEVAULT - Time Utilities Implementation
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include "stakevault/util/time.h"

#include <atomic>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace stakevault {
namespace util {

namespace {

std::atomic<bool> g_mockEnabled{false};
std::atomic<int64_t> g_mockTime{0};
std::mutex g_mockMutex;

int64_t WallClock() {
    return std::chrono::duration_cast<Seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

struct DurationUnit {
    int64_t seconds;
    char suffix;
};

constexpr DurationUnit DURATION_UNITS[] = {
    {24 * SECONDS_PER_HOUR, 'd'},
    {SECONDS_PER_HOUR, 'h'},
    {60, 'm'},
    {1, 's'},
};

} // namespace

int64_t GetTime() {
    return g_mockEnabled.load() ? g_mockTime.load() : WallClock();
}

std::string FormatISO8601(int64_t timestamp) {
    std::time_t time = static_cast<std::time_t>(timestamp);
    std::tm utc;
    gmtime_r(&time, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
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
    for (const auto& unit : DURATION_UNITS) {
        int64_t count = remaining / unit.seconds;
        remaining %= unit.seconds;
        if (count == 0) {
            continue;
        }
        if (!first) {
            out += ' ';
        }
        out += std::to_string(count) + unit.suffix;
        first = false;
    }
    return out;
}

void EnableMockTime() {
    std::lock_guard<std::mutex> lock(g_mockMutex);
    if (g_mockTime.load() == 0) {
        g_mockTime.store(WallClock());
    }
    g_mockEnabled.store(true);
}

void DisableMockTime() {
    std::lock_guard<std::mutex> lock(g_mockMutex);
    g_mockEnabled.store(false);
}

bool IsMockTimeEnabled() {
    return g_mockEnabled.load();
}

void SetMockTime(int64_t timestamp) {
    g_mockTime.store(timestamp);
}

} // namespace util
} // namespace stakevault
