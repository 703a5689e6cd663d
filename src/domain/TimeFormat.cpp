/**
 * @file TimeFormat.cpp
 * @brief Implementation of the time stamp helpers.
 */

#include "domain/TimeFormat.hpp"
#include "domain/ScanSession.hpp"
#include <atomic>
#include <chrono>

namespace bacnetinventory::domain {

namespace {

std::string Format(std::time_t tt, const char* pattern) {
    std::tm tm = ToLocalTime(tt);
    char buffer[32];
    if (std::strftime(buffer, sizeof(buffer), pattern, &tm) == 0) {
        return "";
    }
    return buffer;
}

} // namespace

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

std::string FormatRunStamp(std::time_t tt) {
    return Format(tt, "%Y%m%d_%H%M%S");
}

std::string FormatDay(std::time_t tt) {
    return Format(tt, "%Y-%m-%d");
}

std::string FormatDateTime(std::time_t tt) {
    return Format(tt, "%Y-%m-%d %H:%M:%S");
}

std::string NewSessionId() {
    static std::atomic<int> counter{0};
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    return FormatRunStamp(now) + "-" + std::to_string(++counter);
}

} // namespace bacnetinventory::domain
