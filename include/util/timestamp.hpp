#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <ratio>
#include <sstream>
#include <string>

namespace ts::util {

// 100ns units since 0001-01-01T00:00:00Z, the persisted checkpoint encoding.
using Ticks = std::chrono::duration<std::int64_t, std::ratio<1, 10'000'000>>;

inline constexpr std::int64_t UNIX_EPOCH_TICKS = 621'355'968'000'000'000;

inline std::int64_t toTicks(const std::chrono::system_clock::time_point tp) {
    return std::chrono::floor<Ticks>(tp.time_since_epoch()).count() + UNIX_EPOCH_TICKS;
}

inline std::chrono::system_clock::time_point fromTicks(const std::int64_t ticks) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(Ticks(ticks - UNIX_EPOCH_TICKS)));
}

inline std::chrono::system_clock::time_point toSys(const std::filesystem::file_time_type ft) {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(std::chrono::file_clock::to_sys(ft));
}

inline std::filesystem::file_time_type toFileTime(const std::chrono::system_clock::time_point tp) {
    return std::chrono::time_point_cast<std::filesystem::file_time_type::duration>(std::chrono::file_clock::from_sys(tp));
}

inline std::string timestampToString(const std::time_t ts) {
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&ts), "%Y-%m-%dT%H:%M:%SZ"); // ISO 8601 UTC
    return oss.str();
}

inline std::string timestampToString(const std::chrono::system_clock::time_point tp) {
    return timestampToString(std::chrono::system_clock::to_time_t(tp));
}

} // namespace ts::util
