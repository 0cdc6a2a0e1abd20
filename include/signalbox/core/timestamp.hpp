#pragma once

#include <chrono>
#include <ctime>
#include <string>
#include <cstddef>

namespace signalbox::core {

// ============================================================================
// Timestamp type
// ============================================================================
using Timestamp = std::chrono::sys_time<std::chrono::nanoseconds>;

[[nodiscard]] inline Timestamp now() noexcept {
    return std::chrono::time_point_cast<std::chrono::nanoseconds>(std::chrono::system_clock::now());
}


// ============================================================================
// Wall-clock formatter (local time)
//
// Produces:
//   HH:MM:SS
//
// This is the timestamp shape carried by outbound messages.
// ============================================================================

inline constexpr std::size_t CLOCK_TEXT_SIZE = 8;

// Writes exactly CLOCK_TEXT_SIZE bytes (no terminator).
inline std::size_t write_clock(char* out, const Timestamp& ts) noexcept {
    const std::time_t t = std::chrono::system_clock::to_time_t(
        std::chrono::time_point_cast<std::chrono::system_clock::duration>(ts));
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    const int fields[3] = { tm.tm_hour, tm.tm_min, tm.tm_sec };
    std::size_t pos = 0;
    for (int i = 0; i < 3; ++i) {
        if (i > 0) {
            out[pos++] = ':';
        }
        out[pos++] = static_cast<char>('0' + fields[i] / 10);
        out[pos++] = static_cast<char>('0' + fields[i] % 10);
    }
    return pos;
}

[[nodiscard]] inline std::string to_clock_string(const Timestamp& ts) {
    char buf[CLOCK_TEXT_SIZE];
    return std::string(buf, write_clock(buf, ts));
}

} // namespace signalbox::core
