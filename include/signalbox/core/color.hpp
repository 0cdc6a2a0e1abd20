#pragma once

#include <cstdint>
#include <cstddef>
#include <string_view>


namespace signalbox::core {

// ===============================================
// SIGNAL COLOR ENUM
// ===============================================
//
// The shared lamp state. Any valid color may follow any other.
// Unknown is never stored: it only marks an unrecognised wire value.
//
enum class Color : uint8_t {
    None,
    Red,
    Yellow,
    Green,
    Unknown
};

// Convert enum → string (wire spelling)
[[nodiscard]] inline constexpr std::string_view to_string(Color c) noexcept {
    switch (c) {
        case Color::None:   return "none";
        case Color::Red:    return "red";
        case Color::Yellow: return "yellow";
        case Color::Green:  return "green";
        default:            return "unknown";
    }
}

// Convert string → enum (exact, case-sensitive match)
[[nodiscard]] inline constexpr Color to_color_enum(std::string_view s) noexcept {
    switch (s.size()) {
        case 3: // "red"
            if (s == "red") return Color::Red;
            break;
        case 4: // "none"
            if (s == "none") return Color::None;
            break;
        case 5: // "green"
            if (s == "green") return Color::Green;
            break;
        case 6: // "yellow"
            if (s == "yellow") return Color::Yellow;
            break;
    }
    return Color::Unknown;
}

[[nodiscard]] inline constexpr bool is_valid(Color c) noexcept {
    return c == Color::None
        || c == Color::Red
        || c == Color::Yellow
        || c == Color::Green
    ;
}

// Longest wire spelling ("yellow", "unknown" included for logging)
inline constexpr std::size_t COLOR_MAX_LENGTH = 7;

} // namespace signalbox::core
