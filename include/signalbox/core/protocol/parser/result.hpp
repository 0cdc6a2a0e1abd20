#pragma once

#include <cstdint>
#include <string_view>


namespace signalbox::core::protocol::parser {

// ===============================================
// PARSER RESULT ENUM
// ===============================================
enum class Result : std::uint8_t {
    Ok             = 0,            // Helper-level success (structure is valid)
    Ignored        = 1,            // Valid JSON object, but not an inbound request we handle
    InvalidJson    = 2,            // Structural failure
    InvalidSchema  = 3,            // Missing required field, type mismatch, etc.
    InvalidValue   = 4,            // Field present but semantically invalid (e.g. unknown color)
    Parsed         = 5             // Parsed successfully
};

// -----------------------------------------------------------------------------
// Convert enum → string (for logging / diagnostics)
// -----------------------------------------------------------------------------
[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Ok:             return "Ok";
        case Result::Ignored:        return "Ignored";
        case Result::InvalidJson:    return "InvalidJson";
        case Result::InvalidSchema:  return "InvalidSchema";
        case Result::InvalidValue:   return "InvalidValue";
        case Result::Parsed:         return "Parsed";
        default:                     return "unknown";
    }
}

} // namespace signalbox::core::protocol::parser
