#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "signalbox/core/color.hpp"
#include "lcr/optional.hpp"


namespace signalbox::core {

// ===============================================================
// CONNECTION ID
// ===============================================================
//
// Assigned by the Coordinator at connect time. Strictly increasing for the
// lifetime of a Coordinator, so it doubles as the join sequence number:
// a smaller id always means an earlier join.
//
using ConnectionId = std::uint64_t;

inline constexpr ConnectionId INVALID_CONNECTION_ID = 0;


// ===============================================================
// OPERATION RESULTS
// ===============================================================

enum class SetColorResult : std::uint8_t {
    Applied,        // State updated and color_change broadcast
    NotController,  // Requester is not the current controller (or not registered)
    InvalidColor    // Requested value is not one of none/red/yellow/green
};

[[nodiscard]]
inline constexpr std::string_view to_string(SetColorResult r) noexcept {
    switch (r) {
        case SetColorResult::Applied:       return "Applied";
        case SetColorResult::NotController: return "NotController";
        case SetColorResult::InvalidColor:  return "InvalidColor";
        default:                            return "Unknown";
    }
}

enum class DisconnectResult : std::uint8_t {
    NotFound,   // Already gone: no-op
    Removed,    // Removed, controller unchanged (or registry now empty)
    Promoted    // Removed controller, a survivor was promoted
};

[[nodiscard]]
inline constexpr std::string_view to_string(DisconnectResult r) noexcept {
    switch (r) {
        case DisconnectResult::NotFound: return "NotFound";
        case DisconnectResult::Removed:  return "Removed";
        case DisconnectResult::Promoted: return "Promoted";
        default:                         return "Unknown";
    }
}


// ===============================================================
// OPERATION VIEWS
// ===============================================================

// Returned by Coordinator::connect()
struct ConnectResult {
    ConnectionId id{INVALID_CONNECTION_ID};
    bool is_controller{false};
    Color color{Color::None};
    lcr::optional<std::string> controller_identity{};
};

// Returned by Coordinator::status() (out-of-band poll)
struct StatusSnapshot {
    Color color{Color::None};
    std::size_t total_users{0};
    lcr::optional<std::string> controller_identity{};
};

} // namespace signalbox::core
