#pragma once

#include <cstdint>
#include <string_view>


namespace signalbox::core::protocol {

// ===============================================
// MESSAGE TYPE ENUM (value of the "type" field)
// ===============================================
enum class MessageType : uint8_t {
    StateUpdate,   // outbound only
    ColorChange,   // inbound request + outbound broadcast
    UserUpdate,    // outbound only
    Unknown
};

// Convert enum → string
[[nodiscard]] inline constexpr std::string_view to_string(MessageType t) noexcept {
    switch (t) {
        case MessageType::StateUpdate: return "state_update";
        case MessageType::ColorChange: return "color_change";
        case MessageType::UserUpdate:  return "user_update";
        default:                       return "unknown";
    }
}

// Convert string → enum
[[nodiscard]] inline constexpr MessageType to_message_type_enum(std::string_view s) noexcept {
    switch (s.size()) {
        case 11: // "user_update"
            if (s == "user_update") return MessageType::UserUpdate;
            break;
        case 12: // "state_update", "color_change"
            if (s[0] == 's' && s == "state_update") return MessageType::StateUpdate;
            if (s[0] == 'c' && s == "color_change") return MessageType::ColorChange;
            break;
    }
    return MessageType::Unknown;
}

} // namespace signalbox::core::protocol
