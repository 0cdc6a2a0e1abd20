#pragma once

#include <string_view>

#include "signalbox/core/color.hpp"
#include "signalbox/core/protocol/enums/message_type.hpp"
#include "signalbox/core/protocol/parser/helpers.hpp"
#include "signalbox/core/protocol/parser/result.hpp"

#include <simdjson.h>


namespace signalbox::core::protocol::parser::adapter {

// ------------------------------------------------------------
// Type
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_type_required(const simdjson::dom::element& root, MessageType& out) noexcept {
    // Required string field
    std::string_view sv;
    auto r = helper::parse_string_required(root, "type", sv);
    if (r != Result::Ok) {
        return r;
    }
    // Convert to enum
    out = to_message_type_enum(sv);
    // Present but unknown type
    if (out == MessageType::Unknown) {
        return Result::InvalidValue;
    }
    return Result::Parsed;
}


// ------------------------------------------------------------
// Color
// ------------------------------------------------------------
// On InvalidValue, out is Color::Unknown.
[[nodiscard]]
inline Result parse_color_required(const simdjson::dom::element& root, Color& out) noexcept {
    std::string_view sv;
    auto r = helper::parse_string_required(root, "color", sv);
    if (r != Result::Ok) {
        return r;
    }
    out = to_color_enum(sv);
    if (out == Color::Unknown) {
        return Result::InvalidValue;
    }
    return Result::Parsed;
}

} // namespace signalbox::core::protocol::parser::adapter
