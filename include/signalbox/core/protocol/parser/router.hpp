#pragma once

#include <string_view>

#include <simdjson.h>

#include "signalbox/core/protocol/enums/message_type.hpp"
#include "signalbox/core/protocol/schema/color_request.hpp"
#include "signalbox/core/protocol/parser/adapters.hpp"
#include "signalbox/core/protocol/parser/helpers.hpp"
#include "signalbox/core/protocol/parser/result.hpp"
#include "lcr/log/logger.hpp"


namespace signalbox::core {
namespace protocol {
namespace parser {

/*
================================================================================
Inbound Parsing Architecture
================================================================================

Three layers, each with a single job:

1) Router (this file)
   • Parses the raw frame once (simdjson DOM)
   • Dispatches on the "type" field
   • Logs rejected frames with actionable diagnostics

2) Adapters
   • Convert primitive fields into domain types (MessageType, Color)
   • Distinguish invalid schema from invalid values

3) Helpers
   • Enforce JSON structure, never log, never allocate

The only inbound request is color_change. Anything else that is a valid JSON
object is Ignored; clients may send types this server does not know about.

One Router per connection: a simdjson parser is not thread-safe, and it keeps
its internal buffers across frames.

================================================================================
*/

class Router {
public:
    Router() = default;

    // Main entry point
    //
    // Returns:
    //   Parsed        -> out holds a valid request
    //   InvalidValue  -> color_change with an unknown color (out.color == Unknown)
    //   Ignored       -> well-formed frame that is not an inbound request
    //   InvalidJson / InvalidSchema -> malformed frame
    [[nodiscard]]
    inline Result parse(std::string_view raw_msg, schema::ColorRequest& out) noexcept {
        out.color = Color::Unknown;
        // Parse JSON message
        simdjson::dom::element root;
        auto error = parser_.parse(raw_msg.data(), raw_msg.size()).get(root);
        if (error) {
            SB_WARN("[PARSER] JSON parse error: " << error << " in message: " << raw_msg);
            return Result::InvalidJson;
        }
        if (helper::require_object(root) != Result::Ok) {
            SB_WARN("[PARSER] Message is not a JSON object -> ignore message: " << raw_msg);
            return Result::InvalidSchema;
        }
        // TYPE DISPATCH
        MessageType type = MessageType::Unknown;
        auto r = adapter::parse_type_required(root, type);
        if (r == Result::InvalidSchema) {
            SB_WARN("[PARSER] Field 'type' missing or invalid -> ignore message: " << raw_msg);
            return Result::InvalidSchema;
        }
        switch (type) {
            case MessageType::ColorChange:
                return parse_color_change_(root, out);
            default:
                SB_DEBUG("[PARSER] Unhandled message type '" << to_string(type) << "' -> ignore message.");
                return Result::Ignored;
        }
    }

private:
    // Underlying simdjson parser
    simdjson::dom::parser parser_;

private:
    [[nodiscard]]
    inline Result parse_color_change_(const simdjson::dom::element& root, schema::ColorRequest& out) noexcept {
        Color color = Color::Unknown;
        auto r = adapter::parse_color_required(root, color);
        if (r == Result::InvalidSchema) {
            SB_WARN("[PARSER] Field 'color' missing or invalid in 'color_change' message -> ignore message.");
            return r;
        }
        out.color = color;
        if (r == Result::InvalidValue) {
            SB_DEBUG("[PARSER] Unrecognised color in 'color_change' message.");
        }
        return r;
    }
};

} // namespace parser
} // namespace protocol
} // namespace signalbox::core
