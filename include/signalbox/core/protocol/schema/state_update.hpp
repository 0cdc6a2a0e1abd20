#pragma once

#include <cstddef>
#include <string>
#include <cassert>

#include "signalbox/core/color.hpp"
#include "signalbox/core/timestamp.hpp"
#include "lcr/json.hpp"
#include "lcr/optional.hpp"

namespace signalbox::core {
namespace protocol {
namespace schema {

// ----------------------------------------------------------------------------
// state_update (outbound, unicast)
// ----------------------------------------------------------------------------
//
// Full snapshot for one connection: sent on join and whenever that
// connection's role is (re)asserted after a promotion.
//
// {"type":"state_update","color":"red","is_controller":true,
//  "controller_id":"alice","timestamp":"12:34:56"}
//
// PRECONDITION (write_json):
//   Caller must provide a buffer of at least max_json_size() bytes.
//   No bounds checking is performed.
//
struct StateUpdate {
    Color color{Color::None};
    bool is_controller{false};
    lcr::optional<std::string> controller_id{};
    Timestamp timestamp{};

public:
    [[nodiscard]]
    inline std::size_t max_json_size() const noexcept {
        // Fixed skeleton + worst-case color + escaped identity (quoted) + clock
        constexpr std::size_t skeleton = 96;
        const std::size_t identity = controller_id.has()
            ? lcr::json::escaped_max_size(controller_id.value()) + 2
            : 4;
        return skeleton + COLOR_MAX_LENGTH + identity + CLOCK_TEXT_SIZE;
    }

    [[nodiscard]]
    inline std::size_t write_json(char* buffer) const noexcept {
        using namespace lcr::json;
        std::size_t pos = 0;

        pos += write_literal(buffer + pos, "{\"type\":\"state_update\",\"color\":");
        pos += write_string(buffer + pos, to_string(color));

        pos += write_literal(buffer + pos, ",\"is_controller\":");
        pos += write_bool(buffer + pos, is_controller);

        pos += write_literal(buffer + pos, ",\"controller_id\":");
        pos += controller_id.has() ? write_string(buffer + pos, controller_id.value())
                                   : write_null(buffer + pos);

        pos += write_literal(buffer + pos, ",\"timestamp\":\"");
        pos += write_clock(buffer + pos, timestamp);
        buffer[pos++] = '"';

        buffer[pos++] = '}';

#ifndef NDEBUG
        assert(pos <= max_json_size());
#endif
        return pos;
    }
};

} // namespace schema
} // namespace protocol
} // namespace signalbox::core
