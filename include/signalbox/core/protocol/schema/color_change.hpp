#pragma once

#include <cstddef>
#include <cassert>

#include "signalbox/core/color.hpp"
#include "signalbox/core/timestamp.hpp"
#include "lcr/json.hpp"

namespace signalbox::core {
namespace protocol {
namespace schema {

// ----------------------------------------------------------------------------
// color_change (outbound, broadcast)
// ----------------------------------------------------------------------------
//
// {"type":"color_change","color":"green","timestamp":"12:34:56"}
//
struct ColorChange {
    Color color{Color::None};
    Timestamp timestamp{};

public:
    [[nodiscard]]
    static constexpr std::size_t max_json_size() noexcept {
        // {"type":"color_change","color":"unknown","timestamp":"HH:MM:SS"}  = 64
        return 80;
    }

    [[nodiscard]]
    inline std::size_t write_json(char* buffer) const noexcept {
        using namespace lcr::json;
        std::size_t pos = 0;

        pos += write_literal(buffer + pos, "{\"type\":\"color_change\",\"color\":");
        pos += write_string(buffer + pos, to_string(color));

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
