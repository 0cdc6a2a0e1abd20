#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <cassert>

#include "signalbox/core/color.hpp"
#include "signalbox/core/types.hpp"
#include "lcr/json.hpp"
#include "lcr/optional.hpp"

namespace signalbox::core {
namespace protocol {
namespace schema {

// ----------------------------------------------------------------------------
// Status (out-of-band poll response)
// ----------------------------------------------------------------------------
//
// {"current_color":"red","total_users":2,"controller_id":"alice"}
//
// Stateless read: no "type" field, served by the polling endpoint.
//
struct Status {
    Color current_color{Color::None};
    std::uint64_t total_users{0};
    lcr::optional<std::string> controller_id{};

    Status() = default;

    explicit Status(const StatusSnapshot& snapshot)
        : current_color(snapshot.color)
        , total_users(snapshot.total_users)
        , controller_id(snapshot.controller_identity)
    {}

public:
    [[nodiscard]]
    inline std::size_t max_json_size() const noexcept {
        constexpr std::size_t skeleton = 80;
        const std::size_t identity = controller_id.has()
            ? lcr::json::escaped_max_size(controller_id.value()) + 2
            : 4;
        return skeleton + COLOR_MAX_LENGTH + identity;
    }

    [[nodiscard]]
    inline std::size_t write_json(char* buffer) const noexcept {
        using namespace lcr::json;
        std::size_t pos = 0;

        pos += write_literal(buffer + pos, "{\"current_color\":");
        pos += write_string(buffer + pos, to_string(current_color));

        pos += write_literal(buffer + pos, ",\"total_users\":");
        pos += append(buffer + pos, total_users);

        pos += write_literal(buffer + pos, ",\"controller_id\":");
        pos += controller_id.has() ? write_string(buffer + pos, controller_id.value())
                                   : write_null(buffer + pos);

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
