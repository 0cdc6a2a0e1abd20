#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <cassert>

#include "lcr/json.hpp"
#include "lcr/optional.hpp"

namespace signalbox::core {
namespace protocol {
namespace schema {

// ----------------------------------------------------------------------------
// user_update (outbound, broadcast on every membership change)
// ----------------------------------------------------------------------------
//
// {"type":"user_update","total_users":3,"controller_id":"alice"}
//
struct UserUpdate {
    std::uint64_t total_users{0};
    lcr::optional<std::string> controller_id{};

public:
    [[nodiscard]]
    inline std::size_t max_json_size() const noexcept {
        constexpr std::size_t skeleton = 80;   // keys, braces, 20-digit count
        const std::size_t identity = controller_id.has()
            ? lcr::json::escaped_max_size(controller_id.value()) + 2
            : 4;
        return skeleton + identity;
    }

    [[nodiscard]]
    inline std::size_t write_json(char* buffer) const noexcept {
        using namespace lcr::json;
        std::size_t pos = 0;

        pos += write_literal(buffer + pos, "{\"type\":\"user_update\",\"total_users\":");
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
