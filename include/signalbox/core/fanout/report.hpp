#pragma once

#include <vector>
#include <cstddef>

#include "signalbox/core/types.hpp"
#include "signalbox/core/transport/error.hpp"


namespace signalbox::core::fanout {

// Result of one send inside a fan-out
struct Outcome {
    ConnectionId id{INVALID_CONNECTION_ID};
    transport::Error error{transport::Error::None};

    [[nodiscard]]
    inline bool delivered() const noexcept {
        return error == transport::Error::None;
    }
};

// Aggregated result of a fan-out (one Outcome per attempted send, in send order)
struct Report {
    std::size_t attempted{0};
    std::size_t delivered{0};
    std::vector<Outcome> outcomes;

    [[nodiscard]]
    inline std::size_t failed() const noexcept {
        return attempted - delivered;
    }
};

} // namespace signalbox::core::fanout
