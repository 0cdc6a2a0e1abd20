#pragma once

#include <string_view>

namespace signalbox::core {
namespace transport {

/*
===============================================================================
 transport::Error
===============================================================================

Outcome of a single outbound send, as reported by a transport session.

This enum represents *semantic send failures*, abstracted away from the
framework that actually owns the socket (Beast, uWebSockets, a test mock...).

It is intentionally:
- small
- stable
- policy-free

The Coordinator never interprets these beyond "delivered or not": the
configured fan-out policy decides what a failure means for membership.
===============================================================================
*/

enum class Error {
    None = 0,

    // --- Expected / benign termination --------------------------------------
    Closed,           // Session already closed (locally or by the peer)

    // --- Transient failures -------------------------------------------------
    Backpressure,     // Outbound queue full: frame dropped instead of blocking
    Timeout,          // Transport gave up on a stalled write

    // --- Fatal / unspecified transport failure ------------------------------
    TransportFailure, // Unclassified transport failure
};


/// Optional helper for logging / diagnostics
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:              return "None";
    case Error::Closed:            return "Closed";
    case Error::Backpressure:      return "Backpressure";
    case Error::Timeout:           return "Timeout";
    case Error::TransportFailure:  return "TransportFailure";
    default:                       return "Unknown";
    }
}

} // namespace transport
} // namespace signalbox::core
