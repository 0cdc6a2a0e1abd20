/*
===============================================================================
SessionConcept (Push-Based Outbound Capability)
===============================================================================

Defines the minimal contract a transport session must satisfy to be
registered with the Coordinator.

The transport session:

  • Owns its socket and framing (WebSocket, TCP, in-process pipe...)
  • Accepts complete text frames through send()
  • Never blocks indefinitely inside send(): a frame that cannot be queued
    is reported as a failure, not waited on
  • Reports inbound frames and closure through its own loop, feeding
    session::Lease

No callbacks into the Coordinator from inside send().
No dynamic dispatch.

-------------------------------------------------------------------------------
Threading Model
-------------------------------------------------------------------------------

send() may be called from any thread that drives a Coordinator operation,
but never concurrently for the same session: the Coordinator serializes
fan-out.

-------------------------------------------------------------------------------
Ownership Model
-------------------------------------------------------------------------------

Sessions are held through std::shared_ptr. The Coordinator keeps one
reference while the connection is registered; a fan-out in flight keeps its
own reference, so a concurrent disconnect never destroys a session mid-send.

===============================================================================
*/
#pragma once

#include <string_view>
#include <concepts>

#include "signalbox/core/transport/error.hpp"


namespace signalbox::core::transport {

template<class S>
concept SessionConcept =
    requires(S s, std::string_view frame)
{
    // ---------------------------------------------------------------------
    // Sending
    // ---------------------------------------------------------------------

    { s.send(frame) } noexcept -> std::same_as<Error>;
};

} // namespace signalbox::core::transport
