#pragma once

/*
================================================================================
signalbox Core - Shared Signal Coordination
================================================================================

This file is the entry point for the coordination core:

    signalbox::core::Coordinator
    signalbox::core::session::Lease

One lamp (none | red | yellow | green), many observers, exactly one
controller at a time.

-------------------------------------------------------------------------------
Integration Model
-------------------------------------------------------------------------------

The core owns no sockets and no threads. A transport layer (WebSocket
server, test harness, console driver) integrates through two types:

  1. A Session type satisfying transport::SessionConcept
       Error send(std::string_view frame) noexcept;

  2. One session::Lease per accepted connection
       construct      -> connect (role election + snapshot + user_update)
       on_message()   -> inbound color_change requests
       close()/~Lease -> disconnect (promotion + role correction + user_update)

The transport may drive leases from as many threads as it likes; the
Coordinator serializes state changes and orders fan-out internally.

-------------------------------------------------------------------------------
Out-of-band reads
-------------------------------------------------------------------------------

Coordinator::status() returns the data served by a polling endpoint;
protocol::schema::Status renders it as JSON.

================================================================================
*/

#include "signalbox/core/types.hpp"
#include "signalbox/core/color.hpp"
#include "signalbox/core/coordinator.hpp"
#include "signalbox/core/session/lease.hpp"
#include "signalbox/core/policy/fanout.hpp"
#include "signalbox/core/protocol/schema/status.hpp"
#include "signalbox/core/telemetry/coordinator.hpp"
