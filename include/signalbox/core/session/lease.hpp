#pragma once

#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include "signalbox/core/types.hpp"
#include "signalbox/core/protocol/parser/router.hpp"
#include "signalbox/core/protocol/parser/result.hpp"
#include "signalbox/core/protocol/schema/color_request.hpp"
#include "lcr/optional.hpp"
#include "lcr/log/logger.hpp"


namespace signalbox::core::session {

/*
===============================================================================
 signalbox::core::session::Lease
===============================================================================

Binds one transport session to a Coordinator for the session's lifetime.

The transport layer creates a Lease when a party arrives, feeds it every
inbound text frame, and drops it on teardown. That is the whole integration
surface.

-------------------------------------------------------------------------------
 Guarantees
-------------------------------------------------------------------------------
- Construction registers the session (Coordinator::connect)
- disconnect is issued exactly once: by close(), or by the destructor,
  including during stack unwinding of the transport's session loop
- A moved-from Lease owns nothing and never disconnects
- Inbound frames are parsed with a per-lease parser (no shared parser state)

-------------------------------------------------------------------------------
 Usage
-------------------------------------------------------------------------------

    session::Lease lease{coordinator, ws_session, user_id};
    while (ws_session->read(frame)) {
        (void)lease.on_message(frame);
    }
    // lease destroyed -> disconnect

===============================================================================
*/

// Outcome of one inbound frame
struct Inbound {
    protocol::parser::Result parse{protocol::parser::Result::Ignored};
    lcr::optional<SetColorResult> outcome{};   // set when the frame reached set_color()
};

template <typename Coordinator>
class Lease {
public:
    using session_ptr = typename Coordinator::session_ptr;

public:
    Lease(Coordinator& coordinator, session_ptr session, std::string identity)
        : coordinator_(&coordinator)
        , joined_(coordinator.connect(std::move(session), std::move(identity)))
        , open_(true)
    {
        SB_DEBUG("[LEASE] Opened lease for connection #" << joined_.id);
    }

    ~Lease() {
        close();
    }

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    Lease(Lease&& other) noexcept
        : coordinator_(other.coordinator_)
        , joined_(std::move(other.joined_))
        , router_(std::move(other.router_))
        , open_(std::exchange(other.open_, false))
    {
    }

    Lease& operator=(Lease&& other) noexcept {
        if (this != &other) {
            close();
            coordinator_ = other.coordinator_;
            joined_ = std::move(other.joined_);
            router_ = std::move(other.router_);
            open_ = std::exchange(other.open_, false);
        }
        return *this;
    }

    // -------------------------------------------------------------------------
    // Inbound
    // -------------------------------------------------------------------------

    // Parses a raw text frame and forwards color_change requests.
    // Unknown colors are forwarded too: the Coordinator owns the rejection.
    inline Inbound on_message(std::string_view raw) {
        Inbound in;
        if (!open_) {
            SB_WARN("[LEASE] Frame received on closed lease #" << joined_.id << " -> ignore message.");
            return in;
        }
        protocol::schema::ColorRequest request;
        in.parse = router_.parse(raw, request);
        if (in.parse == protocol::parser::Result::Parsed ||
            in.parse == protocol::parser::Result::InvalidValue) {
            in.outcome = coordinator_->set_color(joined_.id, request.color);
        }
        return in;
    }

    // -------------------------------------------------------------------------
    // Teardown
    // -------------------------------------------------------------------------

    // Idempotent: only the first call reaches the Coordinator
    inline void close() noexcept {
        if (!open_) {
            return;
        }
        open_ = false;
        try {
            const auto result = coordinator_->disconnect(joined_.id);
            SB_DEBUG("[LEASE] Closed lease for connection #" << joined_.id << " (" << to_string(result) << ")");
        }
        catch (const std::exception& e) {
            // disconnect() only throws on allocation failure; the lease stays closed
            SB_ERROR("[LEASE] disconnect() for connection #" << joined_.id << " failed: " << e.what());
        }
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline ConnectionId id() const noexcept {
        return joined_.id;
    }

    [[nodiscard]]
    inline bool is_open() const noexcept {
        return open_;
    }

    // Role and state observed at join time
    [[nodiscard]]
    inline const ConnectResult& joined() const noexcept {
        return joined_;
    }

private:
    Coordinator* coordinator_;
    ConnectResult joined_;
    protocol::parser::Router router_;
    bool open_;
};

} // namespace signalbox::core::session
