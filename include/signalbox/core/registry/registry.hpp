#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <cassert>

#include "signalbox/core/types.hpp"
#include "signalbox/core/transport/concepts.hpp"
#include "lcr/optional.hpp"
#include "lcr/log/logger.hpp"


namespace signalbox::core::registry {

/*
===============================================================================
Connection Registry
===============================================================================

Authoritative set of live connections plus the controller pointer.

State model:

    entries_      ordered by ConnectionId (== join order)
    controller_   id of the controller, INVALID_CONNECTION_ID when empty

Invariants:
-----------
• controller_ == INVALID_CONNECTION_ID  <=>  entries_.empty()
• controller_ != INVALID_CONNECTION_ID  =>   entries_.contains(controller_)

Election:
---------
• The first connection into an empty registry becomes controller.
• When the controller leaves, the survivor with the smallest id (the
  earliest joiner) is promoted. No randomness, no "last joiner wins".

Design:
-------
• Not synchronized: every call happens under the Coordinator state lock
• remove() of an absent id is a no-op
• Identities are opaque and may repeat; ids never do
===============================================================================
*/

template <transport::SessionConcept Session>
class Registry {
public:
    using session_ptr = std::shared_ptr<Session>;

    struct Entry {
        ConnectionId id{INVALID_CONNECTION_ID};
        std::string identity;
        session_ptr session;
        std::uint32_t failed_sends{0};   // consecutive failed sends
    };

    // Fan-out target captured under the state lock
    struct Recipient {
        ConnectionId id{INVALID_CONNECTION_ID};
        session_ptr session;
    };

public:
    Registry() = default;

    // ------------------------------------------------------------
    // Membership
    // ------------------------------------------------------------

    // PRECONDITION: id is fresh (strictly greater than any id seen before)
    // Returns true if the new connection became controller.
    [[nodiscard]]
    inline bool add(ConnectionId id, std::string identity, session_ptr session) {
        assert(id != INVALID_CONNECTION_ID && "Registry::add() with invalid id");
        assert(!contains(id) && "Registry::add() with duplicate id");
        entries_.emplace(id, Entry{id, std::move(identity), std::move(session), 0});
        bool is_controller = false;
        if (controller_ == INVALID_CONNECTION_ID) {
            controller_ = id;
            is_controller = true;
        }
        SB_TRACE("[REGISTRY] Added connection #" << id << " (size=" << entries_.size()
                 << ", controller=#" << controller_ << ")");
        return is_controller;
    }

    // Removes the connection. Returns the promoted controller if the removed
    // connection was controller and survivors remain; empty otherwise.
    [[nodiscard]]
    inline lcr::optional<ConnectionId> remove(ConnectionId id) {
        lcr::optional<ConnectionId> promoted;
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return promoted; // idempotent
        }
        entries_.erase(it);
        if (id == controller_) {
            controller_ = INVALID_CONNECTION_ID;
            if (!entries_.empty()) {
                // std::map is ordered by id: begin() is the earliest joiner
                controller_ = entries_.begin()->first;
                promoted = controller_;
            }
        }
        SB_TRACE("[REGISTRY] Removed connection #" << id << " (size=" << entries_.size()
                 << ", controller=#" << controller_ << ")");
        return promoted;
    }

    // ------------------------------------------------------------
    // Send bookkeeping
    // ------------------------------------------------------------

    // Updates the consecutive failure streak of a connection.
    // Returns the streak after the update (0 if the id is absent).
    inline std::uint32_t record_send(ConnectionId id, bool delivered) noexcept {
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return 0;
        }
        auto& failed = it->second.failed_sends;
        failed = delivered ? 0 : failed + 1;
        return failed;
    }

    // ------------------------------------------------------------
    // Accessors
    // ------------------------------------------------------------

    [[nodiscard]]
    inline std::size_t size() const noexcept {
        return entries_.size();
    }

    [[nodiscard]]
    inline bool empty() const noexcept {
        return entries_.empty();
    }

    [[nodiscard]]
    inline bool contains(ConnectionId id) const noexcept {
        return entries_.find(id) != entries_.end();
    }

    [[nodiscard]]
    inline bool is_controller(ConnectionId id) const noexcept {
        return id != INVALID_CONNECTION_ID && id == controller_;
    }

    [[nodiscard]]
    inline lcr::optional<ConnectionId> controller() const {
        if (controller_ == INVALID_CONNECTION_ID) {
            return {};
        }
        return controller_;
    }

    [[nodiscard]]
    inline lcr::optional<std::string> controller_identity() const {
        return identity(controller_);
    }

    [[nodiscard]]
    inline lcr::optional<std::string> identity(ConnectionId id) const {
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return {};
        }
        return it->second.identity;
    }

    [[nodiscard]]
    inline session_ptr session(ConnectionId id) const {
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return nullptr;
        }
        return it->second.session;
    }

    // Ordered (join order) copy of the current members
    [[nodiscard]]
    inline std::vector<Recipient> snapshot() const {
        std::vector<Recipient> out;
        out.reserve(entries_.size());
        for (const auto& [id, entry] : entries_) {
            out.push_back(Recipient{id, entry.session});
        }
        return out;
    }

    // Invariant check (tests / debug builds)
    [[nodiscard]]
    inline bool is_consistent() const noexcept {
        if (entries_.empty()) {
            return controller_ == INVALID_CONNECTION_ID;
        }
        return controller_ != INVALID_CONNECTION_ID && contains(controller_);
    }

private:
    std::map<ConnectionId, Entry> entries_;
    ConnectionId controller_{INVALID_CONNECTION_ID};
};

} // namespace signalbox::core::registry
