#pragma once

#include <algorithm>
#include <cassert>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>

#include "signalbox/core/types.hpp"
#include "signalbox/core/color.hpp"
#include "signalbox/core/timestamp.hpp"
#include "signalbox/core/transport/concepts.hpp"
#include "signalbox/core/registry/registry.hpp"
#include "signalbox/core/fanout/batch.hpp"
#include "signalbox/core/fanout/report.hpp"
#include "signalbox/core/fanout/sequencer.hpp"
#include "signalbox/core/policy/fanout.hpp"
#include "signalbox/core/protocol/concept/json_writable.hpp"
#include "signalbox/core/protocol/schema/state_update.hpp"
#include "signalbox/core/protocol/schema/color_change.hpp"
#include "signalbox/core/protocol/schema/user_update.hpp"
#include "signalbox/core/telemetry/coordinator.hpp"
#include "signalbox/core/telemetry.hpp"
#include "lcr/json.hpp"
#include "lcr/optional.hpp"
#include "lcr/log/logger.hpp"


namespace signalbox::core {

/*
===============================================================================
 signalbox::core::Coordinator
===============================================================================

Single source of truth for the signal color and for who may change it.

One Coordinator is constructed explicitly and shared by reference with every
connection-handling task. There is no global instance.

-------------------------------------------------------------------------------
 Responsibilities
-------------------------------------------------------------------------------
- Register and unregister connections (Registry)
- Elect the first joiner as controller; promote the earliest-joined survivor
  when the controller leaves
- Gate color changes on the controller role
- Push snapshots, role corrections and broadcasts to every connection

-------------------------------------------------------------------------------
 Messages
-------------------------------------------------------------------------------
connect()     -> joiner: state_update
                 all:    user_update
disconnect()  -> promoted survivor: state_update{is_controller:true}
                 other survivors:   state_update{is_controller:false}
                 all survivors:     user_update
set_color()   -> all (controller included): color_change

-------------------------------------------------------------------------------
 Concurrency Model
-------------------------------------------------------------------------------
- All Registry and color reads/writes happen under one mutex (state lock)
- Each operation builds a fanout::Batch under the state lock: recipients are
  a Registry snapshot and payloads are already serialized
- A fan-out ticket is taken under the same lock, so ticket order is commit
  order; the batch is delivered after the lock is released, in ticket order
- Therefore every connection receives messages in commit order, and sends
  never block mutations or status reads

-------------------------------------------------------------------------------
 Failure Model
-------------------------------------------------------------------------------
- Policy rejections (non-controller, unknown color) are silent on the wire:
  no state change, no broadcast, nothing sent to the requester
- A failed send never aborts the rest of a fan-out
- What repeated failures mean for membership is decided by FailurePolicy
  (policy::fanout::Retain by default: transport-driven removal only)
- disconnect() of an absent id is a no-op

-------------------------------------------------------------------------------
 Requirements on Session
-------------------------------------------------------------------------------
- send() must not block indefinitely
- send() must not call back into the Coordinator

===============================================================================
*/

template <
    transport::SessionConcept Session,
    policy::FanoutPolicy FailurePolicy = policy::fanout::Retain
>
class Coordinator {
public:
    using session_type  = Session;
    using session_ptr   = std::shared_ptr<Session>;
    using registry_type = registry::Registry<Session>;
    using batch_type    = fanout::Batch<Session>;
    using policy_type   = FailurePolicy;

public:
    explicit Coordinator(core::telemetry::Coordinator& telemetry) noexcept
        : telemetry_(telemetry)
    {
    }

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    // -------------------------------------------------------------------------
    // Membership
    // -------------------------------------------------------------------------

    // Registers a new connection and pushes its snapshot plus a user_update.
    // Identity is opaque and not deduplicated.
    // Strong guarantee up to registration: if building the frames throws,
    // nothing is registered.
    [[nodiscard]]
    inline ConnectResult connect(session_ptr session, std::string identity) {
        ConnectResult result;
        fanout::Report report;
        {
            std::unique_lock<std::mutex> state_lock(state_mutex_);
            const ConnectionId id = last_id_ + 1;
            const bool is_controller = !registry_.controller().has();
            const lcr::optional<std::string> controller_identity =
                is_controller ? lcr::optional<std::string>(identity) : registry_.controller_identity();

            batch_type batch;
            const auto snapshot = batch.add_payload(protocol::serialize(
                protocol::schema::StateUpdate{color_, is_controller, controller_identity, now()}));
            batch.push(id, session, snapshot);

            auto recipients = registry_.snapshot();
            recipients.push_back(typename registry_type::Recipient{id, session});
            const auto users = batch.add_payload(protocol::serialize(
                protocol::schema::UserUpdate{static_cast<std::uint64_t>(recipients.size()), controller_identity}));
            batch.push_all(recipients, users);
            const std::string shown = lcr::json::escape(identity);

            // Commit
            [[maybe_unused]] const bool elected = registry_.add(id, std::move(identity), std::move(session));
            assert(elected == is_controller);
            last_id_ = id;

            result.id = id;
            result.is_controller = is_controller;
            result.color = color_;
            result.controller_identity = controller_identity;

            SB_TL1( telemetry_.connects_total.inc() );
            SB_TL1( telemetry_.connections.inc() );
            SB_INFO("[COORD] Connection #" << id << " '" << shown << "' joined as "
                    << (is_controller ? "controller" : "observer") << " (users=" << registry_.size() << ")");

            report = dispatch_(state_lock, batch);
        }
        settle_(report);
        return result;
    }

    // Unregisters a connection. Idempotent.
    inline DisconnectResult disconnect(ConnectionId id) {
        fanout::Report report;
        const DisconnectResult result = disconnect_(id, report);
        settle_(report);
        return result;
    }

    // -------------------------------------------------------------------------
    // Signal state
    // -------------------------------------------------------------------------

    inline SetColorResult set_color(ConnectionId id, Color color) {
        fanout::Report report;
        {
            std::unique_lock<std::mutex> state_lock(state_mutex_);
            if (!registry_.is_controller(id)) {
                SB_TL1( telemetry_.rejected_not_controller_total.inc() );
                SB_DEBUG("[COORD] Ignoring color '" << to_string(color) << "' from non-controller #" << id);
                return SetColorResult::NotController;
            }
            if (!is_valid(color)) {
                SB_TL1( telemetry_.rejected_invalid_color_total.inc() );
                SB_DEBUG("[COORD] Ignoring unrecognised color from controller #" << id);
                return SetColorResult::InvalidColor;
            }
            const Color previous = color_;
            color_ = color;
            SB_TL1( telemetry_.color_changes_total.inc() );
            SB_INFO("[COORD] Color " << to_string(previous) << " -> " << to_string(color_) << " (by #" << id << ")");

            batch_type batch;
            const auto payload = batch.add_payload(protocol::serialize(protocol::schema::ColorChange{color_, now()}));
            batch.push_all(registry_.snapshot(), payload);
            report = dispatch_(state_lock, batch);
        }
        settle_(report);
        return SetColorResult::Applied;
    }

    // Wire spelling overload: unknown spellings are rejected as InvalidColor
    inline SetColorResult set_color(ConnectionId id, std::string_view color) {
        return set_color(id, to_color_enum(color));
    }

    // -------------------------------------------------------------------------
    // Observation
    // -------------------------------------------------------------------------

    // Pure read for the out-of-band polling endpoint
    [[nodiscard]]
    inline StatusSnapshot status() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        StatusSnapshot snapshot;
        snapshot.color = color_;
        snapshot.total_users = registry_.size();
        snapshot.controller_identity = registry_.controller_identity();
        return snapshot;
    }

    [[nodiscard]]
    inline Color color() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return color_;
    }

    [[nodiscard]]
    inline std::size_t size() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return registry_.size();
    }

    [[nodiscard]]
    inline lcr::optional<ConnectionId> controller() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return registry_.controller();
    }

    [[nodiscard]]
    inline bool is_registered(ConnectionId id) const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return registry_.contains(id);
    }

    // Controller invariant (tests / diagnostics)
    [[nodiscard]]
    inline bool is_consistent() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return registry_.is_consistent();
    }

    [[nodiscard]]
    inline const core::telemetry::Coordinator& telemetry() const noexcept {
        return telemetry_;
    }

private:
    // -------------------------------------------------------------------------
    // State (guarded by state_mutex_)
    // -------------------------------------------------------------------------
    mutable std::mutex state_mutex_;
    registry_type registry_;
    Color color_{Color::None};
    ConnectionId last_id_{INVALID_CONNECTION_ID};

    // Fan-out ordering (tickets taken under state_mutex_)
    fanout::Sequencer sequencer_;

    core::telemetry::Coordinator& telemetry_;

private:
    // PRECONDITION: state lock held
    [[nodiscard]]
    inline protocol::schema::StateUpdate make_state_update_(bool is_controller) const {
        return protocol::schema::StateUpdate{color_, is_controller, registry_.controller_identity(), now()};
    }

    // PRECONDITION: state lock held
    inline void push_user_update_(batch_type& batch, const std::vector<typename registry_type::Recipient>& recipients) const {
        protocol::schema::UserUpdate update{registry_.size(), registry_.controller_identity()};
        const auto payload = batch.add_payload(protocol::serialize(update));
        batch.push_all(recipients, payload);
    }

    // Releases the state lock, then delivers the batch in commit order
    [[nodiscard]]
    inline fanout::Report dispatch_(std::unique_lock<std::mutex>& state_lock, const batch_type& batch) {
        if (batch.empty()) {
            state_lock.unlock();
            return {};
        }
        const auto ticket = sequencer_.take();
        state_lock.unlock();
        return sequencer_.serve(ticket, [&] { return batch.deliver(telemetry_); });
    }

    // Removal path shared by disconnect() and pruning. Does not settle.
    inline DisconnectResult disconnect_(ConnectionId id, fanout::Report& report) {
        // Declared before the lock: a departing session is released after unlocking
        session_ptr departing;
        DisconnectResult result = DisconnectResult::Removed;
        {
            std::unique_lock<std::mutex> state_lock(state_mutex_);
            if (!registry_.contains(id)) {
                SB_TL1( telemetry_.duplicate_disconnects_total.inc() );
                SB_DEBUG("[COORD] disconnect() for unknown connection #" << id << " (already removed)");
                return DisconnectResult::NotFound;
            }
            departing = registry_.session(id);
            const auto identity = registry_.identity(id);
            const auto promoted = registry_.remove(id);

            SB_TL1( telemetry_.disconnects_total.inc() );
            SB_TL1( telemetry_.connections.dec() );
            SB_INFO("[COORD] Connection #" << id << " '" << lcr::json::escape(identity.value()) << "' left (users=" << registry_.size() << ")");

            const auto recipients = registry_.snapshot();
            batch_type batch;
            if (promoted.has()) {
                result = DisconnectResult::Promoted;
                SB_TL1( telemetry_.promotions_total.inc() );
                SB_INFO("[COORD] Connection #" << promoted.value() << " '"
                        << lcr::json::escape(registry_.controller_identity().value()) << "' promoted to controller");

                // Role correction: the promoted survivor and every other survivor
                // receive an authoritative snapshot of their own role
                const auto as_controller = batch.add_payload(protocol::serialize(make_state_update_(true)));
                const auto as_observer   = batch.add_payload(protocol::serialize(make_state_update_(false)));
                for (const auto& r : recipients) {
                    batch.push(r.id, r.session, r.id == promoted.value() ? as_controller : as_observer);
                }
            }
            push_user_update_(batch, recipients);
            report = dispatch_(state_lock, batch);
        }
        return result;
    }

    // Applies FailurePolicy to the outcomes of a fan-out
    inline void settle_(const fanout::Report& report) {
        if constexpr (!FailurePolicy::prune) {
            (void)report;
        }
        else {
            std::vector<ConnectionId> doomed = record_(report);
            for (std::size_t i = 0; i < doomed.size(); ++i) {
                const ConnectionId id = doomed[i];
                SB_WARN("[COORD] Pruning connection #" << id << " after "
                        << FailurePolicy::threshold << " consecutive failed sends");
                fanout::Report next;
                if (disconnect_(id, next) != DisconnectResult::NotFound) {
                    SB_TL1( telemetry_.pruned_total.inc() );
                }
                // Removal fan-outs may push further connections over the threshold
                for (ConnectionId more : record_(next)) {
                    if (std::find(doomed.begin(), doomed.end(), more) == doomed.end()) {
                        doomed.push_back(more);
                    }
                }
            }
        }
    }

    // Updates failure streaks; returns ids that reached the prune threshold
    [[nodiscard]]
    inline std::vector<ConnectionId> record_(const fanout::Report& report) {
        std::vector<ConnectionId> doomed;
        if (report.outcomes.empty()) {
            return doomed;
        }
        std::lock_guard<std::mutex> lock(state_mutex_);
        for (const auto& outcome : report.outcomes) {
            const auto streak = registry_.record_send(outcome.id, outcome.delivered());
            if (!outcome.delivered() && streak >= FailurePolicy::threshold &&
                std::find(doomed.begin(), doomed.end(), outcome.id) == doomed.end()) {
                doomed.push_back(outcome.id);
            }
        }
        return doomed;
    }
};

} // namespace signalbox::core
