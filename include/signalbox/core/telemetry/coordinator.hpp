#pragma once

#include <ostream>
#include <type_traits>

#include "lcr/metrics/atomic/counter.hpp"
#include "lcr/metrics/atomic/gauge.hpp"
#include "lcr/format.hpp"

namespace signalbox::core::telemetry {

// ============================================================================
// Coordinator Telemetry
//
// Observes membership, role and fan-out decisions taken by the Coordinator.
// Mechanical facts only: no derived health state.
// All counters are relaxed atomics: any thread may update or read them.
// ============================================================================

struct alignas(64) Coordinator final {
    // ---------------------------------------------------------------------
    // Membership
    // ---------------------------------------------------------------------

    // connect() calls (each one registers a connection)
    lcr::metrics::atomic::counter64 connects_total;

    // disconnect() calls that removed a connection
    lcr::metrics::atomic::counter64 disconnects_total;

    // disconnect() calls for an id that was already gone
    lcr::metrics::atomic::counter64 duplicate_disconnects_total;

    // Live registry size (with high-water mark)
    lcr::metrics::atomic::gauge64 connections;

    // ---------------------------------------------------------------------
    // Roles
    // ---------------------------------------------------------------------

    // Controller handed to a survivor after the controller left
    lcr::metrics::atomic::counter64 promotions_total;

    // ---------------------------------------------------------------------
    // Signal state
    // ---------------------------------------------------------------------

    // Accepted set_color() calls
    lcr::metrics::atomic::counter64 color_changes_total;

    // set_color() from a connection that is not controller
    lcr::metrics::atomic::counter64 rejected_not_controller_total;

    // set_color() with an unrecognised color
    lcr::metrics::atomic::counter64 rejected_invalid_color_total;

    // ---------------------------------------------------------------------
    // Fan-out
    // ---------------------------------------------------------------------

    // Frames handed to sessions successfully
    lcr::metrics::atomic::counter64 messages_sent_total;

    // Frames a session refused (any transport::Error)
    lcr::metrics::atomic::counter64 send_failures_total;

    // Connections removed by the fan-out policy (never by the transport)
    lcr::metrics::atomic::counter64 pruned_total;

    // ---------------------------------------------------------------------
    // Snapshot support
    // ---------------------------------------------------------------------

    inline void copy_to(Coordinator& other) const noexcept {
        connects_total.copy_to(other.connects_total);
        disconnects_total.copy_to(other.disconnects_total);
        duplicate_disconnects_total.copy_to(other.duplicate_disconnects_total);
        connections.copy_to(other.connections);

        promotions_total.copy_to(other.promotions_total);

        color_changes_total.copy_to(other.color_changes_total);
        rejected_not_controller_total.copy_to(other.rejected_not_controller_total);
        rejected_invalid_color_total.copy_to(other.rejected_invalid_color_total);

        messages_sent_total.copy_to(other.messages_sent_total);
        send_failures_total.copy_to(other.send_failures_total);
        pruned_total.copy_to(other.pruned_total);
    }

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== Coordinator Telemetry ===\n";

        os << "Membership\n";
        os << "  Connects              : " << lcr::format_number_exact(connects_total.load()) << '\n';
        os << "  Disconnects           : " << lcr::format_number_exact(disconnects_total.load()) << '\n';
        os << "  Duplicate disconnects : " << lcr::format_number_exact(duplicate_disconnects_total.load()) << '\n';
        os << "  Connections (live)    : " << lcr::format_number_exact(connections.load()) << '\n';
        os << "  Connections (peak)    : " << lcr::format_number_exact(connections.peak()) << '\n';

        os << "\nRoles\n";
        os << "  Promotions            : " << lcr::format_number_exact(promotions_total.load()) << '\n';

        os << "\nSignal\n";
        os << "  Color changes         : " << lcr::format_number_exact(color_changes_total.load()) << '\n';
        os << "  Rejected (role)       : " << lcr::format_number_exact(rejected_not_controller_total.load()) << '\n';
        os << "  Rejected (color)      : " << lcr::format_number_exact(rejected_invalid_color_total.load()) << '\n';

        const auto sent   = messages_sent_total.load();
        const auto failed = send_failures_total.load();
        os << "\nFan-out\n";
        os << "  Messages sent         : " << lcr::format_number_exact(sent) << '\n';
        os << "  Send failures         : " << lcr::format_number_exact(failed)
           << " (" << lcr::format_ratio(failed, sent + failed) << ")\n";
        os << "  Pruned                : " << lcr::format_number_exact(pruned_total.load()) << '\n';
    }
};

// -------------------------------------------------------------------------
// Invariants
// -------------------------------------------------------------------------
static_assert(std::is_standard_layout_v<Coordinator>, "telemetry::Coordinator must be standard layout");
static_assert(!std::is_polymorphic_v<Coordinator>, "telemetry::Coordinator must not be polymorphic");
static_assert(alignof(Coordinator) == 64, "telemetry::Coordinator must be cache-line aligned");

} // namespace signalbox::core::telemetry
