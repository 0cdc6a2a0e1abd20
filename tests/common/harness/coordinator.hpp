/*
===============================================================================
 Coordinator Test Harness
===============================================================================
*/
#pragma once

#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "signalbox/core.hpp"
#include "common/mock_session.hpp"
#include "common/json_helpers.hpp"
#include "common/test_check.hpp"


// -----------------------------------------------------------------------------
// Setup environment
// -----------------------------------------------------------------------------
using namespace signalbox::core;

using SessionUnderTest = transport::test::MockSession;

// Assert that SessionUnderTest conforms to transport::SessionConcept concept
static_assert(transport::SessionConcept<SessionUnderTest>);


namespace signalbox::core::test {
namespace harness {

// One connected party: its mock transport plus what connect() returned
struct Peer {
    std::shared_ptr<SessionUnderTest> session;
    ConnectResult joined;

    [[nodiscard]] inline ConnectionId id() const noexcept { return joined.id; }

    [[nodiscard]] inline std::vector<std::string> frames() const { return session->frames(); }

    [[nodiscard]] inline std::vector<json::frame::Decoded> of_type(std::string_view type) const {
        return json::frame::of_type(session->frames(), type);
    }

    [[nodiscard]] inline json::frame::Decoded last() const {
        return json::frame::decode(session->last_frame());
    }
};


template<policy::FanoutPolicy FailurePolicy = policy::fanout::Retain>
struct Coordinator {

    using CoordinatorUnderTest = core::Coordinator<SessionUnderTest, FailurePolicy>;

    core::telemetry::Coordinator telemetry;
    CoordinatorUnderTest coordinator{telemetry};

    // -------------------------------------------------------------------------
    // Membership
    // -------------------------------------------------------------------------
    inline Peer join(const std::string& identity) {
        auto session = std::make_shared<SessionUnderTest>(identity);
        Peer peer{session, coordinator.connect(session, identity)};
        TEST_CHECK(peer.joined.id != INVALID_CONNECTION_ID);
        TEST_CHECK(coordinator.is_consistent());
        return peer;
    }

    inline DisconnectResult leave(const Peer& peer) {
        auto result = coordinator.disconnect(peer.id());
        TEST_CHECK(coordinator.is_consistent());
        return result;
    }

    // -------------------------------------------------------------------------
    // Helpers
    // -------------------------------------------------------------------------

    // Forget every frame delivered so far
    static inline void clear(std::initializer_list<const Peer*> peers) {
        for (const Peer* p : peers) {
            p->session->clear();
        }
    }

    inline void expect_controller_id(ConnectionId id) const {
        auto ctrl = coordinator.controller();
        TEST_CHECK(ctrl.has());
        TEST_CHECK(ctrl.value() == id);
    }

    inline void expect_controller(const Peer& peer) const {
        expect_controller_id(peer.id());
    }
};

} // namespace harness
} // namespace signalbox::core::test
