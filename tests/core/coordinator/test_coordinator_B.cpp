/*
===============================================================================
 Coordinator - Group B Unit Tests (signal color)
===============================================================================

Scope:
------
set_color() gating and the color_change broadcast.

Covered Requirements:
---------------------
B1. Controller change is applied and echoed to everyone, controller included
B2. Non-controller change is rejected silently (no state change, no frames)
B3. Unknown connection ids are treated as non-controllers
B4. Unknown colors are rejected without state change
B5. Role is checked before the color value
B6. Re-setting the current color is applied and broadcast again
B7. Every color is reachable from every other color
B8. Joiners see the current color in their snapshot

===============================================================================
*/

#include <iostream>
#include <vector>

#include "common/harness/coordinator.hpp"

using namespace signalbox::core::test;


// -----------------------------------------------------------------------------
// B1. Controller applies a color
// -----------------------------------------------------------------------------
void test_controller_sets_color() {
    std::cout << "[TEST] Group B1: controller sets color\n";

    harness::Coordinator<> h;
    auto alice = h.join("alice");
    auto bob   = h.join("bob");
    auto carol = h.join("carol");
    h.clear({&alice, &bob, &carol});

    TEST_CHECK(h.coordinator.set_color(alice.id(), Color::Red) == SetColorResult::Applied);
    TEST_CHECK(h.coordinator.color() == Color::Red);

    for (const auto* p : {&alice, &bob, &carol}) {
        const auto frames = json::frame::decode_all(p->frames());
        TEST_CHECK(frames.size() == 1);
        TEST_CHECK_EQ(frames[0].type, "color_change");
        TEST_CHECK_EQ(frames[0].color, "red");
        TEST_CHECK(json::frame::is_clock_text(frames[0].timestamp));
    }
    TEST_CHECK(h.telemetry.color_changes_total.load() == 1);

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// B2 / B3. Rejected by role
// -----------------------------------------------------------------------------
void test_non_controller_rejected() {
    std::cout << "[TEST] Group B2/B3: non-controller and unknown ids are rejected\n";

    harness::Coordinator<> h;
    auto alice = h.join("alice");
    auto bob   = h.join("bob");
    TEST_CHECK(h.coordinator.set_color(alice.id(), Color::Green) == SetColorResult::Applied);
    h.clear({&alice, &bob});

    TEST_CHECK(h.coordinator.set_color(bob.id(), Color::Red) == SetColorResult::NotController);
    TEST_CHECK(h.coordinator.set_color(4242, Color::Red) == SetColorResult::NotController);
    TEST_CHECK(h.coordinator.set_color(INVALID_CONNECTION_ID, Color::Red) == SetColorResult::NotController);

    TEST_CHECK(h.coordinator.color() == Color::Green);
    TEST_CHECK(alice.session->frame_count() == 0);
    TEST_CHECK(bob.session->frame_count() == 0);
    TEST_CHECK(h.telemetry.rejected_not_controller_total.load() == 3);

    // A departed controller loses the right immediately
    TEST_CHECK(h.leave(alice) == DisconnectResult::Promoted);
    TEST_CHECK(h.coordinator.set_color(alice.id(), Color::Yellow) == SetColorResult::NotController);
    TEST_CHECK(h.coordinator.color() == Color::Green);

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// B4. Rejected by value
// -----------------------------------------------------------------------------
void test_invalid_color_rejected() {
    std::cout << "[TEST] Group B4: unknown colors are rejected\n";

    harness::Coordinator<> h;
    auto alice = h.join("alice");
    auto bob   = h.join("bob");
    TEST_CHECK(h.coordinator.set_color(alice.id(), Color::Yellow) == SetColorResult::Applied);
    h.clear({&alice, &bob});

    TEST_CHECK(h.coordinator.set_color(alice.id(), Color::Unknown) == SetColorResult::InvalidColor);
    TEST_CHECK(h.coordinator.set_color(alice.id(), std::string_view{"blue"}) == SetColorResult::InvalidColor);
    TEST_CHECK(h.coordinator.set_color(alice.id(), std::string_view{"Red"}) == SetColorResult::InvalidColor);
    TEST_CHECK(h.coordinator.set_color(alice.id(), std::string_view{""}) == SetColorResult::InvalidColor);

    TEST_CHECK(h.coordinator.color() == Color::Yellow);
    TEST_CHECK(alice.session->frame_count() == 0);
    TEST_CHECK(bob.session->frame_count() == 0);
    TEST_CHECK(h.telemetry.rejected_invalid_color_total.load() == 4);

    // The string overload accepts wire spellings
    TEST_CHECK(h.coordinator.set_color(alice.id(), std::string_view{"none"}) == SetColorResult::Applied);
    TEST_CHECK(h.coordinator.color() == Color::None);

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// B5. Check order
// -----------------------------------------------------------------------------
void test_role_checked_first() {
    std::cout << "[TEST] Group B5: role is checked before the color value\n";

    harness::Coordinator<> h;
    auto alice = h.join("alice");
    auto bob   = h.join("bob");
    (void)alice;

    TEST_CHECK(h.coordinator.set_color(bob.id(), Color::Unknown) == SetColorResult::NotController);
    TEST_CHECK(h.telemetry.rejected_invalid_color_total.load() == 0);
    TEST_CHECK(h.telemetry.rejected_not_controller_total.load() == 1);

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// B6. Same color again
// -----------------------------------------------------------------------------
void test_same_color_rebroadcast() {
    std::cout << "[TEST] Group B6: re-setting the current color\n";

    harness::Coordinator<> h;
    auto alice = h.join("alice");
    auto bob   = h.join("bob");
    h.clear({&alice, &bob});

    TEST_CHECK(h.coordinator.set_color(alice.id(), Color::None) == SetColorResult::Applied);
    TEST_CHECK(h.coordinator.set_color(alice.id(), Color::None) == SetColorResult::Applied);

    const auto changes = bob.of_type("color_change");
    TEST_CHECK(changes.size() == 2);
    TEST_CHECK_EQ(changes[0].color, "none");
    TEST_CHECK_EQ(changes[1].color, "none");

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// B7. Any-to-any transitions
// -----------------------------------------------------------------------------
void test_any_to_any() {
    std::cout << "[TEST] Group B7: every color reachable from every color\n";

    harness::Coordinator<> h;
    auto alice = h.join("alice");
    auto bob   = h.join("bob");
    h.clear({&alice, &bob});

    const std::vector<Color> all{Color::None, Color::Red, Color::Yellow, Color::Green};
    std::vector<std::string> expected;
    for (Color from : all) {
        for (Color to : all) {
            TEST_CHECK(h.coordinator.set_color(alice.id(), from) == SetColorResult::Applied);
            TEST_CHECK(h.coordinator.set_color(alice.id(), to) == SetColorResult::Applied);
            TEST_CHECK(h.coordinator.color() == to);
            expected.emplace_back(to_string(from));
            expected.emplace_back(to_string(to));
        }
    }

    // Broadcast order equals commit order
    const auto changes = bob.of_type("color_change");
    TEST_CHECK(changes.size() == expected.size());
    for (std::size_t i = 0; i < expected.size(); ++i) {
        TEST_CHECK_EQ(changes[i].color, expected[i]);
    }

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// B8. Joiner snapshot
// -----------------------------------------------------------------------------
void test_joiner_sees_current_color() {
    std::cout << "[TEST] Group B8: joiners see the current color\n";

    harness::Coordinator<> h;
    auto alice = h.join("alice");
    TEST_CHECK(h.coordinator.set_color(alice.id(), Color::Green) == SetColorResult::Applied);

    auto bob = h.join("bob");
    TEST_CHECK(bob.joined.color == Color::Green);
    const auto snapshot = bob.of_type("state_update");
    TEST_CHECK(snapshot.size() == 1);
    TEST_CHECK_EQ(snapshot[0].color, "green");
    TEST_CHECK(!snapshot[0].is_controller);

    // Joining does not replay earlier color_change broadcasts
    TEST_CHECK(bob.of_type("color_change").empty());

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// Main runner
// -----------------------------------------------------------------------------
int main() {
    test_controller_sets_color();
    test_non_controller_rejected();
    test_invalid_color_rejected();
    test_role_checked_first();
    test_same_color_rebroadcast();
    test_any_to_any();
    test_joiner_sees_current_color();

    std::cout << "\n[GROUP B PASSED]\n";
    return 0;
}
