/*
===============================================================================
 Color / MessageType / Clock - Unit Tests
===============================================================================

Covered Requirements:
---------------------
C1. Color wire spellings round-trip through to_color_enum
C2. Unrecognised spellings map to Color::Unknown (case-sensitive)
C3. Only none/red/yellow/green are valid states
C4. Message type dispatch strings
C5. Clock text is local HH:MM:SS

===============================================================================
*/

#include <iostream>
#include <ctime>

#include "signalbox/core/color.hpp"
#include "signalbox/core/timestamp.hpp"
#include "signalbox/core/protocol/enums/message_type.hpp"
#include "common/test_check.hpp"

using namespace signalbox::core;


// -----------------------------------------------------------------------------
// C1. Known spellings
// -----------------------------------------------------------------------------
void test_color_spellings() {
    std::cout << "[TEST] C1: color wire spellings\n";

    for (Color c : {Color::None, Color::Red, Color::Yellow, Color::Green}) {
        TEST_CHECK(to_color_enum(to_string(c)) == c);
    }
    TEST_CHECK(to_string(Color::None) == "none");
    TEST_CHECK(to_string(Color::Yellow) == "yellow");

    static_assert(to_color_enum("green") == Color::Green);
    static_assert(to_string(Color::Red).size() <= COLOR_MAX_LENGTH);
    static_assert(to_string(Color::Unknown).size() <= COLOR_MAX_LENGTH);

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// C2. Unknown spellings
// -----------------------------------------------------------------------------
void test_color_unknown_spellings() {
    std::cout << "[TEST] C2: unrecognised color spellings\n";

    TEST_CHECK(to_color_enum("blue") == Color::Unknown);
    TEST_CHECK(to_color_enum("") == Color::Unknown);
    TEST_CHECK(to_color_enum("Red") == Color::Unknown);
    TEST_CHECK(to_color_enum("RED") == Color::Unknown);
    TEST_CHECK(to_color_enum("red ") == Color::Unknown);
    TEST_CHECK(to_color_enum("purple") == Color::Unknown);   // same length as "yellow"
    TEST_CHECK(to_color_enum("unknown") == Color::Unknown);

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// C3. Validity
// -----------------------------------------------------------------------------
void test_color_validity() {
    std::cout << "[TEST] C3: color validity\n";

    TEST_CHECK(is_valid(Color::None));
    TEST_CHECK(is_valid(Color::Red));
    TEST_CHECK(is_valid(Color::Yellow));
    TEST_CHECK(is_valid(Color::Green));
    TEST_CHECK(!is_valid(Color::Unknown));

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// C4. Message types
// -----------------------------------------------------------------------------
void test_message_types() {
    std::cout << "[TEST] C4: message type strings\n";

    using protocol::MessageType;
    for (MessageType t : {MessageType::StateUpdate, MessageType::ColorChange, MessageType::UserUpdate}) {
        TEST_CHECK(protocol::to_message_type_enum(protocol::to_string(t)) == t);
    }
    TEST_CHECK(protocol::to_message_type_enum("status") == MessageType::Unknown);
    TEST_CHECK(protocol::to_message_type_enum("color_changes") == MessageType::Unknown);
    TEST_CHECK(protocol::to_message_type_enum("state_updatE") == MessageType::Unknown);

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// C5. Clock text
// -----------------------------------------------------------------------------
void test_clock_text() {
    std::cout << "[TEST] C5: clock text is local HH:MM:SS\n";

    const Timestamp ts = now();
    const std::string text = to_clock_string(ts);
    TEST_CHECK(text.size() == CLOCK_TEXT_SIZE);

    const std::time_t t = std::chrono::system_clock::to_time_t(
        std::chrono::time_point_cast<std::chrono::system_clock::duration>(ts));
    std::tm tm{};
    localtime_r(&t, &tm);
    char expected[16];
    const auto n = std::strftime(expected, sizeof(expected), "%H:%M:%S", &tm);
    TEST_CHECK_EQ(text, std::string(expected, n));

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// Main runner
// -----------------------------------------------------------------------------
int main() {
    test_color_spellings();
    test_color_unknown_spellings();
    test_color_validity();
    test_message_types();
    test_clock_text();

    std::cout << "\n[GROUP C - COLOR PASSED]\n";
    return 0;
}
