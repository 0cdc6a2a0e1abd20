/*
===============================================================================
 fanout::Batch / fanout::Sequencer - Unit Tests
===============================================================================

Covered Requirements:
---------------------
F1. Deliveries happen in insertion order, one Outcome per attempt
F2. A failed send does not stop the remaining deliveries
F3. A missing session reports Closed
F4. Payloads are shared by index
F5. Sequencer serves tickets strictly in ticket order
F6. Sequencer advances even if the work throws

===============================================================================
*/

#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>
#include <mutex>

#include "signalbox/core/fanout/batch.hpp"
#include "signalbox/core/fanout/sequencer.hpp"
#include "common/mock_session.hpp"
#include "common/test_check.hpp"

using namespace signalbox::core;
using transport::test::MockSession;

using BatchUnderTest = fanout::Batch<MockSession>;


// -----------------------------------------------------------------------------
// F1. Order and outcomes
// -----------------------------------------------------------------------------
void test_delivery_order() {
    std::cout << "[TEST] F1: deliveries in insertion order\n";

    auto a = std::make_shared<MockSession>("a");
    auto b = std::make_shared<MockSession>("b");
    telemetry::Coordinator telemetry;

    BatchUnderTest batch;
    TEST_CHECK(batch.empty());
    const auto first  = batch.add_payload("first");
    const auto second = batch.add_payload("second");
    batch.push(1, a, first);
    batch.push(2, b, first);
    batch.push(1, a, second);
    TEST_CHECK(batch.size() == 3);

    const auto report = batch.deliver(telemetry);
    TEST_CHECK(report.attempted == 3);
    TEST_CHECK(report.delivered == 3);
    TEST_CHECK(report.failed() == 0);
    TEST_CHECK(report.outcomes.size() == 3);
    TEST_CHECK(report.outcomes[0].id == 1);
    TEST_CHECK(report.outcomes[1].id == 2);
    TEST_CHECK(report.outcomes[2].id == 1);

    const auto fa = a->frames();
    TEST_CHECK(fa.size() == 2);
    TEST_CHECK_EQ(fa[0], "first");
    TEST_CHECK_EQ(fa[1], "second");
    TEST_CHECK_EQ(b->last_frame(), "first");

    TEST_CHECK(telemetry.messages_sent_total.load() == 3);

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// F2 / F3. Failures
// -----------------------------------------------------------------------------
void test_failure_isolation() {
    std::cout << "[TEST] F2/F3: failed sends are isolated and reported\n";

    auto a = std::make_shared<MockSession>("a");
    auto b = std::make_shared<MockSession>("b");
    auto c = std::make_shared<MockSession>("c");
    b->fail_with(transport::Error::Backpressure);
    telemetry::Coordinator telemetry;

    BatchUnderTest batch;
    const auto p = batch.add_payload("x");
    batch.push(1, a, p);
    batch.push(2, b, p);
    batch.push(3, nullptr, p);
    batch.push(4, c, p);

    const auto report = batch.deliver(telemetry);
    TEST_CHECK(report.attempted == 4);
    TEST_CHECK(report.delivered == 2);
    TEST_CHECK(report.failed() == 2);
    TEST_CHECK(report.outcomes[1].error == transport::Error::Backpressure);
    TEST_CHECK(report.outcomes[2].error == transport::Error::Closed);
    TEST_CHECK(!report.outcomes[2].delivered());
    TEST_CHECK(report.outcomes[3].delivered());

    TEST_CHECK(a->frame_count() == 1);
    TEST_CHECK(b->frame_count() == 0);
    TEST_CHECK(b->send_calls() == 1);
    TEST_CHECK(c->frame_count() == 1);

    TEST_CHECK(telemetry.send_failures_total.load() == 2);

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// F4. Broadcast helper
// -----------------------------------------------------------------------------
void test_push_all() {
    std::cout << "[TEST] F4: push_all shares one payload\n";

    struct Recipient {
        ConnectionId id;
        std::shared_ptr<MockSession> session;
    };
    std::vector<Recipient> recipients;
    for (ConnectionId id = 1; id <= 5; ++id) {
        recipients.push_back(Recipient{id, std::make_shared<MockSession>()});
    }

    telemetry::Coordinator telemetry;
    BatchUnderTest batch;
    batch.push_all(recipients, batch.add_payload("hello"));
    TEST_CHECK(batch.size() == 5);
    (void)batch.deliver(telemetry);

    for (const auto& r : recipients) {
        TEST_CHECK_EQ(r.session->last_frame(), "hello");
    }

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// F5. Ticket order
// -----------------------------------------------------------------------------
void test_sequencer_order() {
    std::cout << "[TEST] F5: sequencer serves in ticket order\n";

    fanout::Sequencer sequencer;
    constexpr int N = 16;
    std::vector<fanout::Sequencer::Ticket> tickets;
    for (int i = 0; i < N; ++i) {
        tickets.push_back(sequencer.take());
    }

    std::mutex mutex;
    std::vector<fanout::Sequencer::Ticket> served;

    // Start the threads in reverse ticket order
    std::vector<std::thread> threads;
    for (int i = N - 1; i >= 0; --i) {
        threads.emplace_back([&, t = tickets[i]] {
            sequencer.serve(t, [&] {
                std::lock_guard<std::mutex> lock(mutex);
                served.push_back(t);
            });
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    TEST_CHECK(served.size() == static_cast<std::size_t>(N));
    for (int i = 0; i < N; ++i) {
        TEST_CHECK(served[i] == tickets[i]);
    }
    // Every ticket was handed over: the next one is served immediately
    const auto next = sequencer.take();
    TEST_CHECK(next == static_cast<fanout::Sequencer::Ticket>(N));
    TEST_CHECK(sequencer.serve(next, [] { return true; }));

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// F6. Throwing work
// -----------------------------------------------------------------------------
void test_sequencer_advances_on_throw() {
    std::cout << "[TEST] F6: sequencer advances when work throws\n";

    fanout::Sequencer sequencer;
    const auto first = sequencer.take();
    const auto second = sequencer.take();

    bool thrown = false;
    try {
        sequencer.serve(first, []() -> int { throw std::runtime_error("boom"); });
    }
    catch (const std::runtime_error&) {
        thrown = true;
    }
    TEST_CHECK(thrown);

    const int value = sequencer.serve(second, [] { return 7; });
    TEST_CHECK(value == 7);

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// Main runner
// -----------------------------------------------------------------------------
int main() {
    test_delivery_order();
    test_failure_isolation();
    test_push_all();
    test_sequencer_order();
    test_sequencer_advances_on_throw();

    std::cout << "\n[GROUP F - FANOUT PASSED]\n";
    return 0;
}
