#pragma once

#include <memory>
#include <string>
#include <vector>
#include <cstddef>
#include <cassert>

#include "signalbox/core/types.hpp"
#include "signalbox/core/transport/concepts.hpp"
#include "signalbox/core/fanout/report.hpp"
#include "signalbox/core/telemetry/coordinator.hpp"
#include "signalbox/core/telemetry.hpp"
#include "lcr/log/logger.hpp"


namespace signalbox::core::fanout {

/*
===============================================================================
 fanout::Batch
===============================================================================

An immutable-once-built list of (recipient, payload) pairs.

A Batch is assembled under the Coordinator state lock: recipients come from
a Registry snapshot and payloads are fully serialized before the lock is
released. deliver() then runs without touching shared state.

Guarantees:
- Deliveries are attempted in insertion order
- One failed send never prevents the following ones
- Every attempt yields exactly one Outcome in the Report
- Sessions stay alive for the whole delivery (shared ownership)

Payloads are stored once and referenced by index, so a broadcast does not
copy the serialized frame per recipient.
===============================================================================
*/

template <transport::SessionConcept Session>
class Batch {
public:
    using session_ptr = std::shared_ptr<Session>;

    Batch() = default;

    // Stores a serialized frame, returns its handle
    [[nodiscard]]
    inline std::size_t add_payload(std::string payload) {
        payloads_.push_back(std::move(payload));
        return payloads_.size() - 1;
    }

    inline void push(ConnectionId id, session_ptr session, std::size_t payload) {
        assert(payload < payloads_.size() && "Batch::push() with unknown payload handle");
        deliveries_.push_back(Delivery{id, std::move(session), payload});
    }

    // Adds one delivery of `payload` per recipient (Registry::Recipient-like range)
    template <typename Recipients>
    inline void push_all(const Recipients& recipients, std::size_t payload) {
        for (const auto& r : recipients) {
            push(r.id, r.session, payload);
        }
    }

    [[nodiscard]]
    inline bool empty() const noexcept {
        return deliveries_.empty();
    }

    [[nodiscard]]
    inline std::size_t size() const noexcept {
        return deliveries_.size();
    }

    // Performs every send. Never throws from a send; failures are reported.
    [[nodiscard]]
    inline Report deliver(telemetry::Coordinator& telemetry) const {
        (void)telemetry; // telemetry may be compiled out
        Report report;
        report.outcomes.reserve(deliveries_.size());
        for (const auto& d : deliveries_) {
            const std::string& frame = payloads_[d.payload];
            transport::Error err = d.session ? d.session->send(frame) : transport::Error::Closed;
            ++report.attempted;
            if (err == transport::Error::None) {
                ++report.delivered;
                SB_TL1( telemetry.messages_sent_total.inc() );
                SB_TRACE("[FANOUT] -> #" << d.id << " " << frame);
            }
            else {
                SB_TL1( telemetry.send_failures_total.inc() );
                SB_WARN("[FANOUT] Send to connection #" << d.id << " failed (" << to_string(err) << ")");
            }
            report.outcomes.push_back(Outcome{d.id, err});
        }
        return report;
    }

private:
    struct Delivery {
        ConnectionId id;
        session_ptr session;
        std::size_t payload;
    };

    std::vector<std::string> payloads_;
    std::vector<Delivery> deliveries_;
};

} // namespace signalbox::core::fanout
