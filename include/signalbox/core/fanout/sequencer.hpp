#pragma once

#include <mutex>
#include <condition_variable>
#include <cstdint>
#include <utility>


namespace signalbox::core::fanout {

/*
===============================================================================
 fanout::Sequencer
===============================================================================

Serves fan-outs strictly in ticket order.

Tickets are taken while the Coordinator state lock is held, so ticket order
equals commit order. serve() runs the work for a ticket only once every
earlier ticket has been served, then hands over to the next one.

The state lock is never held while waiting here: mutations and status reads
proceed while earlier fan-outs are still sending.

Every taken ticket MUST be served exactly once, otherwise later tickets wait
forever. serve() advances the sequence even if the work throws.
===============================================================================
*/

class Sequencer {
public:
    using Ticket = std::uint64_t;

    Sequencer() = default;
    Sequencer(const Sequencer&) = delete;
    Sequencer& operator=(const Sequencer&) = delete;

    // PRECONDITION: called under the lock that orders commits
    [[nodiscard]]
    inline Ticket take() noexcept {
        return next_ticket_++;
    }

    template <typename Work>
    inline decltype(auto) serve(Ticket ticket, Work&& work) {
        std::unique_lock<std::mutex> lock(mutex_);
        turn_.wait(lock, [&] { return serving_ == ticket; });

        // Hands the turn to the next ticket on scope exit (normal or unwinding)
        struct Handover {
            Sequencer& self;
            std::unique_lock<std::mutex>& lock;
            ~Handover() {
                ++self.serving_;
                lock.unlock();
                self.turn_.notify_all();
            }
        } handover{*this, lock};

        return std::forward<Work>(work)();
    }

private:
    Ticket next_ticket_{0};   // guarded by the caller's commit lock
    Ticket serving_{0};       // guarded by mutex_

    std::mutex mutex_;
    std::condition_variable turn_;
};

} // namespace signalbox::core::fanout
