#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include "signalbox/core/transport/concepts.hpp"
#include "signalbox/core/transport/error.hpp"


namespace signalbox::examples::console {

// -----------------------------------------------------------------------------
// Session
//
// Stands in for a WebSocket session: every outbound frame is printed as
//
//   -> [<handle>:<identity>] <json>
//
// The output stream is shared by all sessions of a console, so writes go
// through the console-wide mutex.
// -----------------------------------------------------------------------------
class Session {
public:
    Session(std::uint64_t handle, std::string identity, std::ostream& os, std::mutex& os_mutex)
        : handle_(handle)
        , identity_(std::move(identity))
        , os_(os)
        , os_mutex_(os_mutex)
    {
    }

    inline core::transport::Error send(std::string_view frame) noexcept {
        if (failing_.load(std::memory_order_relaxed)) {
            return core::transport::Error::TransportFailure;
        }
        std::lock_guard<std::mutex> lock(os_mutex_);
        os_ << "-> [" << handle_ << ':' << identity_ << "] " << frame << '\n';
        return os_.good() ? core::transport::Error::None : core::transport::Error::Closed;
    }

    inline void set_failing(bool on) noexcept {
        failing_.store(on, std::memory_order_relaxed);
    }

    [[nodiscard]]
    inline std::uint64_t handle() const noexcept {
        return handle_;
    }

    [[nodiscard]]
    inline const std::string& identity() const noexcept {
        return identity_;
    }

private:
    std::uint64_t handle_;
    std::string identity_;
    std::ostream& os_;
    std::mutex& os_mutex_;
    std::atomic<bool> failing_{false};
};

static_assert(core::transport::SessionConcept<Session>);

} // namespace signalbox::examples::console
