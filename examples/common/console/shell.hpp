#pragma once

#include <cstdint>
#include <istream>
#include <map>
#include <memory>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

#include "signalbox/core.hpp"
#include "common/console/session.hpp"
#include "lcr/json.hpp"
#include "lcr/log/logger.hpp"


namespace signalbox::examples::console {

/*
===============================================================================
 Console Shell
===============================================================================

Line-oriented driver for a Coordinator. Each connection is a Session that
prints its outbound frames, bound through a session::Lease exactly as a
network transport would bind a WebSocket.

Connections are addressed by console handles (1, 2, ...), assigned by the
shell in `connect` order. Blank lines and lines starting with '#' are skipped.

Command errors are reported on the output stream and counted; they never
stop the shell.
===============================================================================
*/

template <typename Coordinator>
class Shell {
    using Lease = core::session::Lease<Coordinator>;

    // Map node owns both: the lease never moves once constructed
    struct Slot {
        std::shared_ptr<Session> session;
        Lease lease;

        Slot(std::shared_ptr<Session> s, Coordinator& coordinator, std::string identity)
            : session(s)
            , lease(coordinator, std::move(s), std::move(identity))
        {}
    };

public:
    Shell(Coordinator& coordinator, std::ostream& os, bool echo_status)
        : coordinator_(coordinator)
        , os_(os)
        , echo_status_(echo_status)
    {
    }

    // Runs until end of input or `quit`
    inline void run(std::istream& in) {
        std::string line;
        while (std::getline(in, line)) {
            if (!execute(line)) {
                break;
            }
        }
    }

    // Returns false on `quit`
    inline bool execute(std::string_view line) {
        std::istringstream iss{std::string(line)};
        std::string command;
        if (!(iss >> command) || command.front() == '#') {
            return true;
        }
        if (command == "quit" || command == "exit") {
            return false;
        }

        if (command == "connect")         cmd_connect_(iss);
        else if (command == "send")       cmd_send_(iss);
        else if (command == "set")        cmd_set_(iss);
        else if (command == "disconnect") cmd_disconnect_(iss);
        else if (command == "fail")       cmd_fail_(iss);
        else if (command == "status")     print_status_();
        else if (command == "dump")       dump_();
        else if (command == "help")       help_();
        else                              error_("unknown command '" + command + "' (try 'help')");

        if (echo_status_ && command != "status") {
            print_status_();
        }
        return true;
    }

    // Closes every remaining lease in handle order
    inline void close_all() {
        while (!slots_.empty()) {
            slots_.begin()->second.lease.close();
            slots_.erase(slots_.begin());
        }
    }

    [[nodiscard]]
    inline std::size_t errors() const noexcept {
        return errors_;
    }

private:
    Coordinator& coordinator_;
    std::ostream& os_;
    std::mutex os_mutex_;   // shared with every Session
    bool echo_status_;

    std::map<std::uint64_t, Slot> slots_;
    std::uint64_t next_handle_{1};
    std::size_t errors_{0};

private:
    // -------------------------------------------------------------------------
    // Commands
    // -------------------------------------------------------------------------

    inline void cmd_connect_(std::istringstream& iss) {
        std::string identity;
        if (!(iss >> identity)) {
            error_("usage: connect <identity>");
            return;
        }
        const std::uint64_t handle = next_handle_++;
        auto session = std::make_shared<Session>(handle, identity, os_, os_mutex_);
        auto [it, inserted] = slots_.emplace(
            std::piecewise_construct,
            std::forward_as_tuple(handle),
            std::forward_as_tuple(session, coordinator_, identity)
        );
        (void)inserted;
        const auto& joined = it->second.lease.joined();
        say_("connected " + std::to_string(handle) + " '" + identity + "' as connection #"
             + std::to_string(joined.id) + (joined.is_controller ? " (controller)" : " (observer)"));
    }

    inline void cmd_send_(std::istringstream& iss) {
        Slot* slot = lookup_(iss, "usage: send <handle> <json>");
        if (slot == nullptr) {
            return;
        }
        std::string raw;
        std::getline(iss >> std::ws, raw);
        report_(slot->lease.on_message(raw));
    }

    inline void cmd_set_(std::istringstream& iss) {
        Slot* slot = lookup_(iss, "usage: set <handle> <color>");
        if (slot == nullptr) {
            return;
        }
        std::string color;
        if (!(iss >> color)) {
            error_("usage: set <handle> <color>");
            return;
        }
        std::string raw = "{\"type\":\"color_change\",\"color\":\"" + lcr::json::escape(color) + "\"}";
        report_(slot->lease.on_message(raw));
    }

    inline void cmd_disconnect_(std::istringstream& iss) {
        std::uint64_t handle = 0;
        if (!(iss >> handle)) {
            error_("usage: disconnect <handle>");
            return;
        }
        auto it = slots_.find(handle);
        if (it == slots_.end()) {
            error_("no such handle " + std::to_string(handle));
            return;
        }
        it->second.lease.close();
        slots_.erase(it);
        say_("disconnected " + std::to_string(handle));
    }

    inline void cmd_fail_(std::istringstream& iss) {
        Slot* slot = lookup_(iss, "usage: fail <handle> on|off");
        if (slot == nullptr) {
            return;
        }
        std::string mode;
        iss >> mode;
        if (mode != "on" && mode != "off") {
            error_("usage: fail <handle> on|off");
            return;
        }
        slot->session->set_failing(mode == "on");
        say_("sends to " + std::to_string(slot->session->handle()) + (mode == "on" ? " now fail" : " restored"));
    }

    // -------------------------------------------------------------------------
    // Output
    // -------------------------------------------------------------------------

    inline void report_(const core::session::Inbound& in) {
        std::string text = "frame " + std::string(core::protocol::parser::to_string(in.parse));
        if (in.outcome.has()) {
            text += " -> " + std::string(core::to_string(in.outcome.value()));
        }
        say_(text);
    }

    inline void print_status_() {
        const core::protocol::schema::Status body{coordinator_.status()};
        say_("status " + core::protocol::serialize(body));
    }

    inline void dump_() {
        std::lock_guard<std::mutex> lock(os_mutex_);
        coordinator_.telemetry().debug_dump(os_);
        os_ << std::flush;
    }

    inline void help_() {
        say_("commands: connect <identity> | send <handle> <json> | set <handle> <color> | "
             "disconnect <handle> | fail <handle> on|off | status | dump | quit");
    }

    inline void say_(const std::string& text) {
        std::lock_guard<std::mutex> lock(os_mutex_);
        os_ << text << '\n';
    }

    inline void error_(const std::string& text) {
        ++errors_;
        SB_WARN("[CONSOLE] " << text);
        say_("error: " + text);
    }

    [[nodiscard]]
    inline Slot* lookup_(std::istringstream& iss, const char* usage) {
        std::uint64_t handle = 0;
        if (!(iss >> handle)) {
            error_(usage);
            return nullptr;
        }
        auto it = slots_.find(handle);
        if (it == slots_.end()) {
            error_("no such handle " + std::to_string(handle));
            return nullptr;
        }
        return &it->second;
    }
};

} // namespace signalbox::examples::console
