#pragma once

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "common/cli/validators.hpp"
#include "lcr/log/logger.hpp"

namespace signalbox::examples::cli::console {

struct Params {
    std::string script      = "";       // empty: read stdin
    std::string log_level   = "info";
    bool echo_status        = false;
    std::uint32_t prune     = 0;        // 0: retain failing connections

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n  Script      : " << (script.empty() ? "<stdin>" : script)
           << "\n  Log Level   : " << log_level
           << "\n  Echo status : " << (echo_status ? "yes" : "no")
           << "\n  Prune after : " << (prune == 0 ? std::string("never") : std::to_string(prune) + " failed sends")
           << "\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("--script", params.script, "Command file to replay (default: read commands from stdin)")->check(CLI::ExistingFile);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error | off")->check(log_level_validator)->default_val(params.log_level);
    app.add_flag("--echo-status", params.echo_status, "Print the status poll body after every command");
    app.add_option("--prune", params.prune, "Remove a connection after N consecutive failed sends (0 = never; 1, 3 or 5)")->check(prune_validator)->default_val(params.prune);

    app.footer(
        "Commands:\n"
        "  connect <identity>     open a connection, prints its handle\n"
        "  send <handle> <json>   feed a raw inbound frame\n"
        "  set <handle> <color>   shorthand for a color_change frame\n"
        "  disconnect <handle>    close the connection\n"
        "  fail <handle> on|off   make that connection's sends fail\n"
        "  status | dump | help | quit"
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    lcr::log::Logger::instance().set_level(params.log_level);
    return params;
}

} // namespace signalbox::examples::cli::console
