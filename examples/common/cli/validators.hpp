#pragma once

#include <CLI/CLI.hpp>


namespace signalbox::examples::cli {

// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::IsMember({"trace", "debug", "info", "warn", "error", "off"});


// -------------------------------------------------------------
// Prune threshold validator (thresholds compiled into the console)
// -------------------------------------------------------------
inline auto prune_validator = CLI::IsMember({0u, 1u, 3u, 5u});

} // namespace signalbox::examples::cli
