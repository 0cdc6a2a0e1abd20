#include <cstdlib>
#include <fstream>
#include <iostream>

#include "signalbox.hpp"
#include "common/cli/console.hpp"
#include "common/console/session.hpp"
#include "common/console/shell.hpp"

using namespace signalbox;
using namespace signalbox::examples;


// -----------------------------------------------------------------------------
// Runs one console session against a Coordinator built with FailurePolicy
// -----------------------------------------------------------------------------
template <core::policy::FanoutPolicy FailurePolicy>
int run(const cli::console::Params& params) {
    core::telemetry::Coordinator telemetry;
    core::Coordinator<console::Session, FailurePolicy> coordinator{telemetry};
    console::Shell<decltype(coordinator)> shell{coordinator, std::cout, params.echo_status};

    if (params.script.empty()) {
        shell.run(std::cin);
    }
    else {
        std::ifstream script{params.script};
        if (!script) {
            SB_ERROR("[CONSOLE] Cannot open script " << params.script);
            return EXIT_FAILURE;
        }
        shell.run(script);
    }
    shell.close_all();

    if (lcr::log::Logger::instance().enabled(lcr::log::Level::Debug)) {
        telemetry.debug_dump(std::cout);
    }
    return shell.errors() == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}


// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    const auto params = cli::console::configure(argc, argv,
        "signalbox - Console Coordinator\n"
        "Drives a shared signal lamp coordinator from line commands.\n"
        "Each connection prints the frames a browser client would receive.\n");

    if (lcr::log::Logger::instance().enabled(lcr::log::Level::Debug)) {
        params.dump("Configuration", std::cout);
    }

    switch (params.prune) {
        case 1:  return run<core::policy::fanout::Prune<1>>(params);
        case 3:  return run<core::policy::fanout::Prune<3>>(params);
        case 5:  return run<core::policy::fanout::Prune<5>>(params);
        default: return run<core::policy::fanout::Retain>(params);
    }
}
