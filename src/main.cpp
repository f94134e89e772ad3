#include "config.hpp"
#include "device.hpp"
#include "discovery.hpp"
#include "install.hpp"
#include "relay.hpp"
#include "session.hpp"
#include "shutdown.hpp"

#include <string.h>
#include <unistd.h>

#include <cstdlib>
#include <iostream>
#include <system_error>

using namespace anxious;

namespace {

int run_relay(const Config& config) {
    if (geteuid() != 0) {
        std::cerr << "run as root" << std::endl;
        return EXIT_FAILURE;
    }

    ShutdownSignal shutdown;
    shutdown.install();

    std::unique_ptr<Session> session;
    try {
        session = Session::open(config, std::cout);
    } catch (const DeviceError& e) {
        std::cerr << "[fatal] " << kind_name(e.kind()) << ": " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    std::cout << "[relay] base=" << config.base_sensitivity << " max=" << config.max_sensitivity
              << " ramp=" << config.ramp_rate << (config.debug ? " (debug)" : "") << std::endl;
    RelayLoop relay(config, session->physical(), std::cout);
    bool clean = relay.run(session->physical(), session->virtual_device(), shutdown);

    const RelayStats& st = relay.stats();
    std::cout << "[relay] " << state_name(relay.state()) << ": forwarded " << st.forwarded << ", scroll in "
              << st.scroll_in << " out " << st.scroll_out << " suppressed " << st.suppressed << std::endl;
    if (shutdown.signal_number()) {
        std::cout << "[relay] received " << strsignal(shutdown.signal_number()) << std::endl;
    }

    // Teardown happens here, before the exit status is returned.
    session.reset();

    if (!clean) {
        const DeviceError& e = *relay.failure();
        std::cerr << "[fatal] " << kind_name(e.kind()) << ": " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    bool show_install = !is_installed_copy(DEFAULT_SERVICE_NAME);

    Args args;
    try {
        args = parse_args(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << "[config] " << e.what() << std::endl;
        usage(argv[0], show_install);
        return EXIT_FAILURE;
    }

    try {
        switch (args.command) {
            case Command::Help:
                usage(argv[0], show_install);
                return 0;
            case Command::ListDevices:
                print_candidates(std::cout, scan_candidates());
                return 0;
            case Command::Install:
                if (!show_install) {
                    std::cerr << "install option is not available for the installed binary" << std::endl;
                    usage(argv[0], show_install);
                    return EXIT_FAILURE;
                }
                return install_service(args);
            case Command::Uninstall:
                return uninstall_service(args);
            case Command::Run:
                return run_relay(args.config);
        }
    } catch (const std::system_error& e) {
        std::cerr << "[fatal] " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_FAILURE;
}
