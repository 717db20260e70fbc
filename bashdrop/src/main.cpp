// ============================================================
// main.cpp -- bashdrop relay entry point
// ============================================================

#include "announcement.h"
#include "config.h"
#include "crypto.h"
#include "logging.h"
#include "relay.h"
#include "session.h"
#include "signals.h"

#include <unistd.h>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>

using namespace bashdrop;

int main(int argc, char* argv[]) {
    RelayConfig cfg;
    std::string error;
    if (!parse_args(argc, argv, cfg, error)) {
        std::cerr << "ERROR: " << error << "\n\n" << usage(argv[0]);
        return protocol::EXIT_USAGE;
    }
    if (cfg.show_help) {
        std::cout << usage(argv[0]);
        return protocol::EXIT_DONE;
    }

    logging::configure(cfg.log_file, cfg.verbose ? logging::Level::DEBUG : logging::Level::INFO);

    if (!crypto::init()) {
        std::cerr << "FATAL: failed to initialize libsodium\n";
        return protocol::EXIT_USAGE;
    }

    bool color = cfg.color && isatty(STDOUT_FILENO);
    int pairing_timeout_s = static_cast<int>(
        std::chrono::duration_cast<std::chrono::seconds>(cfg.relay.pairing_timeout).count());

    SessionDescriptor session(std::move(cfg.session));
    logging::info("Starting relay for " + session.host() + ":" + std::to_string(session.port()) +
                  (session.password_generated() ? " (generated password)" : ""));

    Announcement announcement = announce(session);
    render_announcement(std::cout, announcement, color);

    std::signal(SIGPIPE, SIG_IGN);

    RelayEngine engine(session, cfg.relay);
    RelayOutcome outcome;
    {
        StopSignalGuard stop_on_signal(engine);
        if (!stop_on_signal.installed()) {
            std::cerr << "WARNING: Ctrl-C will not stop the relay cleanly\n";
        }

        if (engine.start()) {
            render_listening(std::cout, announcement, pairing_timeout_s, color);
        }
        outcome = engine.run();
    }

    render_outcome(outcome.succeeded() ? std::cout : std::cerr, outcome, color);
    return outcome.exit_code();
}
