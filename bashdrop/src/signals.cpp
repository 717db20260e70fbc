#include "signals.h"
#include "relay.h"
#include "logging.h"

#include <atomic>
#include <cerrno>
#include <cstring>

namespace bashdrop {

namespace {

/* Read from the handler; std::atomic pointers are lock-free on Linux */
std::atomic<RelayEngine*> g_stop_target{nullptr};

void on_stop_signal(int /*sig*/) {
    RelayEngine* engine = g_stop_target.load();
    if (engine) {
        engine->stop();
    }
}

}  // namespace

StopSignalGuard::StopSignalGuard(RelayEngine& engine) {
    std::memset(&previous_int_, 0, sizeof(previous_int_));
    std::memset(&previous_term_, 0, sizeof(previous_term_));

    /* Publish the target before the handler can run */
    g_stop_target.store(&engine);

    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = on_stop_signal;
    sigemptyset(&action.sa_mask);

    if (sigaction(SIGINT, &action, &previous_int_) < 0) {
        logging::error(std::string("sigaction(SIGINT) failed: ") + strerror(errno));
        g_stop_target.store(nullptr);
        return;
    }
    if (sigaction(SIGTERM, &action, &previous_term_) < 0) {
        logging::error(std::string("sigaction(SIGTERM) failed: ") + strerror(errno));
        sigaction(SIGINT, &previous_int_, nullptr);
        g_stop_target.store(nullptr);
        return;
    }
    installed_ = true;
}

StopSignalGuard::~StopSignalGuard() {
    if (installed_) {
        sigaction(SIGINT, &previous_int_, nullptr);
        sigaction(SIGTERM, &previous_term_, nullptr);
    }
    g_stop_target.store(nullptr);
}

}  // namespace bashdrop
