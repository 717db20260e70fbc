/*
 * signals.h
 *
 * Routes SIGINT and SIGTERM to RelayEngine::stop() for as long as a
 * StopSignalGuard is alive.
 */

#ifndef BASHDROP_SIGNALS_H
#define BASHDROP_SIGNALS_H

#include <signal.h>

namespace bashdrop {

class RelayEngine;

/*
 * StopSignalGuard
 *
 * Installs the handlers on construction and restores the previous ones on
 * destruction, so the handler can never reach an engine that no longer
 * exists. Only one guard may be active at a time.
 */
class StopSignalGuard {
public:
    explicit StopSignalGuard(RelayEngine& engine);
    ~StopSignalGuard();

    StopSignalGuard(const StopSignalGuard&) = delete;
    StopSignalGuard& operator=(const StopSignalGuard&) = delete;

    /* false if sigaction() failed for either signal */
    bool installed() const { return installed_; }

private:
    struct sigaction previous_int_;
    struct sigaction previous_term_;
    bool installed_ = false;
};

}  // namespace bashdrop

#endif  // BASHDROP_SIGNALS_H
