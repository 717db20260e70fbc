/*
 * config.h
 *
 * Command-line configuration for the relay.
 *
 *   bashdrop <public-host> [filename] [password] [options]
 */

#ifndef BASHDROP_CONFIG_H
#define BASHDROP_CONFIG_H

#include <string>

#include "relay.h"
#include "session.h"

namespace bashdrop {

constexpr const char* DEFAULT_LOG_FILE = "bashdrop.logs";

struct RelayConfig {
    SessionParams session;
    RelayOptions relay;
    std::string log_file = DEFAULT_LOG_FILE;
    bool verbose = false;
    bool color = true;
    bool show_help = false;
};

/*
 * Parses and validates argv into config.
 *
 * @return false with a one-line explanation in error if the arguments are
 *         unusable; true otherwise (including when --help was requested)
 */
bool parse_args(int argc, const char* const argv[], RelayConfig& config, std::string& error);

std::string usage(const char* prog);

}  // namespace bashdrop

#endif  // BASHDROP_CONFIG_H
