#include "config.h"
#include "crypto.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <vector>

namespace bashdrop {

namespace {

bool parse_long(const char* text, long min, long max, long& out) {
    if (text == nullptr || *text == '\0') {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0') {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

bool takes_value(int i, int argc, const char* name, std::string& error) {
    if (i + 1 >= argc) {
        error = std::string("Missing value for ") + name;
        return false;
    }
    return true;
}

}  // namespace

std::string usage(const char* prog) {
    std::ostringstream out;
    out << "Usage: " << prog << " <public-host> [filename] [password] [options]\n"
        << "\n"
        << "  public-host          address or domain the peers will connect to (display only)\n"
        << "  filename             name shown in the printed commands (default: "
        << protocol::DEFAULT_FILENAME << ")\n"
        << "  password             password for the encrypted mode (default: random, "
        << crypto::DEFAULT_PASSWORD_LENGTH << " chars)\n"
        << "\nOptions:\n"
        << "  -p, --port N         TCP port to listen on (default: " << protocol::DEFAULT_PORT << ")\n"
        << "  --bind ADDR          IPv4 address to bind (default: " << protocol::DEFAULT_BIND_ADDRESS << ")\n"
        << "  --mode M             advertise only mode M: plain, integrity, encrypted\n"
        << "                       (repeatable; default: all three)\n"
        << "  --pairing-timeout S  seconds to wait for the receiver once the sender\n"
        << "                       has connected (default: " << protocol::DEFAULT_PAIRING_TIMEOUT_SECONDS << ")\n"
        << "  --chunk-kb N         forwarding buffer size in KiB (default: "
        << protocol::DEFAULT_CHUNK_SIZE / 1024 << ")\n"
        << "  --log-file PATH      log file, empty to disable (default: " << DEFAULT_LOG_FILE << ")\n"
        << "  --no-color           plain output without ANSI colors\n"
        << "  --verbose            enable debug logging\n"
        << "  -h, --help           show this help\n"
        << "\nThe relay pairs the first connection (sender) with the second (receiver),\n"
        << "forwards the sender's bytes once, and exits.\n"
        << "\nExit status: 0 done, 1 usage, 2 bind error, 3 pairing timeout,\n"
        << "4 stream I/O error, 130 interrupted.\n"
        << "\nExample:\n"
        << "  " << prog << " relay.example.com backup.tar.gz -p 9000\n";
    return out.str();
}

/*
 * Implementation: parse_args
 *
 * Options may appear anywhere; the remaining words are, in order, the
 * public host, the filename and the password.
 */
bool parse_args(int argc, const char* const argv[], RelayConfig& config, std::string& error) {
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        long value = 0;

        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            config.show_help = true;
            return true;
        } else if (std::strcmp(arg, "-p") == 0 || std::strcmp(arg, "--port") == 0) {
            if (!takes_value(i, argc, arg, error)) return false;
            if (!parse_long(argv[++i], 1, 65535, value)) {
                error = std::string("Invalid port: ") + argv[i];
                return false;
            }
            config.session.port = static_cast<uint16_t>(value);
        } else if (std::strcmp(arg, "--bind") == 0) {
            if (!takes_value(i, argc, arg, error)) return false;
            std::string addr = argv[++i];
            in_addr parsed{};
            if (inet_pton(AF_INET, addr.c_str(), &parsed) != 1) {
                error = "Invalid bind address: " + addr;
                return false;
            }
            config.session.bind_address = addr;
        } else if (std::strcmp(arg, "--mode") == 0) {
            if (!takes_value(i, argc, arg, error)) return false;
            TransferMode mode;
            if (!parse_mode(argv[++i], mode)) {
                error = std::string("Unknown mode: ") + argv[i] + " (expected plain, integrity or encrypted)";
                return false;
            }
            config.session.modes.push_back(mode);
        } else if (std::strcmp(arg, "--pairing-timeout") == 0) {
            if (!takes_value(i, argc, arg, error)) return false;
            if (!parse_long(argv[++i], 1, protocol::MAX_PAIRING_TIMEOUT_SECONDS, value)) {
                error = std::string("Invalid pairing timeout: ") + argv[i] + " (1-" +
                        std::to_string(protocol::MAX_PAIRING_TIMEOUT_SECONDS) + " seconds)";
                return false;
            }
            config.relay.pairing_timeout = std::chrono::seconds(value);
        } else if (std::strcmp(arg, "--chunk-kb") == 0) {
            if (!takes_value(i, argc, arg, error)) return false;
            long min_kb = static_cast<long>(protocol::MIN_CHUNK_SIZE / 1024);
            long max_kb = static_cast<long>(protocol::MAX_CHUNK_SIZE / 1024);
            if (!parse_long(argv[++i], min_kb, max_kb, value)) {
                error = std::string("Invalid --chunk-kb: ") + argv[i] + " (" + std::to_string(min_kb) +
                        "-" + std::to_string(max_kb) + ")";
                return false;
            }
            config.relay.chunk_size = static_cast<size_t>(value) * 1024;
        } else if (std::strcmp(arg, "--log-file") == 0) {
            if (!takes_value(i, argc, arg, error)) return false;
            config.log_file = argv[++i];
        } else if (std::strcmp(arg, "--no-color") == 0) {
            config.color = false;
        } else if (std::strcmp(arg, "--verbose") == 0) {
            config.verbose = true;
        } else if (arg[0] == '-' && arg[1] != '\0') {
            error = std::string("Unknown option: ") + arg;
            return false;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        error = "Missing public host";
        return false;
    }
    if (positional.size() > 3) {
        error = "Unexpected argument: " + positional[3];
        return false;
    }

    config.session.host = positional[0];
    if (config.session.host.empty()) {
        error = "Public host must not be empty";
        return false;
    }
    if (positional.size() > 1) {
        if (positional[1].empty()) {
            error = "Filename must not be empty";
            return false;
        }
        config.session.filename = positional[1];
    }
    if (positional.size() > 2) {
        if (positional[2].empty()) {
            error = "Password must not be empty";
            return false;
        }
        config.session.password = positional[2];
    }
    return true;
}

}  // namespace bashdrop
