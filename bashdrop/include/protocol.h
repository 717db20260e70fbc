/*
 * protocol.h
 *
 * Relay constants and the small enums shared by the acceptor, the engine
 * and the command-line front end.
 *
 * The relay imposes no framing of its own on the TCP stream: whatever the
 * sender writes is what the receiver reads.
 */

#ifndef BASHDROP_PROTOCOL_H
#define BASHDROP_PROTOCOL_H

#include <cstdint>
#include <cstddef>

namespace bashdrop {
namespace protocol {

/*
 * =============================================================================
 * Defaults
 * =============================================================================
 */

constexpr uint16_t DEFAULT_PORT = 9000;
constexpr const char* DEFAULT_BIND_ADDRESS = "0.0.0.0";
constexpr const char* DEFAULT_FILENAME = "file";

/* Forwarding buffer: 128 KiB, allowed range 4 KiB .. 64 MiB */
constexpr size_t DEFAULT_CHUNK_SIZE = 131072;
constexpr size_t MIN_CHUNK_SIZE = 4096;
constexpr size_t MAX_CHUNK_SIZE = 64 * 1024 * 1024;

/* Wait for the second role after the first is accepted */
constexpr int DEFAULT_PAIRING_TIMEOUT_SECONDS = 120;
constexpr int MAX_PAIRING_TIMEOUT_SECONDS = 86400;

/* Event loop tick used to observe deadlines and stop requests */
constexpr int POLL_INTERVAL_MS = 200;

/* Expected number of roles per session: one sender, one receiver */
constexpr int ROLE_COUNT = 2;

constexpr int LISTEN_BACKLOG = 8;

/*
 * =============================================================================
 * Process exit codes
 * =============================================================================
 */

constexpr int EXIT_DONE = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_BIND_ERROR = 2;
constexpr int EXIT_PAIRING_TIMEOUT = 3;
constexpr int EXIT_STREAM_IO_ERROR = 4;
constexpr int EXIT_INTERRUPTED = 130;

}  // namespace protocol

/*
 * Role of a peer connection, assigned by arrival order.
 */
enum class Role : uint8_t {
    SENDER = 0,
    RECEIVER = 1
};

/*
 * Lifecycle of the single relay session.
 */
enum class RelayState : uint8_t {
    WAITING_FOR_SENDER,
    WAITING_FOR_RECEIVER,
    STREAMING,
    DONE,
    FAILED
};

/*
 * Reason a session failed. NONE for a completed transfer.
 */
enum class RelayError : uint8_t {
    NONE,
    BIND_ERROR,
    PAIRING_TIMEOUT,
    STREAM_IO_ERROR,
    INTERRUPTED
};

const char* role_name(Role role);
const char* state_name(RelayState state);
const char* error_name(RelayError error);

/*
 * Maps a failure kind to the process exit status (0 for NONE).
 */
int exit_code_for(RelayError error);

}  // namespace bashdrop

#endif  // BASHDROP_PROTOCOL_H
