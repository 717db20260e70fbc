#include "protocol.h"

namespace bashdrop {

const char* role_name(Role role) {
    switch (role) {
        case Role::SENDER: return "sender";
        case Role::RECEIVER: return "receiver";
    }
    return "unknown";
}

const char* state_name(RelayState state) {
    switch (state) {
        case RelayState::WAITING_FOR_SENDER: return "WAITING_FOR_SENDER";
        case RelayState::WAITING_FOR_RECEIVER: return "WAITING_FOR_RECEIVER";
        case RelayState::STREAMING: return "STREAMING";
        case RelayState::DONE: return "DONE";
        case RelayState::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

const char* error_name(RelayError error) {
    switch (error) {
        case RelayError::NONE: return "none";
        case RelayError::BIND_ERROR: return "BindError";
        case RelayError::PAIRING_TIMEOUT: return "PairingTimeout";
        case RelayError::STREAM_IO_ERROR: return "StreamIOError";
        case RelayError::INTERRUPTED: return "Interrupted";
    }
    return "unknown";
}

int exit_code_for(RelayError error) {
    switch (error) {
        case RelayError::NONE: return protocol::EXIT_DONE;
        case RelayError::BIND_ERROR: return protocol::EXIT_BIND_ERROR;
        case RelayError::PAIRING_TIMEOUT: return protocol::EXIT_PAIRING_TIMEOUT;
        case RelayError::STREAM_IO_ERROR: return protocol::EXIT_STREAM_IO_ERROR;
        case RelayError::INTERRUPTED: return protocol::EXIT_INTERRUPTED;
    }
    return protocol::EXIT_STREAM_IO_ERROR;
}

}  // namespace bashdrop
