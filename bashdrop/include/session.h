/*
 * session.h
 *
 * SessionDescriptor: the one record describing this relay run.
 *
 * Created once at startup, before anything is announced or bound, and
 * immutable afterwards. The acceptor and the engine receive it by
 * reference; nothing about a session lives in globals.
 */

#ifndef BASHDROP_SESSION_H
#define BASHDROP_SESSION_H

#include <cstdint>
#include <string>
#include <vector>

#include "mode.h"
#include "protocol.h"

namespace bashdrop {

/*
 * SessionParams
 *
 * Operator-supplied values. Empty password or mode set means "use the
 * default" (random password, all modes).
 */
struct SessionParams {
    std::string host;
    std::string bind_address = protocol::DEFAULT_BIND_ADDRESS;
    uint16_t port = protocol::DEFAULT_PORT;   /* 0 binds an ephemeral port */
    std::string filename = protocol::DEFAULT_FILENAME;
    std::string password;
    std::vector<TransferMode> modes;
};

class SessionDescriptor {
public:
    /*
     * Fills in defaults: generates a password when none was supplied
     * (crypto::init() must have been called) and advertises every mode
     * when the set is empty. Duplicate modes are dropped.
     */
    explicit SessionDescriptor(SessionParams params);

    const std::string& host() const { return host_; }
    const std::string& bind_address() const { return bind_address_; }
    uint16_t port() const { return port_; }
    const std::string& filename() const { return filename_; }
    const std::string& password() const { return password_; }
    const std::vector<TransferMode>& modes() const { return modes_; }

    bool password_generated() const { return password_generated_; }
    bool advertises(TransferMode mode) const;
    int role_count() const { return protocol::ROLE_COUNT; }

private:
    const std::string host_;
    const std::string bind_address_;
    const uint16_t port_;
    const std::string filename_;
    const bool password_generated_;
    const std::string password_;
    const std::vector<TransferMode> modes_;
};

}  // namespace bashdrop

#endif  // BASHDROP_SESSION_H
