#ifndef BASHDROP_CONNECTION_H
#define BASHDROP_CONNECTION_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <memory>
#include <functional>
#include <chrono>

#include "protocol.h"

namespace bashdrop {

/*
 * PeerConnection
 *
 * One accepted TCP connection, tagged with the role it was given.
 * The socket is non-blocking; reads and writes report WOULD_BLOCK instead
 * of suspending, and the RelayEngine event loop decides when to retry.
 *
 * Owns the descriptor: it is closed on destruction, and close() may be
 * called any number of times.
 */
class PeerConnection {
public:
    enum class IoStatus {
        OK,
        WOULD_BLOCK,
        CLOSED,     /* orderly end-of-stream from the peer */
        ERROR
    };

    PeerConnection(int socket_fd, Role role, const std::string& peer_addr, uint16_t peer_port);
    ~PeerConnection();

    PeerConnection(const PeerConnection&) = delete;
    PeerConnection& operator=(const PeerConnection&) = delete;
    PeerConnection(PeerConnection&& other) noexcept;
    PeerConnection& operator=(PeerConnection&& other) noexcept;

    /*
     * Reads at most len bytes. On OK, n holds the number of bytes read (> 0).
     */
    IoStatus read_some(uint8_t* buf, size_t len, size_t& n);

    /*
     * Writes at most len bytes. On OK, n holds the number written, which may
     * be less than len.
     */
    IoStatus write_some(const uint8_t* data, size_t len, size_t& n);

    /*
     * Orderly half-close of our sending direction (FIN).
     */
    bool shutdown_write();

    /*
     * Reads and drops whatever input is currently queued, without blocking.
     * @return number of bytes discarded
     */
    size_t discard_input();

    /*
     * Waits, up to the limit, until the kernel send queue is empty, i.e. the
     * peer has acknowledged every byte written so far.
     * @return true if the queue drained in time
     */
    bool wait_send_queue_empty(std::chrono::milliseconds limit);

    /*
     * Closes with a TCP reset instead of a FIN, so the peer observes an
     * error rather than a clean end-of-stream.
     */
    void abort();

    void close();

    int socket_fd() const { return socket_fd_; }
    Role role() const { return role_; }
    const std::string& peer_addr() const { return peer_addr_; }
    uint16_t peer_port() const { return peer_port_; }
    bool is_open() const { return socket_fd_ >= 0; }

    /* errno of the last failed operation, 0 if none */
    int last_errno() const { return last_errno_; }

    /* e.g. "sender 203.0.113.7:51422" */
    std::string describe() const;

private:
    int socket_fd_;
    Role role_;
    std::string peer_addr_;
    uint16_t peer_port_;
    int last_errno_ = 0;
};

/*
 * Acceptor
 *
 * Owns the listening socket and hands out at most one connection per role:
 * the first accepted connection becomes the SENDER, the second the RECEIVER.
 *
 * As soon as the second role is filled, any connection already waiting in
 * the backlog is accepted and closed without exchanging data, and the
 * listening socket is closed so later attempts are refused by the kernel.
 */
class Acceptor {
public:
    using AcceptCallback = std::function<void(std::unique_ptr<PeerConnection>)>;

    Acceptor(const std::string& bind_address, uint16_t port, int role_count = protocol::ROLE_COUNT);
    ~Acceptor();

    Acceptor(const Acceptor&) = delete;
    Acceptor& operator=(const Acceptor&) = delete;

    /*
     * Creates, binds and starts listening (non-blocking).
     * @return false if the address could not be bound; last_error() says why
     */
    bool open();

    /*
     * Accepts every connection currently pending. Each connection that
     * fills a role is passed to the callback.
     *
     * @return false on an accept() error that retrying cannot clear (e.g.
     *         EMFILE); last_error() says why. The listener stays readable
     *         in that case, so the caller must stop polling it.
     */
    bool accept_pending(const AcceptCallback& callback);

    /*
     * Stops listening. Safe to call repeatedly.
     */
    void close();

    bool is_open() const { return listen_fd_ >= 0; }
    int listen_fd() const { return listen_fd_; }

    /* Port actually bound; differs from the requested one when that was 0 */
    uint16_t bound_port() const { return bound_port_; }

    int roles_filled() const { return roles_filled_; }
    size_t rejected_count() const { return rejected_count_; }
    const std::string& last_error() const { return last_error_; }

private:
    std::string bind_address_;
    uint16_t port_;
    uint16_t bound_port_;
    int listen_fd_;
    int role_count_;
    int roles_filled_ = 0;
    size_t rejected_count_ = 0;
    std::string last_error_;

    void reject(int client_fd, const std::string& peer);
    bool fail_open(const std::string& what);
};

bool set_nonblocking(int fd);

}  // namespace bashdrop

#endif  // BASHDROP_CONNECTION_H
