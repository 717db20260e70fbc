#include "connection.h"
#include "logging.h"

#include <sys/socket.h>
#include <sys/ioctl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <linux/sockios.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <thread>

namespace bashdrop {

namespace {

constexpr size_t kDiscardBufferSize = 4096;
constexpr std::chrono::milliseconds kDrainPollInterval{10};

std::string endpoint(const std::string& addr, uint16_t port) {
    return addr + ":" + std::to_string(port);
}

/* accept() errors that concern only the connection being accepted */
bool transient_accept_error(int err) {
    switch (err) {
        case EINTR:
        case ECONNABORTED:
        case EPROTO:
        case EPERM:
        case ENETDOWN:
        case ENETUNREACH:
        case ENOPROTOOPT:
        case EHOSTDOWN:
        case EHOSTUNREACH:
        case ENONET:
        case EOPNOTSUPP:
            return true;
        default:
            return false;
    }
}

}  // namespace

bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) >= 0;
}

PeerConnection::PeerConnection(int socket_fd, Role role, const std::string& peer_addr, uint16_t peer_port)
    : socket_fd_(socket_fd)
    , role_(role)
    , peer_addr_(peer_addr)
    , peer_port_(peer_port) {
}

PeerConnection::~PeerConnection() {
    close();
}

PeerConnection::PeerConnection(PeerConnection&& other) noexcept
    : socket_fd_(other.socket_fd_)
    , role_(other.role_)
    , peer_addr_(std::move(other.peer_addr_))
    , peer_port_(other.peer_port_)
    , last_errno_(other.last_errno_) {
    other.socket_fd_ = -1;
}

PeerConnection& PeerConnection::operator=(PeerConnection&& other) noexcept {
    if (this != &other) {
        close();
        socket_fd_ = other.socket_fd_;
        role_ = other.role_;
        peer_addr_ = std::move(other.peer_addr_);
        peer_port_ = other.peer_port_;
        last_errno_ = other.last_errno_;

        other.socket_fd_ = -1;
    }
    return *this;
}

/*
 * Implementation: read_some
 *
 * Single non-blocking recv().
 * - recv == 0 is the peer's orderly half-close
 * - EINTR is retried, EAGAIN/EWOULDBLOCK reported to the caller
 * - Queued data is always returned before a pending reset error
 */
PeerConnection::IoStatus PeerConnection::read_some(uint8_t* buf, size_t len, size_t& n) {
    n = 0;
    if (socket_fd_ < 0) {
        last_errno_ = EBADF;
        return IoStatus::ERROR;
    }

    while (true) {
        ssize_t r = ::recv(socket_fd_, buf, len, 0);
        if (r > 0) {
            n = static_cast<size_t>(r);
            return IoStatus::OK;
        }
        if (r == 0) {
            return IoStatus::CLOSED;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return IoStatus::WOULD_BLOCK;
        }
        last_errno_ = errno;
        return IoStatus::ERROR;
    }
}

PeerConnection::IoStatus PeerConnection::write_some(const uint8_t* data, size_t len, size_t& n) {
    n = 0;
    if (socket_fd_ < 0) {
        last_errno_ = EBADF;
        return IoStatus::ERROR;
    }

    while (true) {
        /* MSG_NOSIGNAL: a vanished receiver must surface as EPIPE, not SIGPIPE */
        ssize_t w = ::send(socket_fd_, data, len, MSG_NOSIGNAL);
        if (w >= 0) {
            n = static_cast<size_t>(w);
            return IoStatus::OK;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return IoStatus::WOULD_BLOCK;
        }
        last_errno_ = errno;
        if (errno == EPIPE || errno == ECONNRESET) {
            return IoStatus::CLOSED;
        }
        return IoStatus::ERROR;
    }
}

bool PeerConnection::shutdown_write() {
    if (socket_fd_ < 0) {
        last_errno_ = EBADF;
        return false;
    }
    if (::shutdown(socket_fd_, SHUT_WR) < 0) {
        last_errno_ = errno;
        return false;
    }
    return true;
}

size_t PeerConnection::discard_input() {
    uint8_t scratch[kDiscardBufferSize];
    size_t total = 0;
    size_t n = 0;
    while (read_some(scratch, sizeof(scratch), n) == IoStatus::OK) {
        total += n;
    }
    return total;
}

bool PeerConnection::wait_send_queue_empty(std::chrono::milliseconds limit) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (socket_fd_ >= 0) {
        int queued = 0;
        if (ioctl(socket_fd_, SIOCOUTQ, &queued) < 0) {
            last_errno_ = errno;
            return false;
        }
        if (queued == 0) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(kDrainPollInterval);
    }
    return false;
}

void PeerConnection::abort() {
    if (socket_fd_ >= 0) {
        linger lg{};
        lg.l_onoff = 1;
        lg.l_linger = 0;
        setsockopt(socket_fd_, SOL_SOCKET, SO_LINGER, &lg, sizeof(lg));
    }
    close();
}

void PeerConnection::close() {
    if (socket_fd_ >= 0) {
        ::close(socket_fd_);
        socket_fd_ = -1;
    }
}

std::string PeerConnection::describe() const {
    return std::string(role_name(role_)) + " " + endpoint(peer_addr_, peer_port_);
}

Acceptor::Acceptor(const std::string& bind_address, uint16_t port, int role_count)
    : bind_address_(bind_address)
    , port_(port)
    , bound_port_(0)
    , listen_fd_(-1)
    , role_count_(role_count) {
}

Acceptor::~Acceptor() {
    close();
}

bool Acceptor::fail_open(const std::string& what) {
    last_error_ = what + ": " + strerror(errno);
    logging::error(last_error_);
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    return false;
}

/*
 * Implementation: open
 *
 * Initializes the listening socket.
 * - SO_REUSEADDR so a relay restarted right after a previous run can rebind
 * - Non-blocking, driven by the RelayEngine's epoll loop
 * - Resolves the bound port when an ephemeral port (0) was requested
 */
bool Acceptor::open() {
    if (listen_fd_ >= 0) {
        return true;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port_);
    if (bind_address_.empty() || bind_address_ == protocol::DEFAULT_BIND_ADDRESS) {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, bind_address_.c_str(), &addr.sin_addr) != 1) {
        last_error_ = "Invalid bind address: " + bind_address_;
        logging::error(last_error_);
        return false;
    }

    listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
        return fail_open("Failed to create listen socket");
    }

    int opt = 1;
    setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    if (!set_nonblocking(listen_fd_)) {
        return fail_open("Failed to set listen socket non-blocking");
    }

    if (bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        return fail_open("Failed to bind " + endpoint(bind_address_, port_));
    }

    if (listen(listen_fd_, protocol::LISTEN_BACKLOG) < 0) {
        return fail_open("Failed to listen on socket");
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) < 0) {
        return fail_open("Failed to query bound address");
    }
    bound_port_ = ntohs(bound.sin_port);

    logging::info("Listening on " + endpoint(bind_address_, bound_port_));
    return true;
}

/*
 * Implementation: accept_pending
 *
 * Drains the accept queue.
 * - Assigns SENDER, then RECEIVER, by arrival order
 * - Once both are assigned, remaining queued connections are closed
 *   unanswered and the listening socket is shut
 * - Errors tied to one connection are skipped; any other error is
 *   reported, since the pending connection would wake epoll forever
 */
bool Acceptor::accept_pending(const AcceptCallback& callback) {
    while (listen_fd_ >= 0) {
        sockaddr_in client_addr{};
        socklen_t addr_len = sizeof(client_addr);

        int client_fd = accept(listen_fd_, reinterpret_cast<sockaddr*>(&client_addr), &addr_len);
        if (client_fd < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            if (transient_accept_error(errno)) {
                logging::debug(std::string("accept() skipped a connection: ") + strerror(errno));
                continue;
            }
            last_error_ = std::string("accept() failed: ") + strerror(errno);
            logging::error(last_error_);
            return false;
        }

        char addr_str[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &client_addr.sin_addr, addr_str, sizeof(addr_str));
        uint16_t client_port = ntohs(client_addr.sin_port);

        if (roles_filled_ >= role_count_) {
            reject(client_fd, endpoint(addr_str, client_port));
            continue;
        }

        if (!set_nonblocking(client_fd)) {
            logging::error("Failed to set client socket non-blocking: " + std::string(strerror(errno)));
            ::close(client_fd);
            continue;
        }

        int opt = 1;
        setsockopt(client_fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));

        Role role = roles_filled_ == 0 ? Role::SENDER : Role::RECEIVER;
        ++roles_filled_;

        logging::info(
            "Accepted " + std::string(role_name(role)) + " from " + endpoint(addr_str, client_port));

        callback(std::make_unique<PeerConnection>(client_fd, role, addr_str, client_port));
    }

    if (roles_filled_ >= role_count_ && listen_fd_ >= 0) {
        logging::info("Both roles filled, no longer listening");
        close();
    }
    return true;
}

void Acceptor::reject(int client_fd, const std::string& peer) {
    ::close(client_fd);
    ++rejected_count_;
    logging::info("ExtraConnectionRejected: " + peer + " (session already paired)");
}

void Acceptor::close() {
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
}

}  // namespace bashdrop
