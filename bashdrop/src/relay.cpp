#include "relay.h"
#include "logging.h"

#include <sys/epoll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace bashdrop {

namespace {

constexpr int kMaxEvents = 8;

/* Read/write steps per wakeup before returning to epoll_wait */
constexpr int kPumpBudget = 64;

constexpr uint64_t kProgressInterval = 256ULL * 1024 * 1024;
constexpr size_t kScratchSize = 4096;

std::string errno_text(int err) {
    return err != 0 ? std::string(strerror(err)) : std::string("connection closed");
}

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

std::string format_bytes(uint64_t bytes) {
    std::ostringstream out;
    if (bytes < 1024) {
        out << bytes << " B";
    } else if (bytes < 1024ULL * 1024) {
        out << std::fixed << std::setprecision(1) << bytes / 1024.0 << " KiB";
    } else if (bytes < 1024ULL * 1024 * 1024) {
        out << std::fixed << std::setprecision(1) << bytes / (1024.0 * 1024) << " MiB";
    } else {
        out << std::fixed << std::setprecision(2) << bytes / (1024.0 * 1024 * 1024) << " GiB";
    }
    return out.str();
}

int socket_error(int fd) {
    int err = 0;
    socklen_t len = sizeof(err);
    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
        return errno;
    }
    return err;
}

}  // namespace

RelayEngine::RelayEngine(const SessionDescriptor& session, RelayOptions options)
    : session_(session)
    , options_(options)
    , acceptor_(session.bind_address(), session.port(), session.role_count())
    , epoll_fd_(-1)
    , state_(RelayState::WAITING_FOR_SENDER)
    , bytes_forwarded_(0)
    , stop_requested_(false)
    , next_progress_report_(kProgressInterval) {
    if (options_.chunk_size == 0) {
        options_.chunk_size = protocol::DEFAULT_CHUNK_SIZE;
    }
    if (options_.poll_interval_ms <= 0) {
        options_.poll_interval_ms = protocol::POLL_INTERVAL_MS;
    }
}

RelayEngine::~RelayEngine() {
    release();
}

/*
 * Implementation: start
 *
 * Binds the acceptor and registers it with a fresh epoll instance.
 * The forwarding buffer is allocated once here and reused for the whole
 * transfer.
 */
bool RelayEngine::start() {
    if (started_) {
        return !(finished_ && outcome_.error == RelayError::BIND_ERROR);
    }
    started_ = true;
    started_at_ = std::chrono::steady_clock::now();

    if (!acceptor_.open()) {
        finish(RelayState::FAILED, RelayError::BIND_ERROR, "BindError: " + acceptor_.last_error());
        return false;
    }

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        finish(RelayState::FAILED, RelayError::BIND_ERROR,
               std::string("BindError: failed to create epoll instance: ") + strerror(errno));
        return false;
    }

    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = acceptor_.listen_fd();
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, acceptor_.listen_fd(), &ev) < 0) {
        finish(RelayState::FAILED, RelayError::BIND_ERROR,
               std::string("BindError: failed to add listen socket to epoll: ") + strerror(errno));
        return false;
    }

    buffer_.assign(options_.chunk_size, 0);
    state_ = RelayState::WAITING_FOR_SENDER;
    logging::info("Session for '" + session_.filename() + "' waiting for sender on port " +
                  std::to_string(acceptor_.bound_port()));
    return true;
}

void RelayEngine::stop() {
    stop_requested_.store(true);
}

/*
 * Implementation: run
 *
 * Main event loop.
 * - Waits for readiness on the listener and peer sockets, waking at least
 *   every poll interval to observe the pairing deadline and stop requests
 * - Dispatches each event by descriptor
 * - Returns once the session is DONE or FAILED
 */
RelayOutcome RelayEngine::run() {
    if (!started_ && !start()) {
        return outcome_;
    }

    epoll_event events[kMaxEvents];
    while (!finished_) {
        int nfds = epoll_wait(epoll_fd_, events, kMaxEvents, next_timeout_ms());
        if (nfds < 0) {
            if (errno != EINTR) {
                fail(RelayError::STREAM_IO_ERROR, std::string("epoll_wait failed: ") + strerror(errno));
                break;
            }
            nfds = 0;
        }

        if (stop_requested_.load()) {
            if (sender_) {
                sender_->abort();
            }
            if (receiver_) {
                receiver_->abort();
            }
            fail(RelayError::INTERRUPTED, "Interrupted by operator");
            break;
        }

        for (int i = 0; i < nfds && !finished_; ++i) {
            int fd = events[i].data.fd;
            if (fd >= 0 && fd == acceptor_.listen_fd()) {
                handle_listen_event();
            } else if (sender_ && fd == sender_->socket_fd()) {
                handle_sender_event(events[i].events);
            } else if (receiver_ && fd == receiver_->socket_fd()) {
                handle_receiver_event(events[i].events);
            }
        }

        if (!finished_) {
            check_pairing_deadline();
        }
    }

    return outcome_;
}

int RelayEngine::next_timeout_ms() const {
    if (state_ != RelayState::WAITING_FOR_RECEIVER) {
        return options_.poll_interval_ms;
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        pairing_deadline_ - std::chrono::steady_clock::now()).count();
    if (remaining < 0) {
        return 0;
    }
    return static_cast<int>(std::min<long long>(remaining, options_.poll_interval_ms));
}

void RelayEngine::handle_listen_event() {
    bool ok = acceptor_.accept_pending([this](std::unique_ptr<PeerConnection> conn) {
        on_peer_accepted(std::move(conn));
    });
    outcome_.rejected_connections = acceptor_.rejected_count();

    if (!ok) {
        if (sender_) {
            sender_->abort();
        }
        if (receiver_) {
            receiver_->abort();
        }
        fail(RelayError::STREAM_IO_ERROR, "StreamIOError: " + acceptor_.last_error());
        return;
    }

    if (state_ == RelayState::STREAMING) {
        pump();
    }
}

void RelayEngine::on_peer_accepted(std::unique_ptr<PeerConnection> conn) {
    if (conn->role() == Role::SENDER) {
        sender_ = std::move(conn);
        pairing_deadline_ = std::chrono::steady_clock::now() + options_.pairing_timeout;
        state_ = RelayState::WAITING_FOR_RECEIVER;
        logging::info("Waiting up to " + std::to_string(options_.pairing_timeout.count() / 1000) +
                      "s for the receiver");
        return;
    }

    receiver_ = std::move(conn);
    streaming_started_at_ = std::chrono::steady_clock::now();
    state_ = RelayState::STREAMING;
    logging::info("Paired " + sender_->describe() + " with " + receiver_->describe() + ", streaming");
}

void RelayEngine::handle_sender_event(uint32_t /*events*/) {
    /* Errors and end-of-stream surface from the read itself */
    pump();
}

/*
 * Implementation: handle_receiver_event
 *
 * The receiver is not expected to send anything. Input is read and dropped.
 * - End-of-stream only closes the receiver's unused direction; it may still
 *   be reading, so forwarding continues and its input is no longer watched
 * - A read error or EPOLLERR/EPOLLHUP is a real disconnect and fails the
 *   session
 * - EPOLLOUT resumes a stalled write
 */
void RelayEngine::handle_receiver_event(uint32_t events) {
    if (!receiver_input_closed_ && (events & (EPOLLIN | EPOLLRDHUP))) {
        uint8_t scratch[kScratchSize];
        size_t discarded = 0;
        while (true) {
            size_t n = 0;
            auto status = receiver_->read_some(scratch, sizeof(scratch), n);
            if (status == PeerConnection::IoStatus::OK) {
                discarded += n;
                continue;
            }
            if (status == PeerConnection::IoStatus::WOULD_BLOCK) {
                break;
            }
            if (status == PeerConnection::IoStatus::CLOSED) {
                logging::info("Receiver half-closed its sending side, still forwarding");
                receiver_input_closed_ = true;
                break;
            }
            fail_receiver("StreamIOError: receiver read error: " + errno_text(receiver_->last_errno()));
            return;
        }
        if (discarded > 0) {
            logging::debug("Dropped " + std::to_string(discarded) + " bytes sent by the receiver");
        }
    }

    if (events & (EPOLLERR | EPOLLHUP)) {
        fail_receiver("StreamIOError: receiver connection error: " +
                      errno_text(socket_error(receiver_->socket_fd())));
        return;
    }

    pump();
}

void RelayEngine::check_pairing_deadline() {
    if (state_ != RelayState::WAITING_FOR_RECEIVER) {
        return;
    }
    if (std::chrono::steady_clock::now() < pairing_deadline_) {
        return;
    }
    fail(RelayError::PAIRING_TIMEOUT,
         "PairingTimeout: no receiver connected within " +
         std::to_string(options_.pairing_timeout.count() / 1000) + "s");
}

/*
 * Implementation: pump
 *
 * Moves bytes from sender to receiver through the fixed buffer.
 * - The sender is read only when the buffer is empty, so every byte read
 *   has been handed to the receiver before the next read
 * - Stops at the first WOULD_BLOCK and re-arms epoll interest for
 *   whichever side it is waiting on
 * - Sender end-of-stream with an empty buffer completes the session
 */
void RelayEngine::pump() {
    int budget = kPumpBudget;
    while (state_ == RelayState::STREAMING && !finished_ && budget-- > 0) {
        if (pending_len_ > 0) {
            size_t n = 0;
            auto status = receiver_->write_some(buffer_.data() + pending_offset_, pending_len_, n);
            if (status == PeerConnection::IoStatus::OK) {
                pending_offset_ += n;
                pending_len_ -= n;
                bytes_forwarded_ += n;
                report_progress();
                continue;
            }
            if (status == PeerConnection::IoStatus::WOULD_BLOCK) {
                break;
            }
            fail_receiver("StreamIOError: write to receiver failed: " + errno_text(receiver_->last_errno()));
            return;
        }

        if (sender_eof_) {
            break;
        }

        size_t n = 0;
        auto status = sender_->read_some(buffer_.data(), buffer_.size(), n);
        if (status == PeerConnection::IoStatus::OK) {
            pending_offset_ = 0;
            pending_len_ = n;
            continue;
        }
        if (status == PeerConnection::IoStatus::WOULD_BLOCK) {
            break;
        }
        if (status == PeerConnection::IoStatus::CLOSED) {
            logging::debug("Sender reached end-of-stream");
            sender_eof_ = true;
            continue;
        }
        fail_sender("StreamIOError: read from sender failed after " +
                    std::to_string(bytes_forwarded_.load()) + " bytes: " +
                    errno_text(sender_->last_errno()));
        return;
    }

    if (finished_) {
        return;
    }
    if (sender_eof_ && pending_len_ == 0) {
        complete();
        return;
    }
    update_interest();
}

void RelayEngine::report_progress() {
    uint64_t total = bytes_forwarded_.load();
    if (total < next_progress_report_) {
        return;
    }
    double elapsed = seconds_since(streaming_started_at_);
    std::ostringstream rate;
    if (elapsed > 0.0) {
        rate << ", " << format_bytes(static_cast<uint64_t>(total / elapsed)) << "/s";
    }
    logging::info("Forwarded " + format_bytes(total) + rate.str());
    while (next_progress_report_ <= total) {
        next_progress_report_ += kProgressInterval;
    }
}

void RelayEngine::update_interest() {
    uint32_t sender_wanted = (pending_len_ == 0 && !sender_eof_) ? EPOLLIN : 0;
    /* EPOLLERR/EPOLLHUP keep the receiver registered after its input is closed */
    uint32_t receiver_wanted = EPOLLERR | EPOLLHUP;
    if (!receiver_input_closed_) {
        receiver_wanted |= EPOLLIN | EPOLLRDHUP;
    }
    if (pending_len_ > 0) {
        receiver_wanted |= EPOLLOUT;
    }

    if (!set_interest(*sender_, sender_events_, sender_wanted) ||
        !set_interest(*receiver_, receiver_events_, receiver_wanted)) {
        if (sender_) {
            sender_->abort();
        }
        if (receiver_) {
            receiver_->abort();
        }
        fail(RelayError::STREAM_IO_ERROR, std::string("epoll_ctl failed: ") + strerror(errno));
    }
}

/*
 * A socket is registered only while there is interest in it, so a sender
 * that hangs up while the buffer is still draining cannot make epoll spin
 * on EPOLLHUP. Its hangup is picked up by the next read instead.
 */
bool RelayEngine::set_interest(PeerConnection& conn, uint32_t& current, uint32_t wanted) {
    if (current == wanted) {
        return true;
    }

    epoll_event ev{};
    ev.events = wanted;
    ev.data.fd = conn.socket_fd();

    int op = EPOLL_CTL_MOD;
    if (wanted == 0) {
        op = EPOLL_CTL_DEL;
    } else if (current == 0) {
        op = EPOLL_CTL_ADD;
    }

    if (epoll_ctl(epoll_fd_, op, conn.socket_fd(), &ev) < 0) {
        logging::error("epoll_ctl failed for " + conn.describe() + ": " + strerror(errno));
        return false;
    }
    current = wanted;
    return true;
}

/*
 * Implementation: complete
 *
 * Sender end-of-stream has been forwarded. Half-close the receiver so it
 * sees end-of-file after the last byte. Unread receiver input is dropped
 * first, otherwise closing the socket would reset the connection and could
 * destroy data still in flight.
 */
void RelayEngine::complete() {
    receiver_->discard_input();
    if (!receiver_->shutdown_write()) {
        fail_receiver("StreamIOError: half-close of receiver failed: " + errno_text(receiver_->last_errno()));
        return;
    }
    receiver_->discard_input();

    double elapsed = seconds_since(streaming_started_at_);
    std::ostringstream summary;
    summary << "Transfer complete: " << bytes_forwarded_.load() << " bytes ("
            << format_bytes(bytes_forwarded_.load()) << ") in "
            << std::fixed << std::setprecision(1) << elapsed << "s";
    finish(RelayState::DONE, RelayError::NONE, summary.str());
}

/*
 * The sender failed mid-stream. Everything read from it was already handed
 * to the receiver's socket; give those bytes a bounded chance to arrive,
 * then reset the receiver so the truncation is visible as an error rather
 * than a clean end-of-file.
 */
void RelayEngine::fail_sender(const std::string& reason) {
    if (receiver_ && !receiver_->wait_send_queue_empty(options_.failure_drain_limit)) {
        logging::warn("Receiver did not acknowledge all forwarded bytes before reset");
    }
    if (receiver_) {
        receiver_->abort();
    }
    if (sender_) {
        sender_->abort();
    }
    fail(RelayError::STREAM_IO_ERROR, reason);
}

void RelayEngine::fail_receiver(const std::string& reason) {
    if (sender_) {
        sender_->abort();
    }
    if (receiver_) {
        receiver_->abort();
    }
    fail(RelayError::STREAM_IO_ERROR, reason);
}

void RelayEngine::fail(RelayError error, const std::string& reason) {
    finish(RelayState::FAILED, error, reason);
}

void RelayEngine::finish(RelayState state, RelayError error, const std::string& reason) {
    if (finished_) {
        return;
    }
    finished_ = true;
    acceptor_.close();

    RelayState previous = state_.load();
    outcome_.state = state;
    outcome_.failed_in = previous;
    outcome_.error = error;
    outcome_.bytes_forwarded = bytes_forwarded_.load();
    outcome_.rejected_connections = acceptor_.rejected_count();
    outcome_.elapsed_seconds = seconds_since(started_at_);
    outcome_.reason = reason;

    if (state == RelayState::DONE) {
        logging::info(reason);
    } else {
        logging::error("Session failed while " + std::string(state_name(previous)) + " (" +
                       error_name(error) + "): " + reason);
    }

    release();
    state_ = state;
}

void RelayEngine::release() {
    acceptor_.close();
    sender_.reset();
    receiver_.reset();
    sender_events_ = 0;
    receiver_events_ = 0;
    if (epoll_fd_ >= 0) {
        ::close(epoll_fd_);
        epoll_fd_ = -1;
    }
}

}  // namespace bashdrop
