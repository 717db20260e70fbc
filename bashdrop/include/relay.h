/*
 * relay.h
 *
 * RelayEngine: pairs one sender with one receiver and copies the sender's
 * byte stream to the receiver, once.
 *
 * Single-threaded epoll loop over the listening socket and the two peer
 * sockets. Bytes pass through one fixed-size buffer, so memory use does not
 * depend on the file size. The engine never looks at the bytes it forwards.
 *
 *   WAITING_FOR_SENDER --accept--> WAITING_FOR_RECEIVER --accept--> STREAMING
 *   STREAMING --sender EOF forwarded--> DONE
 *   any state --timeout / I/O error / stop()--> FAILED
 */

#ifndef BASHDROP_RELAY_H
#define BASHDROP_RELAY_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <memory>
#include <atomic>
#include <chrono>

#include "connection.h"
#include "protocol.h"
#include "session.h"

namespace bashdrop {

struct RelayOptions {
    size_t chunk_size = protocol::DEFAULT_CHUNK_SIZE;
    std::chrono::milliseconds pairing_timeout{protocol::DEFAULT_PAIRING_TIMEOUT_SECONDS * 1000};
    int poll_interval_ms = protocol::POLL_INTERVAL_MS;

    /* How long a failing session waits for already-forwarded bytes to be
     * acknowledged by the receiver before resetting its connection. */
    std::chrono::milliseconds failure_drain_limit{2000};
};

/*
 * RelayOutcome
 *
 * Final report of a session, also what main() turns into an exit status.
 */
struct RelayOutcome {
    RelayState state = RelayState::WAITING_FOR_SENDER;
    RelayError error = RelayError::NONE;
    RelayState failed_in = RelayState::WAITING_FOR_SENDER;   /* state the session was in when it ended */
    uint64_t bytes_forwarded = 0;
    size_t rejected_connections = 0;
    double elapsed_seconds = 0.0;
    std::string reason;

    bool succeeded() const { return state == RelayState::DONE; }
    int exit_code() const { return exit_code_for(error); }
};

class RelayEngine {
public:
    RelayEngine(const SessionDescriptor& session, RelayOptions options = RelayOptions());
    ~RelayEngine();

    RelayEngine(const RelayEngine&) = delete;
    RelayEngine& operator=(const RelayEngine&) = delete;

    /*
     * Binds the listening socket and prepares the event loop.
     * On failure the session is FAILED with BIND_ERROR (see outcome()).
     */
    bool start();

    /*
     * Runs the session to completion. Calls start() if needed.
     * One-shot: a second call returns the first outcome immediately.
     */
    RelayOutcome run();

    /*
     * Requests the session to end as INTERRUPTED. Only sets an atomic flag,
     * so it may be called from another thread or a signal handler.
     */
    void stop();

    RelayState state() const { return state_.load(); }
    uint64_t bytes_forwarded() const { return bytes_forwarded_.load(); }
    uint16_t bound_port() const { return acceptor_.bound_port(); }
    const RelayOutcome& outcome() const { return outcome_; }

private:
    const SessionDescriptor& session_;
    RelayOptions options_;
    Acceptor acceptor_;
    int epoll_fd_;

    std::atomic<RelayState> state_;
    std::atomic<uint64_t> bytes_forwarded_;
    std::atomic<bool> stop_requested_;
    bool started_ = false;
    bool finished_ = false;
    RelayOutcome outcome_;

    std::unique_ptr<PeerConnection> sender_;
    std::unique_ptr<PeerConnection> receiver_;

    /* Forwarding buffer: bytes [pending_offset_, pending_offset_ + pending_len_) are unsent */
    std::vector<uint8_t> buffer_;
    size_t pending_offset_ = 0;
    size_t pending_len_ = 0;
    bool sender_eof_ = false;
    bool receiver_input_closed_ = false;   /* receiver sent FIN; it may still read */

    uint32_t sender_events_ = 0;      /* interest currently registered, 0 = not registered */
    uint32_t receiver_events_ = 0;
    uint64_t next_progress_report_;

    std::chrono::steady_clock::time_point started_at_;
    std::chrono::steady_clock::time_point streaming_started_at_;
    std::chrono::steady_clock::time_point pairing_deadline_;

    void handle_listen_event();
    void on_peer_accepted(std::unique_ptr<PeerConnection> conn);
    void handle_sender_event(uint32_t events);
    void handle_receiver_event(uint32_t events);
    void check_pairing_deadline();
    int next_timeout_ms() const;

    void pump();
    void report_progress();
    void update_interest();
    bool set_interest(PeerConnection& conn, uint32_t& current, uint32_t wanted);

    void complete();
    void fail_sender(const std::string& reason);
    void fail_receiver(const std::string& reason);
    void fail(RelayError error, const std::string& reason);
    void finish(RelayState state, RelayError error, const std::string& reason);
    void release();
};

}  // namespace bashdrop

#endif  // BASHDROP_RELAY_H
