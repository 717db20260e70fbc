/*
 * test_relay.cpp
 *
 * End-to-end tests for RelayEngine over loopback sockets.
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "../include/crypto.h"
#include "../include/mode.h"
#include "../include/relay.h"
#include "socket_helpers.h"

using namespace bashdrop;
using namespace bashdrop::testing_support;

namespace {

std::vector<uint8_t> random_payload(size_t len) {
    std::vector<uint8_t> data(len);
    if (len > 0) {
        crypto::random_bytes(data.data(), data.size());
    }
    return data;
}

RelayOptions small_buffer_options() {
    RelayOptions options;
    options.chunk_size = 4096;
    options.poll_interval_ms = 20;
    return options;
}

}  // namespace

class RelayTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        ASSERT_TRUE(crypto::init());
    }

    /*
     * Sender connects first and writes everything, receiver connects second
     * and reads until close.
     */
    ReadResult relay_through(RelayHarness& relay, const std::vector<uint8_t>& payload) {
        int sender = connect_loopback(relay.port());
        EXPECT_GE(sender, 0);
        EXPECT_TRUE(wait_for_state(relay.engine(), RelayState::WAITING_FOR_RECEIVER));

        int receiver = connect_loopback(relay.port());
        EXPECT_GE(receiver, 0);

        std::thread writer([sender, &payload]() {
            send_all(sender, payload.data(), payload.size());
            ::close(sender);
        });

        ReadResult result = read_until_close(receiver);
        writer.join();
        ::close(receiver);
        return result;
    }
};

TEST_F(RelayTest, ForwardsThreeBytesAndCompletes) {
    RelayHarness relay;
    ASSERT_TRUE(relay.start());
    relay.launch();

    std::vector<uint8_t> payload = {0x41, 0x42, 0x43};
    ReadResult result = relay_through(relay, payload);

    EXPECT_TRUE(result.clean_eof);
    EXPECT_EQ(result.data, payload);

    RelayOutcome outcome = relay.wait();
    EXPECT_EQ(outcome.state, RelayState::DONE);
    EXPECT_EQ(outcome.error, RelayError::NONE);
    EXPECT_EQ(outcome.bytes_forwarded, 3u);
    EXPECT_EQ(outcome.exit_code(), 0);
}

TEST_F(RelayTest, EmptyFileIsRelayedAsCleanEof) {
    RelayHarness relay;
    ASSERT_TRUE(relay.start());
    relay.launch();

    ReadResult result = relay_through(relay, {});

    EXPECT_TRUE(result.clean_eof);
    EXPECT_TRUE(result.data.empty());
    RelayOutcome outcome = relay.wait();
    EXPECT_EQ(outcome.state, RelayState::DONE);
    EXPECT_EQ(outcome.bytes_forwarded, 0u);
}

TEST_F(RelayTest, PreservesBytesAcrossBufferBoundaries) {
    const size_t chunk = small_buffer_options().chunk_size;
    for (size_t size : {size_t{1}, chunk - 1, chunk, chunk + 1, 3 * chunk + 17}) {
        RelayHarness relay(small_buffer_options());
        ASSERT_TRUE(relay.start());
        relay.launch();

        std::vector<uint8_t> payload = random_payload(size);
        ReadResult result = relay_through(relay, payload);

        EXPECT_TRUE(result.clean_eof) << "size " << size;
        EXPECT_EQ(result.data, payload) << "size " << size;
        RelayOutcome outcome = relay.wait();
        EXPECT_EQ(outcome.state, RelayState::DONE) << "size " << size;
        EXPECT_EQ(outcome.bytes_forwarded, size);
    }
}

TEST_F(RelayTest, LargeTransferThroughSmallBuffer) {
    RelayHarness relay(small_buffer_options());
    ASSERT_TRUE(relay.start());
    relay.launch();

    std::vector<uint8_t> payload = random_payload(8 * 1024 * 1024 + 3);
    ReadResult result = relay_through(relay, payload);

    ASSERT_EQ(result.data.size(), payload.size());
    EXPECT_TRUE(result.data == payload);
    EXPECT_EQ(relay.wait().state, RelayState::DONE);
}

TEST_F(RelayTest, EncryptedModeForwardsOpaqueBytesUnchanged) {
    RelayHarness relay(RelayOptions(), TransferMode::ENCRYPTED_INTEGRITY);
    ASSERT_TRUE(relay.start());
    relay.launch();

    /* Not valid ciphertext; the relay must not care */
    std::vector<uint8_t> payload = random_payload(100000);
    ReadResult result = relay_through(relay, payload);

    EXPECT_EQ(result.data, payload);
    EXPECT_EQ(relay.wait().state, RelayState::DONE);
}

TEST_F(RelayTest, IntegrityTrailerVerifiesAtReceiver) {
    RelayHarness relay(small_buffer_options(), TransferMode::INTEGRITY);
    ASSERT_TRUE(relay.start());
    relay.launch();

    std::vector<uint8_t> file = random_payload(50000);
    ReadResult result = relay_through(relay, integrity::append_trailer(file));

    std::vector<uint8_t> recovered;
    ASSERT_TRUE(integrity::verify_trailer(result.data, recovered));
    EXPECT_EQ(recovered, file);
    EXPECT_EQ(relay.wait().bytes_forwarded, file.size() + crypto::HASH_HEX_SIZE);
}

TEST_F(RelayTest, StateFollowsArrivalOrder) {
    RelayHarness relay;
    ASSERT_TRUE(relay.start());
    EXPECT_EQ(relay.engine().state(), RelayState::WAITING_FOR_SENDER);
    relay.launch();

    int sender = connect_loopback(relay.port());
    ASSERT_GE(sender, 0);
    EXPECT_TRUE(wait_for_state(relay.engine(), RelayState::WAITING_FOR_RECEIVER));

    int receiver = connect_loopback(relay.port());
    ASSERT_GE(receiver, 0);
    EXPECT_TRUE(wait_for_state(relay.engine(), RelayState::STREAMING));

    const char msg[] = "hello";
    ASSERT_TRUE(send_all(sender, reinterpret_cast<const uint8_t*>(msg), 5));
    ::close(sender);

    ReadResult result = read_until_close(receiver);
    ::close(receiver);
    EXPECT_EQ(std::string(result.data.begin(), result.data.end()), "hello");
    EXPECT_EQ(relay.wait().state, RelayState::DONE);
}

TEST_F(RelayTest, QueuedExtraConnectionIsClosedWithoutData) {
    RelayHarness relay;
    ASSERT_TRUE(relay.start());

    /* All three complete the handshake before the loop runs, so they are
     * accepted in one pass in this order. */
    int sender = connect_loopback(relay.port());
    ASSERT_GE(sender, 0);
    int receiver = connect_loopback(relay.port());
    ASSERT_GE(receiver, 0);
    int extra = connect_loopback(relay.port());
    ASSERT_GE(extra, 0);

    const std::vector<uint8_t> payload = {'d', 'a', 't', 'a'};
    ASSERT_TRUE(send_all(sender, payload.data(), payload.size()));
    ::close(sender);

    relay.launch();

    ReadResult extra_result = read_until_close(extra);
    ::close(extra);
    EXPECT_TRUE(extra_result.data.empty());

    ReadResult result = read_until_close(receiver);
    ::close(receiver);
    EXPECT_EQ(result.data, payload);

    RelayOutcome outcome = relay.wait();
    EXPECT_EQ(outcome.state, RelayState::DONE);
    EXPECT_EQ(outcome.rejected_connections, 1u);
}

TEST_F(RelayTest, ListenerClosedOncePaired) {
    RelayHarness relay;
    ASSERT_TRUE(relay.start());
    relay.launch();
    uint16_t port = relay.port();

    int sender = connect_loopback(port);
    ASSERT_GE(sender, 0);
    ASSERT_TRUE(wait_for_state(relay.engine(), RelayState::WAITING_FOR_RECEIVER));
    int receiver = connect_loopback(port);
    ASSERT_GE(receiver, 0);
    ASSERT_TRUE(wait_for_state(relay.engine(), RelayState::STREAMING));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    int late = connect_loopback(port);
    int err = errno;
    EXPECT_LT(late, 0);
    EXPECT_EQ(err, ECONNREFUSED);
    if (late >= 0) {
        ::close(late);
    }

    /* The in-progress transfer is unaffected */
    const std::vector<uint8_t> payload = {1, 2, 3, 4, 5};
    ASSERT_TRUE(send_all(sender, payload.data(), payload.size()));
    ::close(sender);
    ReadResult result = read_until_close(receiver);
    ::close(receiver);
    EXPECT_EQ(result.data, payload);
    EXPECT_EQ(relay.wait().state, RelayState::DONE);
}

TEST_F(RelayTest, PortRefusesConnectionsAfterDone) {
    RelayHarness relay;
    ASSERT_TRUE(relay.start());
    relay.launch();
    uint16_t port = relay.port();

    relay_through(relay, {0x00});
    ASSERT_EQ(relay.wait().state, RelayState::DONE);

    int late = connect_loopback(port);
    int err = errno;
    EXPECT_LT(late, 0);
    EXPECT_EQ(err, ECONNREFUSED);
}

TEST_F(RelayTest, PairingTimeoutFailsWithoutForwarding) {
    RelayOptions options;
    options.pairing_timeout = std::chrono::milliseconds(300);
    options.poll_interval_ms = 20;
    RelayHarness relay(options);
    ASSERT_TRUE(relay.start());
    relay.launch();

    int sender = connect_loopback(relay.port());
    ASSERT_GE(sender, 0);
    const std::vector<uint8_t> payload = {9, 9, 9};
    ASSERT_TRUE(send_all(sender, payload.data(), payload.size()));

    RelayOutcome outcome = relay.wait();
    EXPECT_EQ(outcome.state, RelayState::FAILED);
    EXPECT_EQ(outcome.error, RelayError::PAIRING_TIMEOUT);
    EXPECT_EQ(outcome.failed_in, RelayState::WAITING_FOR_RECEIVER);
    EXPECT_EQ(outcome.bytes_forwarded, 0u);
    EXPECT_EQ(outcome.exit_code(), protocol::EXIT_PAIRING_TIMEOUT);

    /* The sender's connection is gone and nobody else can connect */
    ReadResult sender_side = read_until_close(sender);
    EXPECT_TRUE(sender_side.data.empty());
    ::close(sender);
    EXPECT_LT(connect_loopback(relay.port()), 0);
}

TEST_F(RelayTest, BindErrorWhenPortTaken) {
    int blocker = socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(blocker, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ASSERT_EQ(0, bind(blocker, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)));
    ASSERT_EQ(0, listen(blocker, 1));
    socklen_t len = sizeof(addr);
    ASSERT_EQ(0, getsockname(blocker, reinterpret_cast<sockaddr*>(&addr), &len));

    SessionParams params;
    params.host = "127.0.0.1";
    params.bind_address = "127.0.0.1";
    params.port = ntohs(addr.sin_port);
    SessionDescriptor session(params);
    RelayEngine engine(session);

    EXPECT_FALSE(engine.start());
    RelayOutcome outcome = engine.run();
    EXPECT_EQ(outcome.state, RelayState::FAILED);
    EXPECT_EQ(outcome.error, RelayError::BIND_ERROR);
    EXPECT_EQ(outcome.exit_code(), protocol::EXIT_BIND_ERROR);
    EXPECT_EQ(engine.state(), RelayState::FAILED);

    ::close(blocker);
}

TEST_F(RelayTest, SenderResetPropagatesExactPrefix) {
    RelayHarness relay(small_buffer_options());
    ASSERT_TRUE(relay.start());
    relay.launch();

    int sender = connect_loopback(relay.port());
    ASSERT_GE(sender, 0);
    ASSERT_TRUE(wait_for_state(relay.engine(), RelayState::WAITING_FOR_RECEIVER));
    int receiver = connect_loopback(relay.port());
    ASSERT_GE(receiver, 0);
    ASSERT_TRUE(wait_for_state(relay.engine(), RelayState::STREAMING));

    std::vector<uint8_t> prefix = random_payload(10000);
    ASSERT_TRUE(send_all(sender, prefix.data(), prefix.size()));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    abort_socket(sender);

    ReadResult result = read_until_close(receiver);
    ::close(receiver);

    EXPECT_EQ(result.data, prefix);
    EXPECT_FALSE(result.clean_eof);

    RelayOutcome outcome = relay.wait();
    EXPECT_EQ(outcome.state, RelayState::FAILED);
    EXPECT_EQ(outcome.error, RelayError::STREAM_IO_ERROR);
    EXPECT_EQ(outcome.bytes_forwarded, prefix.size());
    EXPECT_NE(outcome.exit_code(), 0);
}

TEST_F(RelayTest, ReceiverDisconnectFailsAndResetsSender) {
    RelayHarness relay(small_buffer_options());
    ASSERT_TRUE(relay.start());
    relay.launch();

    int sender = connect_loopback(relay.port());
    ASSERT_GE(sender, 0);
    ASSERT_TRUE(wait_for_state(relay.engine(), RelayState::WAITING_FOR_RECEIVER));
    int receiver = connect_loopback(relay.port());
    ASSERT_GE(receiver, 0);
    ASSERT_TRUE(wait_for_state(relay.engine(), RelayState::STREAMING));

    ::close(receiver);

    /* Keep writing until the relay drops the sender */
    std::vector<uint8_t> chunk = random_payload(65536);
    bool write_failed = false;
    for (int i = 0; i < 4096 && !write_failed; ++i) {
        write_failed = !send_all(sender, chunk.data(), chunk.size());
    }
    ::close(sender);
    EXPECT_TRUE(write_failed);

    RelayOutcome outcome = relay.wait();
    EXPECT_EQ(outcome.state, RelayState::FAILED);
    EXPECT_EQ(outcome.error, RelayError::STREAM_IO_ERROR);
    EXPECT_EQ(outcome.exit_code(), protocol::EXIT_STREAM_IO_ERROR);
}

TEST_F(RelayTest, ReceiverHalfCloseStillReceivesFile) {
    RelayHarness relay(small_buffer_options());
    ASSERT_TRUE(relay.start());
    relay.launch();

    int sender = connect_loopback(relay.port());
    ASSERT_GE(sender, 0);
    ASSERT_TRUE(wait_for_state(relay.engine(), RelayState::WAITING_FOR_RECEIVER));
    int receiver = connect_loopback(relay.port());
    ASSERT_GE(receiver, 0);
    ASSERT_TRUE(wait_for_state(relay.engine(), RelayState::STREAMING));

    /* Like nc -N: the receiver ends its unused direction, then keeps reading */
    ASSERT_EQ(0, shutdown(receiver, SHUT_WR));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(relay.engine().state(), RelayState::STREAMING);

    const std::vector<uint8_t> payload = {0x41, 0x42, 0x43};
    ASSERT_TRUE(send_all(sender, payload.data(), payload.size()));
    ::close(sender);

    ReadResult result = read_until_close(receiver);
    EXPECT_TRUE(result.clean_eof);
    EXPECT_EQ(result.data, payload);
    ::close(receiver);

    RelayOutcome outcome = relay.wait();
    EXPECT_EQ(outcome.state, RelayState::DONE);
    EXPECT_EQ(outcome.error, RelayError::NONE);
    EXPECT_EQ(outcome.bytes_forwarded, 3u);
}

TEST_F(RelayTest, HalfClosedReceiverThatVanishesFailsSession) {
    RelayHarness relay(small_buffer_options());
    ASSERT_TRUE(relay.start());
    relay.launch();

    int sender = connect_loopback(relay.port());
    ASSERT_GE(sender, 0);
    ASSERT_TRUE(wait_for_state(relay.engine(), RelayState::WAITING_FOR_RECEIVER));
    int receiver = connect_loopback(relay.port());
    ASSERT_GE(receiver, 0);
    ASSERT_TRUE(wait_for_state(relay.engine(), RelayState::STREAMING));

    ASSERT_EQ(0, shutdown(receiver, SHUT_WR));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    abort_socket(receiver);

    /* The reset is seen without any sender traffic */
    EXPECT_TRUE(wait_for_state(relay.engine(), RelayState::FAILED));
    ::close(sender);

    RelayOutcome outcome = relay.wait();
    EXPECT_EQ(outcome.error, RelayError::STREAM_IO_ERROR);
    EXPECT_EQ(outcome.failed_in, RelayState::STREAMING);
}

TEST_F(RelayTest, ReceiverInputIsNeverForwarded) {
    RelayHarness relay;
    ASSERT_TRUE(relay.start());
    relay.launch();

    int sender = connect_loopback(relay.port());
    ASSERT_GE(sender, 0);
    ASSERT_TRUE(wait_for_state(relay.engine(), RelayState::WAITING_FOR_RECEIVER));
    int receiver = connect_loopback(relay.port());
    ASSERT_GE(receiver, 0);
    ASSERT_TRUE(wait_for_state(relay.engine(), RelayState::STREAMING));

    const std::vector<uint8_t> noise = {'n', 'o', 'i', 's', 'e'};
    ASSERT_TRUE(send_all(receiver, noise.data(), noise.size()));

    const std::vector<uint8_t> payload = {'p', 'a', 'y'};
    ASSERT_TRUE(send_all(sender, payload.data(), payload.size()));
    shutdown(sender, SHUT_WR);

    ReadResult result = read_until_close(receiver);
    EXPECT_EQ(result.data, payload);

    /* Nothing comes back to the sender either */
    ReadResult back = read_until_close(sender);
    EXPECT_TRUE(back.data.empty());

    ::close(sender);
    ::close(receiver);
    EXPECT_EQ(relay.wait().state, RelayState::DONE);
}

TEST_F(RelayTest, StopInterruptsWaitingSession) {
    RelayHarness relay;
    ASSERT_TRUE(relay.start());
    relay.launch();

    int sender = connect_loopback(relay.port());
    ASSERT_GE(sender, 0);
    ASSERT_TRUE(wait_for_state(relay.engine(), RelayState::WAITING_FOR_RECEIVER));

    relay.engine().stop();
    RelayOutcome outcome = relay.wait();
    ::close(sender);

    EXPECT_EQ(outcome.state, RelayState::FAILED);
    EXPECT_EQ(outcome.error, RelayError::INTERRUPTED);
    EXPECT_EQ(outcome.exit_code(), protocol::EXIT_INTERRUPTED);
}

TEST_F(RelayTest, RunIsOneShot) {
    RelayHarness relay;
    ASSERT_TRUE(relay.start());
    relay.launch();

    relay_through(relay, {0x01, 0x02});
    RelayOutcome first = relay.wait();
    ASSERT_EQ(first.state, RelayState::DONE);

    RelayOutcome second = relay.engine().run();
    EXPECT_EQ(second.state, RelayState::DONE);
    EXPECT_EQ(second.bytes_forwarded, first.bytes_forwarded);
}
