// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file test_session_client.cpp
 * @brief Unit tests for the remote session client
 */

#include <unity.h>
#include <vector>

#include "../../src/codec/PacketCodec.h"
#include "../../src/network/SessionClient.h"
#include "../mocks/FakeDatagramTransport.h"

using namespace beatwave::codec;
using namespace beatwave::network;
using beatwave::test::FakeDatagramTransport;

namespace {

const Endpoint kServer = Endpoint::fromOctets(10, 0, 0, 2, 20200);
const Endpoint kStranger = Endpoint::fromOctets(10, 0, 0, 99, 5555);

std::vector<uint8_t> helloBytes(uint8_t magic, uint8_t random) {
    std::vector<uint8_t> out(HELLO_PACKET_SIZE);
    PacketCodec::encodeHello(HelloPacket(magic, random), out.data(), out.size());
    return out;
}

std::vector<uint8_t> ackBytes(AckPacket ack) {
    std::vector<uint8_t> out(ACK_PACKET_SIZE);
    PacketCodec::encodeAck(ack, out.data(), out.size());
    return out;
}

void connect(SessionClient& client, FakeDatagramTransport& transport, DataMode mode) {
    transport.push(helloBytes(PROTOCOL_MAGIC, 0x17), kServer);
    TEST_ASSERT_EQUAL(static_cast<int>(SessionError::NONE),
                      static_cast<int>(client.handshake(mode, 0x17)));
    transport.clearSent();
}

} // namespace

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// Handshake
// ============================================================================

void test_handshake_sends_hello_then_set_mode() {
    FakeDatagramTransport transport;
    SessionClient client(transport, kServer, false);
    transport.push(helloBytes(PROTOCOL_MAGIC, 0x17), kServer);

    SessionError err = client.handshake(DataMode::NOVELTY_BEATS, 0x17);

    TEST_ASSERT_EQUAL(static_cast<int>(SessionError::NONE), static_cast<int>(err));
    TEST_ASSERT_EQUAL(static_cast<int>(ClientState::STREAMING), static_cast<int>(client.getState()));
    TEST_ASSERT_EQUAL(2, transport.sent().size());
    TEST_ASSERT_TRUE(transport.sent()[0].bytes == helloBytes(0x42, 0x17));
    TEST_ASSERT_TRUE(transport.sent()[0].peer == kServer);
    TEST_ASSERT_EQUAL(1, transport.sent()[1].bytes.size());
    TEST_ASSERT_EQUAL_HEX8(static_cast<uint8_t>(DataMode::NOVELTY_BEATS), transport.sent()[1].bytes[0]);
    transport.push(ackBytes(AckPacket::QUIT), kServer);
    client.stop(false);
}

void test_handshake_fails_on_flipped_random() {
    FakeDatagramTransport transport;
    SessionClient client(transport, kServer, false);
    transport.push(helloBytes(PROTOCOL_MAGIC, 0x17 ^ 0x01), kServer);

    SessionError err = client.handshake(DataMode::NOVELTY, 0x17);

    TEST_ASSERT_EQUAL(static_cast<int>(SessionError::HANDSHAKE), static_cast<int>(err));
    TEST_ASSERT_EQUAL(static_cast<int>(ClientState::FAILED), static_cast<int>(client.getState()));
    // SetMode is never sent
    TEST_ASSERT_EQUAL(1, transport.sent().size());
}

void test_handshake_fails_on_flipped_magic() {
    FakeDatagramTransport transport;
    SessionClient client(transport, kServer, false);
    transport.push(helloBytes(PROTOCOL_MAGIC ^ 0x80, 0x17), kServer);

    TEST_ASSERT_EQUAL(static_cast<int>(SessionError::HANDSHAKE),
                      static_cast<int>(client.handshake(DataMode::NOVELTY, 0x17)));
}

void test_handshake_ignores_foreign_sender() {
    FakeDatagramTransport transport;
    SessionClient client(transport, kServer, false);
    transport.push(helloBytes(PROTOCOL_MAGIC, 0x55), kStranger);
    transport.push(helloBytes(PROTOCOL_MAGIC, 0x17), kServer);

    TEST_ASSERT_EQUAL(static_cast<int>(SessionError::NONE),
                      static_cast<int>(client.handshake(DataMode::NOVELTY, 0x17)));
    TEST_ASSERT_EQUAL_UINT32(1, client.getStats().foreignIgnored);
    transport.push(ackBytes(AckPacket::QUIT), kServer);
    client.stop(true);
}

void test_handshake_retries_interrupted_receive() {
    FakeDatagramTransport transport;
    SessionClient client(transport, kServer, false);
    transport.interruptNextReceive();
    transport.push(helloBytes(PROTOCOL_MAGIC, 0x17), kServer);

    TEST_ASSERT_EQUAL(static_cast<int>(SessionError::NONE),
                      static_cast<int>(client.handshake(DataMode::NOVELTY, 0x17)));
    transport.push(ackBytes(AckPacket::QUIT), kServer);
    client.stop(false);
}

// ============================================================================
// Streaming
// ============================================================================

void test_sample_waits_for_ok() {
    FakeDatagramTransport transport;
    SessionClient client(transport, kServer, false);
    connect(client, transport, DataMode::NOVELTY_BEATS);

    transport.push(ackBytes(AckPacket::OK), kServer);
    SessionError err = client.sendSample(0.8, 1.0, true);

    TEST_ASSERT_EQUAL(static_cast<int>(SessionError::NONE), static_cast<int>(err));
    TEST_ASSERT_EQUAL(NOVELTY_BEATS_PACKET_SIZE, transport.lastSent().bytes.size());

    NoveltyBeatsDecodeResult sent = PacketCodec::decodeNoveltyBeats(transport.lastSent().bytes.data(),
                                                                    transport.lastSent().bytes.size());
    TEST_ASSERT_TRUE(sent.success);
    TEST_ASSERT_TRUE(sent.value == NoveltyBeatsModePacket::makeData(0.8, 1.0, true));
    TEST_ASSERT_EQUAL_UINT32(1, client.getStats().acksReceived);
    transport.push(ackBytes(AckPacket::QUIT), kServer);
    client.stop(false);
}

void test_novelty_mode_sends_short_packets() {
    FakeDatagramTransport transport;
    SessionClient client(transport, kServer, false);
    connect(client, transport, DataMode::NOVELTY);

    transport.push(ackBytes(AckPacket::OK), kServer);
    client.sendSample(0.3, 0.6, true);
    TEST_ASSERT_EQUAL(NOVELTY_PACKET_SIZE, transport.lastSent().bytes.size());
    transport.push(ackBytes(AckPacket::QUIT), kServer);
    client.stop(false);
}

void test_abort_ack_is_fatal() {
    FakeDatagramTransport transport;
    SessionClient client(transport, kServer, false);
    connect(client, transport, DataMode::NOVELTY_BEATS);

    transport.push(ackBytes(AckPacket::ABORT), kServer);
    SessionError err = client.sendSample(0.5, 1.0, false);

    TEST_ASSERT_EQUAL(static_cast<int>(SessionError::ABORTED), static_cast<int>(err));
    TEST_ASSERT_EQUAL(static_cast<int>(ClientState::FAILED), static_cast<int>(client.getState()));
    TEST_ASSERT_EQUAL(static_cast<int>(SessionError::NOT_CONNECTED),
                      static_cast<int>(client.sendSample(0.5, 1.0, false)));
}

void test_quit_ack_during_stream_is_unexpected() {
    FakeDatagramTransport transport;
    SessionClient client(transport, kServer, false);
    connect(client, transport, DataMode::NOVELTY_BEATS);

    transport.push(ackBytes(AckPacket::QUIT), kServer);
    TEST_ASSERT_EQUAL(static_cast<int>(SessionError::UNEXPECTED_ACK),
                      static_cast<int>(client.sendSample(0.5, 1.0, false)));
}

void test_malformed_ack_fails_decode() {
    FakeDatagramTransport transport;
    SessionClient client(transport, kServer, false);
    connect(client, transport, DataMode::NOVELTY_BEATS);

    const uint8_t garbage[] = {7, 7};
    transport.push(garbage, sizeof(garbage), kServer);
    TEST_ASSERT_EQUAL(static_cast<int>(SessionError::DECODE),
                      static_cast<int>(client.sendSample(0.5, 1.0, false)));
}

void test_no_ack_mode_does_not_wait() {
    FakeDatagramTransport transport;
    SessionClient client(transport, kServer, true);
    connect(client, transport, DataMode::NOVELTY_BEATS);

    // Nothing scripted: a blocking receive would report CLOSED
    for (int i = 0; i < 5; i++) {
        TEST_ASSERT_EQUAL(static_cast<int>(SessionError::NONE),
                          static_cast<int>(client.sendSample(0.1 * i, 1.0, i % 2 == 0)));
    }
    TEST_ASSERT_EQUAL(5, transport.sent().size());
    TEST_ASSERT_EQUAL_UINT32(5, client.getStats().samplesSent);
    TEST_ASSERT_EQUAL_UINT32(0, client.getStats().acksReceived);

    transport.push(ackBytes(AckPacket::QUIT), kServer);
    client.stop(false);
}

void test_sample_before_handshake_rejected() {
    FakeDatagramTransport transport;
    SessionClient client(transport, kServer, false);

    TEST_ASSERT_EQUAL(static_cast<int>(SessionError::NOT_CONNECTED),
                      static_cast<int>(client.sendSample(0.5, 1.0, false)));
    TEST_ASSERT_EQUAL(0, transport.sent().size());
}

// ============================================================================
// Teardown
// ============================================================================

void test_stop_sends_goodbye_and_waits_for_quit() {
    FakeDatagramTransport transport;
    SessionClient client(transport, kServer, false);
    connect(client, transport, DataMode::NOVELTY_BEATS);

    transport.push(ackBytes(AckPacket::QUIT), kServer);
    SessionError err = client.stop(true);

    TEST_ASSERT_EQUAL(static_cast<int>(SessionError::NONE), static_cast<int>(err));
    TEST_ASSERT_EQUAL(static_cast<int>(ClientState::STOPPED), static_cast<int>(client.getState()));

    NoveltyBeatsDecodeResult bye = PacketCodec::decodeNoveltyBeats(transport.lastSent().bytes.data(),
                                                                   transport.lastSent().bytes.size());
    TEST_ASSERT_TRUE(bye.success);
    TEST_ASSERT_TRUE(bye.value == NoveltyBeatsModePacket::makeGoodbye(true));

    // Second stop is a no-op
    TEST_ASSERT_EQUAL(static_cast<int>(SessionError::NONE), static_cast<int>(client.stop(false)));
    TEST_ASSERT_EQUAL(1, transport.sent().size());
}

void test_stop_skips_stale_oks_without_ack() {
    FakeDatagramTransport transport;
    SessionClient client(transport, kServer, true);
    connect(client, transport, DataMode::NOVELTY);

    client.sendSample(0.5, 1.0, false);
    client.sendSample(0.6, 1.0, false);
    transport.push(ackBytes(AckPacket::OK), kServer);
    transport.push(ackBytes(AckPacket::OK), kServer);
    transport.push(ackBytes(AckPacket::QUIT), kServer);

    TEST_ASSERT_EQUAL(static_cast<int>(SessionError::NONE), static_cast<int>(client.stop(false)));
    TEST_ASSERT_EQUAL(static_cast<int>(ClientState::STOPPED), static_cast<int>(client.getState()));
    TEST_ASSERT_EQUAL(0, transport.pending());
}

void test_stop_rejects_ok_when_acking() {
    FakeDatagramTransport transport;
    SessionClient client(transport, kServer, false);
    connect(client, transport, DataMode::NOVELTY);

    transport.push(ackBytes(AckPacket::OK), kServer);
    TEST_ASSERT_EQUAL(static_cast<int>(SessionError::UNEXPECTED_ACK), static_cast<int>(client.stop(false)));
}

void test_stop_abort_reply_fails() {
    FakeDatagramTransport transport;
    SessionClient client(transport, kServer, false);
    connect(client, transport, DataMode::NOVELTY_BEATS);

    transport.push(ackBytes(AckPacket::ABORT), kServer);
    TEST_ASSERT_EQUAL(static_cast<int>(SessionError::ABORTED), static_cast<int>(client.stop(false)));
    TEST_ASSERT_EQUAL(static_cast<int>(ClientState::FAILED), static_cast<int>(client.getState()));
}

void test_send_failure_reports_transport() {
    FakeDatagramTransport transport;
    SessionClient client(transport, kServer, false);
    transport.setFailSends(true);

    TEST_ASSERT_EQUAL(static_cast<int>(SessionError::TRANSPORT),
                      static_cast<int>(client.handshake(DataMode::NOVELTY, 0x01)));
}

// ============================================================================
// Test Runner
// ============================================================================

int main() {
    UNITY_BEGIN();

    // Handshake
    RUN_TEST(test_handshake_sends_hello_then_set_mode);
    RUN_TEST(test_handshake_fails_on_flipped_random);
    RUN_TEST(test_handshake_fails_on_flipped_magic);
    RUN_TEST(test_handshake_ignores_foreign_sender);
    RUN_TEST(test_handshake_retries_interrupted_receive);

    // Streaming
    RUN_TEST(test_sample_waits_for_ok);
    RUN_TEST(test_novelty_mode_sends_short_packets);
    RUN_TEST(test_abort_ack_is_fatal);
    RUN_TEST(test_quit_ack_during_stream_is_unexpected);
    RUN_TEST(test_malformed_ack_fails_decode);
    RUN_TEST(test_no_ack_mode_does_not_wait);
    RUN_TEST(test_sample_before_handshake_rejected);

    // Teardown
    RUN_TEST(test_stop_sends_goodbye_and_waits_for_quit);
    RUN_TEST(test_stop_skips_stale_oks_without_ack);
    RUN_TEST(test_stop_rejects_ok_when_acking);
    RUN_TEST(test_stop_abort_reply_fails);
    RUN_TEST(test_send_failure_reports_transport);

    return UNITY_END();
}
