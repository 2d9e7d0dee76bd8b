#include <cstdint>
#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "crypto/key.hpp"
#include "noop_key.hpp"
#include "proto/packet.hpp"
#include "stream/message_stream.hpp"
#include "transport/loopback_transport.hpp"

using packet::Bytes;
using packet::OperationType;
using packet::StreamMessage;
using stream::MessageStream;
using transport::LoopbackTransport;

namespace
{
constexpr std::size_t MAX_WRITE = 100;
constexpr std::size_t P         = 89;  // packet payload for MAX_WRITE

struct Recorder : MessageStream::Callback
{
    std::vector<StreamMessage> received;
    std::vector<std::uint32_t> sent;

    void on_message_received(const StreamMessage &msg) override { received.push_back(msg); }
    void on_message_sent(std::uint32_t message_id) override { sent.push_back(message_id); }
};

struct LockedRecorder : MessageStream::Callback
{
    std::mutex                 mu;
    std::multiset<std::string> received;
    std::vector<std::uint32_t> sent;

    void on_message_received(const StreamMessage &msg) override
    {
        std::lock_guard<std::mutex> lk(mu);
        received.emplace(msg.payload.begin(), msg.payload.end());
    }
    void on_message_sent(std::uint32_t message_id) override
    {
        std::lock_guard<std::mutex> lk(mu);
        sent.push_back(message_id);
    }
};

transport::Settings settings()
{
    transport::Settings s{};
    s.role           = "loopback";
    s.max_write_size = MAX_WRITE;
    return s;
}

StreamMessage text_message(const std::string &text, bool encrypted = false)
{
    StreamMessage m;
    m.operation            = OperationType::ClientMessage;
    m.is_payload_encrypted = encrypted;
    m.payload.assign(text.begin(), text.end());
    return m;
}

StreamMessage sized_message(std::size_t n)
{
    StreamMessage m;
    m.operation = OperationType::ClientMessage;
    m.payload.resize(n);
    for (std::size_t i = 0; i < n; ++i)
        m.payload[i] = static_cast<std::uint8_t>((i * 31 + 7) & 0xFF);
    return m;
}

std::string repeated(std::size_t times)
{
    std::string s;
    for (std::size_t i = 0; i < times; ++i)
        s += "status: ok; battery: 87%; steps: 1024\n";
    return s;
}

std::shared_ptr<crypto::Key> sodium_key()
{
    auto k = crypto::SodiumKey::from_hex(
        "000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f");
    if (!k)
        return nullptr;
    return std::make_shared<crypto::SodiumKey>(*k);
}

// Two loopbacks wired to each other, each with its own stream.
struct LinkedPair
{
    LoopbackTransport a, b;
    Recorder          ra, rb;
    MessageStream     sa, sb;

    explicit LinkedPair(bool compression) : sa(a, compression), sb(b, compression)
    {
        a.connect_peer(&b);
        b.connect_peer(&a);
        EXPECT_TRUE(sa.register_callback(&ra));
        EXPECT_TRUE(sb.register_callback(&rb));
        EXPECT_TRUE(sa.start(settings()));
        EXPECT_TRUE(sb.start(settings()));
    }
};
}  // namespace

TEST(MessageStream, CreateByVersion)
{
    LoopbackTransport t;

    auto v2 = MessageStream::create(2, t);
    ASSERT_NE(v2, nullptr);
    EXPECT_FALSE(v2->compression_enabled());

    auto v3 = MessageStream::create(3, t);
    ASSERT_NE(v3, nullptr);
    EXPECT_TRUE(v3->compression_enabled());

    EXPECT_EQ(MessageStream::create(4, t), nullptr);
}

TEST(MessageStream, SendBeforeStartThrows)
{
    LoopbackTransport t;
    MessageStream     ms(t, false);
    EXPECT_THROW(ms.send_message(text_message("hi")), stream::ContractViolation);
    EXPECT_EQ(t.writes(), 0u);
}

TEST(MessageStream, ThreePacketsWrittenOneAtATime)
{
    LoopbackTransport t;
    Recorder          rec;
    MessageStream     ms(t, false);
    ASSERT_TRUE(ms.register_callback(&rec));
    ASSERT_TRUE(ms.start(settings()));
    t.set_manual_confirm(true);

    const StreamMessage msg = sized_message(262);
    ASSERT_EQ(packet::serialize_message(msg).size(), 3 * P);

    const std::uint32_t id = ms.send_message(msg);
    EXPECT_EQ(id, 0u);

    for (std::size_t n = 1; n <= 3; ++n)
    {
        SCOPED_TRACE(n);
        EXPECT_EQ(t.writes(), n);
        EXPECT_EQ(t.pending_writes(), 1u);
        EXPECT_TRUE(ms.write_in_progress());
        EXPECT_TRUE(rec.sent.empty());
        ASSERT_TRUE(t.confirm_next());
    }

    EXPECT_EQ(t.writes(), 3u);
    EXPECT_FALSE(t.confirm_next());
    EXPECT_FALSE(ms.write_in_progress());
    ASSERT_EQ(rec.sent.size(), 1u);
    EXPECT_EQ(rec.sent[0], id);

    // echoed back by the loopback
    ASSERT_EQ(rec.received.size(), 1u);
    EXPECT_EQ(rec.received[0], msg);
}

TEST(MessageStream, FifoAcrossMessages)
{
    LinkedPair link(false);
    link.a.set_manual_confirm(true);

    const StreamMessage m1 = sized_message(262);  // 3 packets
    const StreamMessage m2 = sized_message(5);    // 1 packet
    const StreamMessage m3 = sized_message(120);  // 2 packets

    EXPECT_EQ(link.sa.send_message(m1), 0u);
    EXPECT_EQ(link.sa.send_message(m2), 1u);
    EXPECT_EQ(link.sa.send_message(m3), 2u);
    EXPECT_EQ(link.a.writes(), 1u);
    EXPECT_EQ(link.sa.queued_packets(), 6u);

    while (link.a.confirm_next())
        EXPECT_LE(link.a.pending_writes(), 1u);

    EXPECT_EQ(link.a.writes(), 6u);
    EXPECT_EQ(link.sa.queued_packets(), 0u);
    EXPECT_EQ(link.ra.sent, (std::vector<std::uint32_t>{0, 1, 2}));
    ASSERT_EQ(link.rb.received.size(), 3u);
    EXPECT_EQ(link.rb.received[0], m1);
    EXPECT_EQ(link.rb.received[1], m2);
    EXPECT_EQ(link.rb.received[2], m3);
}

TEST(MessageStream, CorruptFrameDisconnectsOnce)
{
    LoopbackTransport t;
    Recorder          rec;
    MessageStream     ms(t, false);
    ASSERT_TRUE(ms.register_callback(&rec));
    ASSERT_TRUE(ms.start(settings()));

    ms.on_rx(transport::Frame{0xFF, 0xFF, 0xFF});
    EXPECT_FALSE(ms.is_connected());
    EXPECT_EQ(t.disconnects(), 1u);

    // a valid single-packet message is no longer processed
    auto pk = packet::make_packets(text_message("late"), MAX_WRITE, 9);
    ASSERT_TRUE(pk.has_value());
    ASSERT_EQ(pk->size(), 1u);
    ms.on_rx(packet::serialize((*pk)[0]));
    ms.on_rx(transport::Frame{0xFF});

    EXPECT_TRUE(rec.received.empty());
    EXPECT_EQ(t.disconnects(), 1u);
}

TEST(MessageStream, SequenceErrorDisconnects)
{
    LoopbackTransport t;
    Recorder          rec;
    MessageStream     ms(t, false);
    ASSERT_TRUE(ms.register_callback(&rec));
    ASSERT_TRUE(ms.start(settings()));

    auto pk = packet::make_packets(sized_message(262), MAX_WRITE, 4);
    ASSERT_TRUE(pk.has_value());
    ASSERT_EQ(pk->size(), 3u);

    ms.on_rx(packet::serialize((*pk)[0]));
    EXPECT_TRUE(ms.is_connected());
    ms.on_rx(packet::serialize((*pk)[2]));  // skips packet 2

    EXPECT_FALSE(ms.is_connected());
    EXPECT_EQ(t.disconnects(), 1u);
    EXPECT_TRUE(rec.received.empty());
}

TEST(MessageStream, EncryptionWithoutKeyThrows)
{
    LoopbackTransport t;
    MessageStream     ms(t, false);
    ASSERT_TRUE(ms.start(settings()));

    EXPECT_THROW(ms.send_message(text_message("secret", true)), stream::ContractViolation);
    EXPECT_EQ(ms.queued_packets(), 0u);
    EXPECT_EQ(t.writes(), 0u);
    EXPECT_TRUE(ms.is_connected());

    // the failed call consumed no id
    EXPECT_EQ(ms.send_message(text_message("plain")), 0u);
}

TEST(MessageStream, EncryptedRoundTrip)
{
    auto key = sodium_key();
    if (!key)
        GTEST_SKIP() << "libsodium unavailable";

    LinkedPair link(true);
    link.sa.set_encryption_key(key);
    link.sb.set_encryption_key(key);

    const std::string text = repeated(10);
    const auto        id   = link.sa.send_message(text_message(text, true));

    ASSERT_EQ(link.rb.received.size(), 1u);
    const StreamMessage &got = link.rb.received[0];
    EXPECT_EQ(std::string(got.payload.begin(), got.payload.end()), text);
    EXPECT_FALSE(got.is_payload_encrypted);
    EXPECT_EQ(got.operation, OperationType::ClientMessage);
    EXPECT_EQ(link.ra.sent, std::vector<std::uint32_t>{id});
}

TEST(MessageStream, EncryptedWithNoopKeyOverEcho)
{
    LoopbackTransport t;
    Recorder          rec;
    MessageStream     ms(t, false);
    ms.set_encryption_key(std::make_shared<crypto::NoopKey>());
    ASSERT_TRUE(ms.register_callback(&rec));
    ASSERT_TRUE(ms.start(settings()));

    ms.send_message(text_message("hello", true));
    ASSERT_EQ(rec.received.size(), 1u);
    EXPECT_EQ(rec.received[0].payload, (Bytes{'h', 'e', 'l', 'l', 'o'}));
    EXPECT_FALSE(rec.received[0].is_payload_encrypted);
}

TEST(MessageStream, UndecryptableMessageDisconnectsReceiver)
{
    LinkedPair link(false);
    link.sa.set_encryption_key(std::make_shared<crypto::NoopKey>());
    // sb has no key

    link.sa.send_message(text_message("for nobody", true));

    EXPECT_TRUE(link.rb.received.empty());
    EXPECT_FALSE(link.sb.is_connected());
    EXPECT_EQ(link.b.disconnects(), 1u);
    EXPECT_TRUE(link.sa.is_connected());
}

TEST(MessageStream, CompressedRoundTrip)
{
    LinkedPair link(true);

    const std::string text = repeated(50);  // ~2 KB, compresses well
    link.sa.send_message(text_message(text));

    // uncompressed this would take > 20 writes
    EXPECT_LT(link.a.writes(), 5u);
    ASSERT_EQ(link.rb.received.size(), 1u);
    const StreamMessage &got = link.rb.received[0];
    EXPECT_EQ(std::string(got.payload.begin(), got.payload.end()), text);
    EXPECT_FALSE(got.is_compressed());
}

TEST(MessageStream, IncompressibleSentAsIs)
{
    LinkedPair link(true);

    const StreamMessage msg = sized_message(40);
    link.sa.send_message(msg);

    ASSERT_EQ(link.rb.received.size(), 1u);
    EXPECT_EQ(link.rb.received[0], msg);
}

TEST(MessageStream, WriteFailureDisconnects)
{
    LoopbackTransport t;
    Recorder          rec;
    MessageStream     ms(t, false);
    ASSERT_TRUE(ms.register_callback(&rec));
    ASSERT_TRUE(ms.start(settings()));
    t.set_fail_writes(true);

    EXPECT_EQ(ms.send_message(sized_message(262)), 0u);
    EXPECT_FALSE(ms.is_connected());
    EXPECT_FALSE(ms.write_in_progress());
    EXPECT_EQ(ms.queued_packets(), 0u);
    EXPECT_EQ(t.disconnects(), 1u);
    EXPECT_TRUE(rec.sent.empty());

    // dropped after disconnect, but the id is still allocated
    EXPECT_EQ(ms.send_message(text_message("after")), 1u);
    EXPECT_EQ(ms.queued_packets(), 0u);
}

TEST(MessageStream, LinkDisconnectDropsQueue)
{
    LoopbackTransport t;
    Recorder          rec;
    MessageStream     ms(t, false);
    ASSERT_TRUE(ms.register_callback(&rec));
    ASSERT_TRUE(ms.start(settings()));
    t.set_manual_confirm(true);

    ms.send_message(sized_message(262));
    EXPECT_EQ(ms.queued_packets(), 3u);

    t.disconnect();
    EXPECT_FALSE(ms.is_connected());
    EXPECT_EQ(ms.queued_packets(), 0u);
    EXPECT_FALSE(t.confirm_next());
    EXPECT_TRUE(rec.sent.empty());
}

TEST(MessageStream, DisconnectIsFinal)
{
    LoopbackTransport t;
    MessageStream     ms(t, false);
    ASSERT_TRUE(ms.start(settings()));

    ms.disconnect();
    EXPECT_FALSE(ms.is_connected());
    EXPECT_EQ(t.disconnects(), 1u);

    ms.send_message(text_message("ignored"));
    EXPECT_EQ(t.writes(), 0u);

    ms.disconnect();
    EXPECT_EQ(t.disconnects(), 1u);
}

TEST(MessageStream, RecipientAndOperationSurvive)
{
    LinkedPair link(true);

    StreamMessage msg = text_message("query");
    msg.operation     = OperationType::Query;
    packet::Uuid who{};
    who.fill(0x5A);
    msg.recipient = who;

    link.sa.send_message(msg);
    ASSERT_EQ(link.rb.received.size(), 1u);
    EXPECT_EQ(link.rb.received[0].operation, OperationType::Query);
    ASSERT_TRUE(link.rb.received[0].recipient.has_value());
    EXPECT_EQ(*link.rb.received[0].recipient, who);
}

TEST(MessageStream, CallbackRegistration)
{
    LoopbackTransport t;
    Recorder          rec;
    MessageStream     ms(t, false);

    EXPECT_TRUE(ms.register_callback(&rec));
    EXPECT_FALSE(ms.register_callback(&rec));
    EXPECT_FALSE(ms.register_callback(nullptr));
    ASSERT_TRUE(ms.start(settings()));

    ms.unregister_callback(&rec);
    ms.unregister_callback(&rec);  // unknown: logged only

    ms.send_message(text_message("unseen"));
    EXPECT_TRUE(rec.received.empty());
    EXPECT_TRUE(rec.sent.empty());
}

TEST(MessageStream, ThousandsOfSynchronouslyConfirmedPackets)
{
    LoopbackTransport t;
    Recorder          rec;
    MessageStream     ms(t, false);
    ASSERT_TRUE(ms.register_callback(&rec));
    ASSERT_TRUE(ms.start(settings()));

    const StreamMessage msg = sized_message(10000 * P);
    EXPECT_EQ(ms.send_message(msg), 0u);

    EXPECT_GE(t.writes(), 10000u);
    EXPECT_FALSE(ms.write_in_progress());
    EXPECT_EQ(ms.queued_packets(), 0u);
    EXPECT_TRUE(ms.is_connected());
    EXPECT_EQ(rec.sent, std::vector<std::uint32_t>{0});
    ASSERT_EQ(rec.received.size(), 1u);
    EXPECT_EQ(rec.received[0], msg);
}

TEST(MessageStream, SendFromCallbackDuringSynchronousWrite)
{
    struct Replier : MessageStream::Callback
    {
        MessageStream             *ms      = nullptr;
        int                        replies = 0;
        std::vector<std::uint32_t> sent;

        void on_message_received(const StreamMessage &) override {}
        void on_message_sent(std::uint32_t id) override
        {
            sent.push_back(id);
            if (replies++ < 3)
                ms->send_message(sized_message(200));
        }
    };

    LoopbackTransport t;
    MessageStream     ms(t, false);
    Replier           r;
    r.ms = &ms;
    ASSERT_TRUE(ms.register_callback(&r));
    ASSERT_TRUE(ms.start(settings()));

    ms.send_message(sized_message(200));
    EXPECT_EQ(r.sent, (std::vector<std::uint32_t>{0, 1, 2, 3}));
    EXPECT_EQ(ms.queued_packets(), 0u);
    EXPECT_FALSE(ms.write_in_progress());
}

TEST(MessageStream, ConcurrentSendersKeepMessagesIntact)
{
    constexpr int THREADS    = 4;
    constexpr int PER_THREAD = 50;

    LoopbackTransport a, b;
    a.connect_peer(&b);
    b.connect_peer(&a);
    LockedRecorder ra, rb;
    MessageStream  sa(a, true), sb(b, true);
    ASSERT_TRUE(sa.register_callback(&ra));
    ASSERT_TRUE(sb.register_callback(&rb));
    ASSERT_TRUE(sa.start(settings()));
    ASSERT_TRUE(sb.start(settings()));

    auto payload = [](const std::string &tag, int i) {
        std::string s;
        for (int k = 0; k <= i % 7; ++k)
            s += tag + "-" + std::to_string(i) + " padding to span several packets; ";
        return s;
    };

    std::multiset<std::string> to_b, to_a;
    for (int t = 0; t < THREADS; ++t)
        for (int i = 0; i < PER_THREAD; ++i)
            to_b.insert(payload("a" + std::to_string(t), i));
    for (int i = 0; i < PER_THREAD; ++i)
        to_a.insert(payload("b", i));

    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t)
        threads.emplace_back([&, t] {
            for (int i = 0; i < PER_THREAD; ++i)
                sa.send_message(text_message(payload("a" + std::to_string(t), i)));
        });
    // inbound decoding on sa while its own senders run
    threads.emplace_back([&] {
        for (int i = 0; i < PER_THREAD; ++i)
            sb.send_message(text_message(payload("b", i)));
    });
    for (auto &th : threads)
        th.join();

    EXPECT_TRUE(sa.is_connected());
    EXPECT_TRUE(sb.is_connected());
    EXPECT_EQ(rb.received, to_b);
    EXPECT_EQ(ra.received, to_a);

    std::set<std::uint32_t> ids(ra.sent.begin(), ra.sent.end());
    EXPECT_EQ(ra.sent.size(), static_cast<std::size_t>(THREADS * PER_THREAD));
    EXPECT_EQ(ids.size(), ra.sent.size());
    EXPECT_EQ(*ids.rbegin(), static_cast<std::uint32_t>(THREADS * PER_THREAD - 1));
    EXPECT_EQ(rb.sent.size(), static_cast<std::size_t>(PER_THREAD));
}

TEST(MessageStream, OversizedCompressionClaimDeliveredAsIs)
{
    LoopbackTransport t;
    Recorder          rec;
    MessageStream     ms(t, true);
    ASSERT_TRUE(ms.register_callback(&rec));
    ASSERT_TRUE(ms.start(settings()));

    StreamMessage lie         = text_message("xx");
    lie.original_message_size = 1u << 30;
    auto pk                   = packet::make_packets(lie, MAX_WRITE, 0);
    ASSERT_TRUE(pk.has_value());
    ASSERT_EQ(pk->size(), 1u);

    ms.on_rx(packet::serialize((*pk)[0]));
    EXPECT_TRUE(ms.is_connected());
    ASSERT_EQ(rec.received.size(), 1u);
    EXPECT_EQ(rec.received[0].payload, (Bytes{'x', 'x'}));
}
