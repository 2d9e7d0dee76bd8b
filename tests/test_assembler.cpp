#include <cstdint>
#include <gtest/gtest.h>
#include <vector>

#include "proto/message_assembler.hpp"

using namespace packet;
using R = MessageAssembler::Result;

static Bytes gen_bytes(std::size_t n)
{
    Bytes v(n);
    for (std::size_t i = 0; i < n; ++i)
        v[i] = static_cast<std::uint8_t>(i & 0xFF);
    return v;
}

static std::vector<Packet> make(std::uint32_t id, std::size_t len)
{
    auto pk = chunk_payload(gen_bytes(len), 100, id);
    EXPECT_TRUE(pk.has_value());
    return pk ? *pk : std::vector<Packet>{};
}

TEST(Assembler, CompletesInOrder)
{
    MessageAssembler a;
    auto             pk = make(5, 250);
    ASSERT_EQ(pk.size(), 3u);

    Bytes out;
    EXPECT_EQ(a.feed(pk[0], out), R::Pending);
    EXPECT_TRUE(a.in_progress());
    EXPECT_EQ(a.feed(pk[1], out), R::Pending);
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(a.feed(pk[2], out), R::Completed);
    EXPECT_EQ(out, gen_bytes(250));
    EXPECT_FALSE(a.in_progress());
}

TEST(Assembler, SinglePacketMessage)
{
    MessageAssembler a;
    auto             pk = make(1, 0);
    ASSERT_EQ(pk.size(), 1u);

    Bytes out{0x01};
    EXPECT_EQ(a.feed(pk[0], out), R::Completed);
    EXPECT_TRUE(out.empty());
}

TEST(Assembler, NextMessageAfterCompletion)
{
    MessageAssembler a;
    Bytes            out;
    for (std::uint32_t id : {1u, 2u})
    {
        auto pk = make(id, 120);
        ASSERT_EQ(pk.size(), 2u);
        EXPECT_EQ(a.feed(pk[0], out), R::Pending);
        EXPECT_EQ(a.feed(pk[1], out), R::Completed);
        EXPECT_EQ(out, gen_bytes(120));
    }
}

TEST(Assembler, OutOfOrderIsSequenceError)
{
    MessageAssembler a;
    auto             pk = make(5, 250);
    Bytes            out;

    EXPECT_EQ(a.feed(pk[0], out), R::Pending);
    EXPECT_EQ(a.feed(pk[2], out), R::SequenceError);
    EXPECT_FALSE(a.in_progress());
    EXPECT_TRUE(out.empty());
}

TEST(Assembler, DuplicateIsSequenceError)
{
    MessageAssembler a;
    auto             pk = make(5, 250);
    Bytes            out;

    EXPECT_EQ(a.feed(pk[0], out), R::Pending);
    EXPECT_EQ(a.feed(pk[0], out), R::SequenceError);
}

TEST(Assembler, ForeignIdIsSequenceError)
{
    MessageAssembler a;
    auto             first = make(5, 250);
    auto             other = make(6, 250);
    Bytes            out;

    EXPECT_EQ(a.feed(first[0], out), R::Pending);
    EXPECT_EQ(a.feed(other[1], out), R::SequenceError);
    EXPECT_FALSE(a.in_progress());
}

TEST(Assembler, MustStartAtPacketOne)
{
    MessageAssembler a;
    auto             pk = make(5, 250);
    Bytes            out;

    EXPECT_EQ(a.feed(pk[1], out), R::SequenceError);
    EXPECT_FALSE(a.in_progress());
}

TEST(Assembler, TotalChangeIsSequenceError)
{
    MessageAssembler a;
    auto             pk = make(5, 250);
    Bytes            out;

    EXPECT_EQ(a.feed(pk[0], out), R::Pending);
    Packet bad        = pk[1];
    bad.total_packets = 4;
    EXPECT_EQ(a.feed(bad, out), R::SequenceError);
}

TEST(Assembler, ResetDropsPartialMessage)
{
    MessageAssembler a;
    auto             pk = make(5, 250);
    Bytes            out;

    EXPECT_EQ(a.feed(pk[0], out), R::Pending);
    a.reset();
    EXPECT_FALSE(a.in_progress());
    // a fresh message is accepted afterwards
    EXPECT_EQ(a.feed(pk[0], out), R::Pending);
}

TEST(Assembler, ResultNames)
{
    EXPECT_STREQ(to_string(R::Pending), "pending");
    EXPECT_STREQ(to_string(R::Completed), "completed");
    EXPECT_STREQ(to_string(R::SequenceError), "sequence-error");
}
