#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>

#include "proto/packet.hpp"
#include "util/constants.hpp"

namespace stream
{

// Next message id, wrapping to 0 at `bound`. Not thread-safe; used only
// under the stream lock.
class MessageIdGenerator
{
  public:
    explicit MessageIdGenerator(std::uint64_t bound = constants::MESSAGE_ID_BOUND);

    std::uint32_t next();
    std::uint64_t bound() const { return bound_; }

  private:
    std::uint64_t bound_;
    std::uint64_t next_{0};
};

struct QueuedPacket
{
    packet::Packet packet;
    packet::Frame  frame;  // serialized `packet`, ready for one transport write
};

// FIFO of packets waiting for the link. The packets of one message are
// appended by a single enqueue() call, so they stay contiguous and ordered.
class OutboundQueue
{
  public:
    explicit OutboundQueue(MessageIdGenerator gen = MessageIdGenerator{}) : gen_(gen) {}

    // Allocates an id, chunks `msg` into packets of at most `max_size` bytes
    // and appends them all. nullopt when the message cannot be chunked.
    std::optional<std::uint32_t> enqueue(const packet::StreamMessage &msg, std::size_t max_size);
    // Consumes an id without queueing anything (message dropped).
    std::uint32_t skip_id() { return gen_.next(); }

    const QueuedPacket         *front() const { return q_.empty() ? nullptr : &q_.front(); }
    std::optional<QueuedPacket> pop();
    bool                        empty() const { return q_.empty(); }
    std::size_t                 size() const { return q_.size(); }
    void                        clear() { q_.clear(); }

  private:
    MessageIdGenerator       gen_;
    std::deque<QueuedPacket> q_;
};

}  // namespace stream
