#include "stream/outbound_queue.hpp"
#include "util/log.hpp"

namespace stream
{

MessageIdGenerator::MessageIdGenerator(std::uint64_t bound) : bound_(bound)
{
    if (bound_ == 0 || bound_ > constants::MESSAGE_ID_BOUND)
    {
        LOG_WARN("Message id bound %llu out of range; using %llu",
                 static_cast<unsigned long long>(bound_),
                 static_cast<unsigned long long>(constants::MESSAGE_ID_BOUND));
        bound_ = constants::MESSAGE_ID_BOUND;
    }
}

std::uint32_t MessageIdGenerator::next()
{
    const auto id = static_cast<std::uint32_t>(next_);
    next_         = (next_ + 1) % bound_;
    return id;
}

std::optional<std::uint32_t> OutboundQueue::enqueue(const packet::StreamMessage &msg,
                                                    std::size_t                  max_size)
{
    const std::uint32_t id      = gen_.next();
    auto                packets = packet::make_packets(msg, max_size, id);
    if (!packets)
    {
        LOG_ERROR("enqueue: cannot chunk message %u (%zu payload bytes, max_size=%zu)", id,
                  msg.payload.size(), max_size);
        return std::nullopt;
    }

    LOG_INFO("Sending message %u to device, number of packets: %zu", id, packets->size());
    for (auto &p : *packets)
    {
        QueuedPacket qp;
        qp.frame  = packet::serialize(p);
        qp.packet = std::move(p);
        q_.push_back(std::move(qp));
    }
    return id;
}

std::optional<QueuedPacket> OutboundQueue::pop()
{
    if (q_.empty())
        return std::nullopt;
    QueuedPacket qp = std::move(q_.front());
    q_.pop_front();
    return qp;
}

}  // namespace stream
