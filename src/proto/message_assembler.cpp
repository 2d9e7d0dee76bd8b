#include "proto/message_assembler.hpp"
#include "util/log.hpp"

namespace packet
{

MessageAssembler::Result MessageAssembler::feed(const Packet &p, Bytes &out)
{
    if (!state_)
    {
        if (p.packet_number != 1)
        {
            LOG_ERROR("feed: message %u starts at packet %u, expecting 1", p.message_id,
                      p.packet_number);
            return Result::SequenceError;
        }
        State st;
        st.message_id    = p.message_id;
        st.total_packets = p.total_packets;
        state_           = std::move(st);
    }

    State &st = *state_;
    if (p.message_id != st.message_id)
    {
        LOG_ERROR("feed: packet for message %u while message %u is incomplete (%u of %u)",
                  p.message_id, st.message_id, st.next_packet - 1, st.total_packets);
        reset();
        return Result::SequenceError;
    }
    if (p.total_packets != st.total_packets)
    {
        LOG_ERROR("feed: total packets changed from %u to %u for message %u", st.total_packets,
                  p.total_packets, st.message_id);
        reset();
        return Result::SequenceError;
    }
    if (p.packet_number != st.next_packet)
    {
        LOG_ERROR("feed: out-of-order packet %u of message %u, expecting %u", p.packet_number,
                  st.message_id, st.next_packet);
        reset();
        return Result::SequenceError;
    }

    st.buffer.insert(st.buffer.end(), p.payload.begin(), p.payload.end());
    ++st.next_packet;

    if (p.packet_number != st.total_packets)
        return Result::Pending;

    out = std::move(st.buffer);
    state_.reset();
    return Result::Completed;
}

void MessageAssembler::reset()
{
    state_.reset();
}

const char *to_string(MessageAssembler::Result r)
{
    switch (r)
    {
        case MessageAssembler::Result::Pending:
            return "pending";
        case MessageAssembler::Result::Completed:
            return "completed";
        case MessageAssembler::Result::SequenceError:
            return "sequence-error";
    }
    return "?";
}

}  // namespace packet
