#pragma once
#include <cstdint>
#include <optional>

#include "proto/packet.hpp"

namespace packet
{

// Rebuilds one message at a time from in-order packets of a single link.
// Not thread-safe; MessageStream calls it under its lock.
class MessageAssembler
{
  public:
    enum class Result
    {
        Pending,        // packet accepted, message not complete yet
        Completed,      // last packet accepted, payload written to `out`
        SequenceError,  // foreign id, wrong ordinal or total; state dropped
    };

    // Feed one decoded packet. On SequenceError the caller must drop the link.
    Result feed(const Packet &p, Bytes &out);

    void reset();
    bool in_progress() const { return state_.has_value(); }

  private:
    struct State
    {
        std::uint32_t message_id    = 0;
        std::uint32_t total_packets = 0;
        std::uint32_t next_packet   = 1;
        Bytes         buffer;
    };
    std::optional<State> state_;
};

const char *to_string(MessageAssembler::Result r);

}  // namespace packet
