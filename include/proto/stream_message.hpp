#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <vector>

namespace packet
{

using Bytes = std::vector<std::uint8_t>;
using Uuid  = std::array<std::uint8_t, 16>;

// Mirrors msgstream.wire.OperationType
enum class OperationType : int
{
    Unknown             = 0,
    EncryptionHandshake = 2,
    Ack                 = 3,
    ClientMessage       = 4,
    Query               = 5,
    QueryResponse       = 6
};

/*
 One application-level message, before chunking or after reassembly.

 payload               bytes to send / bytes received
 operation             what the payload carries
 is_payload_encrypted  outgoing: encrypt before sending; incoming: payload is ciphertext
 original_message_size size before compression, 0 when the payload is not compressed
 recipient             intended receiver, if any
*/
struct StreamMessage
{
    Bytes                         payload;
    OperationType                 operation{OperationType::Unknown};
    bool                          is_payload_encrypted{false};
    std::uint32_t                 original_message_size{0};
    std::optional<Uuid>           recipient{};

    bool is_compressed() const { return original_message_size > 0; }

    bool operator==(const StreamMessage &o) const
    {
        return payload == o.payload && operation == o.operation &&
               is_payload_encrypted == o.is_payload_encrypted &&
               original_message_size == o.original_message_size && recipient == o.recipient;
    }
    bool operator!=(const StreamMessage &o) const { return !(*this == o); }
};

}  // namespace packet
