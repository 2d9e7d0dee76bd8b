#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "proto/stream_message.hpp"

/*
TX:
MessageStream::send_message(StreamMessage)
  -> [compress] -> [encrypt]
     -> make_packets(msg, max_size, id)   // DeviceMessage proto, then chunk_payload()
        -> for each Packet: serialize(Packet) -> one transport write

RX:
transport on_rx(frame)
  -> parse(frame)                          // Packet proto, ordinal checks
     -> MessageAssembler::feed(Packet)
        -> Completed ? to_stream_message(bytes) -> [decrypt] -> [decompress] -> observers
*/

namespace packet
{

// --- Wire overhead constants (protobuf encoding of msgstream.wire.Packet) ---
inline constexpr std::size_t FIELD_TAG_SIZE           = 1;  // field numbers 1..4
inline constexpr std::size_t FIXED32_SIZE             = 4;
inline constexpr std::size_t PACKET_NUMBER_SIZE       = FIXED32_SIZE + FIELD_TAG_SIZE;
inline constexpr std::size_t MAX_INT32_ENCODING_BYTES = 5;

using Frame = std::vector<std::uint8_t>;

struct Packet
{
    std::uint32_t message_id{0};
    std::uint32_t packet_number{0};  // 1-based
    std::uint32_t total_packets{0};
    Bytes         payload;
};

// Bytes needed to encode v as a protobuf varint.
std::size_t varint_size(std::uint32_t v);

// Number of packets needed to carry payload_size bytes in writes of at most
// max_size bytes. nullopt when no consistent count exists (payload too large
// or max_size too small).
std::optional<std::uint32_t> total_packet_count(std::uint32_t message_id,
                                                std::size_t   payload_size,
                                                std::size_t   max_size);

// Payload bytes carried per packet for the given message.
std::optional<std::size_t> max_packet_payload(std::uint32_t message_id,
                                              std::size_t   payload_size,
                                              std::size_t   max_size);

// TX
std::optional<std::vector<Packet>> chunk_payload(const Bytes  &payload,
                                                 std::size_t   max_size,
                                                 std::uint32_t message_id);
std::optional<std::vector<Packet>> make_packets(const StreamMessage &msg,
                                                std::size_t          max_size,
                                                std::uint32_t        message_id);
Frame                              serialize(const Packet &p);
Bytes                              serialize_message(const StreamMessage &msg);

// RX
std::optional<Packet>        parse(const Frame &frame);
std::optional<StreamMessage> to_stream_message(const Bytes &bytes);

}  // namespace packet
