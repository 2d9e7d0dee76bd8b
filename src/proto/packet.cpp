#include <algorithm>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>

#include <google/protobuf/io/coded_stream.h>

#include "device_message.pb.h"
#include "packet.pb.h"
#include "proto/packet.hpp"
#include "util/log.hpp"

namespace packet
{

namespace
{
constexpr std::uint32_t MAX_WIRE_INT32 =
    static_cast<std::uint32_t>(std::numeric_limits<std::int32_t>::max());

Bytes to_bytes(const std::string &s)
{
    return Bytes(s.begin(), s.end());
}
}  // namespace

std::size_t varint_size(std::uint32_t v)
{
    return google::protobuf::io::CodedOutputStream::VarintSize32(v);
}

// The header size depends on the varint width of total_packets, which in turn
// depends on how much room the header leaves for payload. Try each width and
// keep the one that is self-consistent.
std::optional<std::uint32_t> total_packet_count(std::uint32_t message_id,
                                                std::size_t   payload_size,
                                                std::size_t   max_size)
{
    const std::size_t largest_chunk = std::min(payload_size, max_size);
    const std::size_t header_without_total =
        PACKET_NUMBER_SIZE + varint_size(message_id) + FIELD_TAG_SIZE +
        varint_size(static_cast<std::uint32_t>(largest_chunk)) + FIELD_TAG_SIZE;

    for (std::size_t width = 1; width <= MAX_INT32_ENCODING_BYTES; ++width)
    {
        const std::size_t header = header_without_total + width + FIELD_TAG_SIZE;
        if (max_size <= header)
            break;  // no room for a single payload byte

        const std::size_t per_packet = max_size - header;
        std::size_t       total      = (payload_size + per_packet - 1) / per_packet;
        if (total == 0)
            total = 1;  // empty payload still travels as one packet
        if (total > MAX_WIRE_INT32)
            continue;
        if (varint_size(static_cast<std::uint32_t>(total)) == width)
            return static_cast<std::uint32_t>(total);
    }

    LOG_ERROR("cannot get valid total packet number (payload_size=%zu, message_id=%u, "
              "max_size=%zu)",
              payload_size, message_id, max_size);
    return std::nullopt;
}

std::optional<std::size_t> max_packet_payload(std::uint32_t message_id,
                                              std::size_t   payload_size,
                                              std::size_t   max_size)
{
    auto total = total_packet_count(message_id, payload_size, max_size);
    if (!total)
        return std::nullopt;

    const std::size_t header =
        PACKET_NUMBER_SIZE + varint_size(*total) + FIELD_TAG_SIZE + varint_size(message_id) +
        FIELD_TAG_SIZE + varint_size(static_cast<std::uint32_t>(std::min(payload_size, max_size))) +
        FIELD_TAG_SIZE;
    return max_size - header;
}

std::optional<std::vector<Packet>> chunk_payload(const Bytes  &payload,
                                                 std::size_t   max_size,
                                                 std::uint32_t message_id)
{
    if (message_id > MAX_WIRE_INT32)
    {
        LOG_ERROR("chunk_payload: message id %u does not fit the wire format", message_id);
        return std::nullopt;
    }
    auto total     = total_packet_count(message_id, payload.size(), max_size);
    auto per_chunk = max_packet_payload(message_id, payload.size(), max_size);
    if (!total || !per_chunk)
        return std::nullopt;

    std::vector<Packet> out;
    out.reserve(*total);
    std::size_t start = 0;
    for (std::uint32_t n = 1; n <= *total; ++n)
    {
        const std::size_t take = std::min(*per_chunk, payload.size() - start);
        Packet            p;
        p.message_id    = message_id;
        p.packet_number = n;
        p.total_packets = *total;
        p.payload.assign(payload.begin() + start, payload.begin() + start + take);
        out.push_back(std::move(p));
        start += take;
    }
    return out;
}

Bytes serialize_message(const StreamMessage &msg)
{
    msgstream::wire::DeviceMessage dm;
    dm.set_operation(static_cast<msgstream::wire::OperationType>(msg.operation));
    dm.set_is_payload_encrypted(msg.is_payload_encrypted);
    if (msg.recipient)
        dm.set_recipient(msg.recipient->data(), msg.recipient->size());
    dm.set_payload(msg.payload.data(), msg.payload.size());
    dm.set_original_size(msg.original_message_size);
    return to_bytes(dm.SerializeAsString());
}

std::optional<std::vector<Packet>> make_packets(const StreamMessage &msg,
                                                std::size_t          max_size,
                                                std::uint32_t        message_id)
{
    return chunk_payload(serialize_message(msg), max_size, message_id);
}

Frame serialize(const Packet &p)
{
    msgstream::wire::Packet pb;
    pb.set_packet_number(p.packet_number);
    pb.set_total_packets(static_cast<std::int32_t>(p.total_packets));
    pb.set_message_id(static_cast<std::int32_t>(p.message_id));
    pb.set_payload(p.payload.data(), p.payload.size());
    return to_bytes(pb.SerializeAsString());
}

std::optional<Packet> parse(const Frame &frame)
{
    msgstream::wire::Packet pb;
    if (!pb.ParseFromArray(frame.data(), static_cast<int>(frame.size())))
    {
        LOG_ERROR("parse: malformed packet (%zu bytes)", frame.size());
        return std::nullopt;
    }
    if (pb.total_packets() < 1 || pb.message_id() < 0)
    {
        LOG_ERROR("parse: invalid header (total=%d, message_id=%d)", pb.total_packets(),
                  pb.message_id());
        return std::nullopt;
    }
    if (pb.packet_number() < 1 ||
        pb.packet_number() > static_cast<std::uint32_t>(pb.total_packets()))
    {
        LOG_ERROR("parse: packet number %u out of range 1..%d", pb.packet_number(),
                  pb.total_packets());
        return std::nullopt;
    }

    Packet p;
    p.message_id    = static_cast<std::uint32_t>(pb.message_id());
    p.packet_number = pb.packet_number();
    p.total_packets = static_cast<std::uint32_t>(pb.total_packets());
    p.payload.assign(pb.payload().begin(), pb.payload().end());
    return p;
}

std::optional<StreamMessage> to_stream_message(const Bytes &bytes)
{
    msgstream::wire::DeviceMessage dm;
    if (!dm.ParseFromArray(bytes.data(), static_cast<int>(bytes.size())))
    {
        LOG_ERROR("to_stream_message: cannot parse %zu bytes as DeviceMessage", bytes.size());
        return std::nullopt;
    }

    StreamMessage msg;
    if (msgstream::wire::OperationType_IsValid(dm.operation()))
    {
        msg.operation = static_cast<OperationType>(dm.operation());
    }
    else
    {
        LOG_WARN("to_stream_message: unknown operation %d", static_cast<int>(dm.operation()));
        msg.operation = OperationType::Unknown;
    }
    msg.is_payload_encrypted  = dm.is_payload_encrypted();
    msg.original_message_size = dm.original_size();
    msg.payload.assign(dm.payload().begin(), dm.payload().end());

    if (!dm.recipient().empty())
    {
        Uuid id{};
        if (dm.recipient().size() != id.size())
        {
            LOG_ERROR("to_stream_message: recipient has %zu bytes, expect %zu",
                      dm.recipient().size(), id.size());
            return std::nullopt;
        }
        std::memcpy(id.data(), dm.recipient().data(), id.size());
        msg.recipient = id;
    }
    return msg;
}

}  // namespace packet
