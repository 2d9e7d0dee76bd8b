#include <cmath>

#include "codec/compression.hpp"
#include "stream/message_transforms.hpp"
#include "util/log.hpp"

namespace stream
{

packet::StreamMessage to_compressed(const packet::StreamMessage &msg)
{
    if (msg.is_compressed())
    {
        LOG_ERROR("Message is already compressed. Returning as is.");
        return msg;
    }

    auto compressed = compression::compress(msg.payload);
    if (!compressed)
    {
        LOG_INFO("Compression did not result in positive net savings. Returning as is.");
        return msg;
    }

    const std::size_t original = msg.payload.size();
    const long        saving   = std::lround(
        100.0 * static_cast<double>(original - compressed->size()) / static_cast<double>(original));
    LOG_INFO("Compressed from %zu to %zu bytes saved %ld%%.", original, compressed->size(), saving);

    packet::StreamMessage out = msg;
    out.payload               = std::move(*compressed);
    out.original_message_size = static_cast<std::uint32_t>(original);
    return out;
}

packet::StreamMessage to_decompressed(const packet::StreamMessage &msg)
{
    if (!msg.is_compressed())
        return msg;

    auto decompressed = compression::decompress(msg.payload, msg.original_message_size);
    if (!decompressed)
    {
        LOG_ERROR("Could not decompress message of %zu bytes. Returning as is.",
                  msg.payload.size());
        return msg;
    }

    packet::StreamMessage out = msg;
    out.payload               = std::move(*decompressed);
    out.original_message_size = 0;
    return out;
}

packet::StreamMessage to_encrypted(const packet::StreamMessage &msg, crypto::Key *key)
{
    if (!msg.is_payload_encrypted)
        throw ContractViolation("StreamMessage is not marked for encryption");
    if (!key)
        throw ContractViolation("Could not encrypt message; encryption key is null");

    packet::StreamMessage out = msg;
    if (!key->encrypt_data(msg.payload, out.payload))
        throw ContractViolation("Could not encrypt message payload");
    return out;
}

std::optional<packet::StreamMessage> to_decrypted(const packet::StreamMessage &msg,
                                                  crypto::Key                 *key)
{
    if (!msg.is_payload_encrypted)
    {
        LOG_ERROR("to_decrypted: message is not encrypted");
        return std::nullopt;
    }
    if (!key)
    {
        LOG_ERROR("Could not decrypt message; encryption key is null");
        return std::nullopt;
    }

    packet::StreamMessage out = msg;
    if (!key->decrypt_data(msg.payload, out.payload))
    {
        LOG_ERROR("Could not decrypt message of %zu bytes", msg.payload.size());
        return std::nullopt;
    }
    out.is_payload_encrypted = false;
    return out;
}

}  // namespace stream
