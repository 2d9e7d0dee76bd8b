#pragma once
#include <optional>
#include <stdexcept>

#include "crypto/key.hpp"
#include "proto/stream_message.hpp"

namespace stream
{

// A caller broke a precondition of the stream (e.g. asked for encryption
// before a key was established). Not recoverable by retrying.
class ContractViolation : public std::logic_error
{
  public:
    using std::logic_error::logic_error;
};

// Payload transforms applied by MessageStream. Outbound order is compress
// then encrypt; inbound order is decrypt then decompress.

// Compressed copy of `msg`, or `msg` unchanged when compression does not
// shrink it or it is already compressed.
packet::StreamMessage to_compressed(const packet::StreamMessage &msg);

// Decompressed copy of `msg` (original_message_size reset to 0). A message
// that is not compressed, or fails to inflate, is returned unchanged.
packet::StreamMessage to_decompressed(const packet::StreamMessage &msg);

// Encrypts the payload with `key`.
// Throws ContractViolation when the message is not marked for encryption,
// `key` is null or the key fails to encrypt.
packet::StreamMessage to_encrypted(const packet::StreamMessage &msg, crypto::Key *key);

// Decrypted copy with is_payload_encrypted cleared; nullopt when the message
// is not encrypted, there is no key, or authentication fails.
std::optional<packet::StreamMessage> to_decrypted(const packet::StreamMessage &msg,
                                                  crypto::Key                 *key);

}  // namespace stream
