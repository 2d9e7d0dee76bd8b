#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>

#include "crypto/key.hpp"
#include "proto/message_assembler.hpp"
#include "proto/stream_message.hpp"
#include "stream/callback_registry.hpp"
#include "stream/message_transforms.hpp"
#include "stream/outbound_queue.hpp"
#include "transport/itransport.hpp"

namespace stream
{

/*
 Sends and receives StreamMessages over one transport link.

 Outgoing messages are compressed (when enabled), encrypted (when requested)
 and chunked into packets no larger than the link's max write size. Only one
 packet is written at a time; the next one goes out after the transport
 confirms the previous write.

 Incoming packets are reassembled into messages and delivered to the
 registered callbacks.

 Any decode, sequencing or write failure disconnects the link; a
 disconnected stream stays disconnected.
*/
class MessageStream
{
  public:
    class Callback
    {
      public:
        virtual ~Callback() = default;

        virtual void on_message_received(const packet::StreamMessage &msg) = 0;
        // The last packet of `message_id` was written to the link.
        virtual void on_message_sent(std::uint32_t message_id) = 0;
    };

    MessageStream(transport::ITransport &t,
                  bool                   compression_enabled,
                  MessageIdGenerator     ids = MessageIdGenerator{});
    ~MessageStream();

    MessageStream(const MessageStream &)            = delete;
    MessageStream &operator=(const MessageStream &) = delete;

    // Version 2: no compression; version 3: compression. nullptr otherwise.
    static std::unique_ptr<MessageStream> create(int message_version, transport::ITransport &t);

    // Starts the transport with this stream's callbacks.
    bool start(const transport::Settings &s);

    // Queues `msg` and returns its message id. The id is reported again
    // through Callback::on_message_sent once the whole message is written.
    // Throws ContractViolation when the stream is not started, encryption is
    // requested without a key, or the message cannot be chunked.
    std::uint32_t send_message(packet::StreamMessage msg);

    bool register_callback(Callback *cb);
    void unregister_callback(Callback *cb);

    void                         set_encryption_key(std::shared_ptr<crypto::Key> key);
    std::shared_ptr<crypto::Key> encryption_key() const;

    // Drops the link and all queued/partial state. Final.
    void disconnect();

    bool        is_connected() const;
    bool        compression_enabled() const { return compression_enabled_; }
    std::size_t queued_packets() const;
    bool        write_in_progress() const { return write_in_progress_.load(); }

    // Transport events
    void on_rx(const transport::Frame &f);
    void on_sent(const transport::Frame &f);
    void on_disconnected();

  private:
    void drive_queue();
    // clears link state; returns true when the stream was connected
    bool drop_link_state();

    transport::ITransport &tx_;
    const bool             compression_enabled_;

    // Guards the queue including compression, encryption and enqueueing,
    // and the assembler.
    mutable std::mutex           mu_;
    OutboundQueue                queue_;
    packet::MessageAssembler     assembler_;
    std::shared_ptr<crypto::Key> key_;
    std::size_t                  max_size_{0};
    bool                         started_{false};
    bool                         connected_{false};

    // At most one transport write outstanding.
    std::atomic_bool write_in_progress_{false};

    CallbackRegistry<Callback> callbacks_;
};

}  // namespace stream
