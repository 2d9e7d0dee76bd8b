#include <utility>

#include "stream/message_stream.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace stream
{

MessageStream::MessageStream(transport::ITransport &t,
                             bool                   compression_enabled,
                             MessageIdGenerator     ids)
    : tx_(t), compression_enabled_(compression_enabled), queue_(ids)
{
}

MessageStream::~MessageStream()
{
    bool started = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        started = started_;
    }
    // the transport must not call back into a destroyed stream
    if (started)
        disconnect();
}

std::unique_ptr<MessageStream> MessageStream::create(int message_version, transport::ITransport &t)
{
    switch (message_version)
    {
    case constants::MESSAGE_VERSION_NO_COMPRESSION:
        return std::make_unique<MessageStream>(t, false);
    case constants::MESSAGE_VERSION_COMPRESSION:
        return std::make_unique<MessageStream>(t, true);
    default:
        LOG_ERROR("Unsupported message version %d", message_version);
        return nullptr;
    }
}

bool MessageStream::start(const transport::Settings &s)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (started_)
        {
            LOG_ERROR("start: stream already started");
            return false;
        }
        // frames may arrive as soon as the transport is up
        connected_ = true;
    }

    transport::Callbacks cb;
    cb.on_rx           = [this](const transport::Frame &f) { on_rx(f); };
    cb.on_sent         = [this](const transport::Frame &f) { on_sent(f); };
    cb.on_disconnected = [this] { on_disconnected(); };
    if (!tx_.start(s, std::move(cb)))
    {
        LOG_ERROR("start: %s transport failed to start", tx_.name().c_str());
        std::lock_guard<std::mutex> lk(mu_);
        connected_ = false;
        return false;
    }

    std::lock_guard<std::mutex> lk(mu_);
    max_size_ = tx_.max_write_size();
    started_  = true;
    LOG_INFO("Message stream started on %s link (max write %zu, compression %s)",
             tx_.name().c_str(), max_size_, compression_enabled_ ? "on" : "off");
    return true;
}

std::uint32_t MessageStream::send_message(packet::StreamMessage msg)
{
    std::uint32_t id = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!started_)
            throw ContractViolation("send_message called before start()");

        if (!connected_)
        {
            id = queue_.skip_id();
            LOG_WARN("Link is disconnected; dropping message %u", id);
            return id;
        }

        if (compression_enabled_)
            msg = to_compressed(msg);
        if (msg.is_payload_encrypted)
            msg = to_encrypted(msg, key_.get());

        auto queued = queue_.enqueue(msg, max_size_);
        if (!queued)
            throw ContractViolation("Message cannot be split into packets for this link");
        id = *queued;
    }

    drive_queue();
    return id;
}

namespace
{
// Stream whose drive_queue() loop is running on this thread.
thread_local const MessageStream *t_draining = nullptr;

struct DrainScope
{
    explicit DrainScope(const MessageStream *s) : prev(t_draining) { t_draining = s; }
    ~DrainScope() { t_draining = prev; }

    const MessageStream *prev;
};
}  // namespace

void MessageStream::drive_queue()
{
    // A write confirmed synchronously calls back in here through on_sent();
    // the loop below sends the next packet instead of recursing.
    if (t_draining == this)
        return;
    DrainScope scope(this);

    for (;;)
    {
        bool expected = false;
        if (!write_in_progress_.compare_exchange_strong(expected, true))
            return;  // the pending write continues the queue when confirmed

        transport::Frame frame;
        {
            std::lock_guard<std::mutex> lk(mu_);
            const QueuedPacket *head = connected_ ? queue_.front() : nullptr;
            if (!head)
            {
                // cleared under the lock so a concurrent enqueue cannot miss it
                write_in_progress_.store(false);
                return;
            }
            frame = head->frame;
        }

        if (!tx_.send(frame))
        {
            std::size_t remaining = 0;
            {
                std::lock_guard<std::mutex> lk(mu_);
                remaining = queue_.size();
                write_in_progress_.store(false);
            }
            LOG_ERROR("Write failed; disconnecting and dropping %zu queued packets", remaining);
            disconnect();
            return;
        }
    }
}

void MessageStream::on_sent(const transport::Frame & /*f*/)
{
    std::optional<QueuedPacket> done;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!connected_)
        {
            write_in_progress_.store(false);
            return;
        }
        done = queue_.pop();
        write_in_progress_.store(false);
    }

    if (!done)
    {
        LOG_WARN("Write confirmed with an empty queue; ignoring");
        return;
    }

    const packet::Packet &p = done->packet;
    LOG_DEBUG("Packet %u/%u of message %u written", p.packet_number, p.total_packets,
              p.message_id);
    if (p.packet_number == p.total_packets)
    {
        const std::uint32_t id = p.message_id;
        callbacks_.for_each([id](Callback &cb) { cb.on_message_sent(id); });
    }

    drive_queue();
}

void MessageStream::on_rx(const transport::Frame &f)
{
    std::optional<packet::StreamMessage> received;
    bool                                 drop_link = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!connected_)
            return;

        auto p = packet::parse(f);
        if (!p)
        {
            LOG_ERROR("Could not decode %zu byte packet; disconnecting", f.size());
            drop_link = true;
        }
        else
        {
            packet::Bytes payload;
            const auto    r = assembler_.feed(*p, payload);
            if (r == packet::MessageAssembler::Result::SequenceError)
            {
                LOG_ERROR("Unexpected packet %u/%u of message %u; disconnecting", p->packet_number,
                          p->total_packets, p->message_id);
                drop_link = true;
            }
            else if (r == packet::MessageAssembler::Result::Completed)
            {
                received = packet::to_stream_message(payload);
                if (!received)
                {
                    LOG_ERROR("Could not parse message %u; disconnecting", p->message_id);
                    drop_link = true;
                }
                else if (received->is_payload_encrypted)
                {
                    received = to_decrypted(*received, key_.get());
                    if (!received)
                        drop_link = true;
                }
            }
        }
    }

    if (drop_link)
    {
        disconnect();
        return;
    }
    if (!received)
        return;

    if (compression_enabled_)
        received = to_decompressed(*received);

    const packet::StreamMessage &msg = *received;
    callbacks_.for_each([&msg](Callback &cb) { cb.on_message_received(msg); });
}

bool MessageStream::drop_link_state()
{
    std::lock_guard<std::mutex> lk(mu_);
    const bool was_connected = connected_;
    connected_               = false;
    queue_.clear();
    assembler_.reset();
    write_in_progress_.store(false);
    return was_connected;
}

void MessageStream::disconnect()
{
    if (drop_link_state())
        LOG_INFO("Disconnecting message stream");
    tx_.disconnect();
}

void MessageStream::on_disconnected()
{
    if (drop_link_state())
        LOG_WARN("Link disconnected; message stream closed");
}

bool MessageStream::register_callback(Callback *cb)
{
    return callbacks_.add(cb);
}

void MessageStream::unregister_callback(Callback *cb)
{
    callbacks_.remove(cb);
}

void MessageStream::set_encryption_key(std::shared_ptr<crypto::Key> key)
{
    std::lock_guard<std::mutex> lk(mu_);
    key_ = std::move(key);
}

std::shared_ptr<crypto::Key> MessageStream::encryption_key() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return key_;
}

bool MessageStream::is_connected() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return connected_;
}

std::size_t MessageStream::queued_packets() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return queue_.size();
}

}  // namespace stream
