#include "transport/loopback_transport.hpp"
#include "util/log.hpp"

namespace transport
{
// LoopbackTransport: a fake link to test the stream pipeline without a socket.
bool LoopbackTransport::start(const Settings &s, Callbacks cb)
{
    std::lock_guard<std::mutex> lk(mu_);
    cb_        = std::move(cb);
    max_write_ = s.max_write_size;
    started_   = true;
    return true;
}

bool LoopbackTransport::send(const Frame &one_packet)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!started_ || fail_writes_)
            return false;
        if (max_write_ != 0 && one_packet.size() > max_write_)
        {
            LOG_ERROR("send: frame of %zu bytes exceeds max write size %zu", one_packet.size(),
                      max_write_);
            return false;
        }
        ++writes_;
        if (manual_confirm_)
        {
            pending_.push_back(one_packet);
            return true;
        }
    }
    deliver(one_packet);
    return true;
}

bool LoopbackTransport::confirm_next()
{
    Frame f;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (pending_.empty())
            return false;
        f = std::move(pending_.front());
        pending_.pop_front();
    }
    deliver(f);
    return true;
}

// rx first: on_sent may start the next write before this call returns
void LoopbackTransport::deliver(const Frame &f)
{
    LoopbackTransport *peer = nullptr;
    OnFrame            on_sent;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!started_)
            return;
        peer    = peer_;
        on_sent = cb_.on_sent;
    }
    if (peer)
        peer->receive(f);
    else
        receive(f);
    if (on_sent)
        on_sent(f);
}

void LoopbackTransport::receive(const Frame &f)
{
    OnFrame on_rx;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!started_)
            return;
        on_rx = cb_.on_rx;
    }
    if (on_rx)
        on_rx(f);
}

void LoopbackTransport::disconnect()
{
    OnDisconnected on_disconnected;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!started_)
            return;
        started_ = false;
        pending_.clear();
        ++disconnects_;
        on_disconnected = std::move(cb_.on_disconnected);
        cb_             = Callbacks{};
    }
    if (on_disconnected)
        on_disconnected();
}

std::size_t LoopbackTransport::max_write_size() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return max_write_;
}

bool LoopbackTransport::link_ready() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return started_;
}

void LoopbackTransport::connect_peer(LoopbackTransport *peer)
{
    std::lock_guard<std::mutex> lk(mu_);
    peer_ = peer;
}

void LoopbackTransport::set_manual_confirm(bool on)
{
    std::lock_guard<std::mutex> lk(mu_);
    manual_confirm_ = on;
}

std::size_t LoopbackTransport::pending_writes() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return pending_.size();
}

void LoopbackTransport::set_fail_writes(bool on)
{
    std::lock_guard<std::mutex> lk(mu_);
    fail_writes_ = on;
}

std::size_t LoopbackTransport::writes() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return writes_;
}

std::size_t LoopbackTransport::disconnects() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return disconnects_;
}

}  // namespace transport
