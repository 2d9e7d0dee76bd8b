#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace transport
{

using Frame          = std::vector<std::uint8_t>;
using OnFrame        = std::function<void(const Frame &)>;
using OnDisconnected = std::function<void()>;

struct Settings
{
    std::string role;  // "listen" / "connect" for sockets, "loopback" for testing
    std::size_t max_write_size = 700;
};

// Link events. All of them may arrive on a transport-owned thread.
struct Callbacks
{
    OnFrame        on_rx;            // one complete frame read from the link
    OnFrame        on_sent;          // the frame handed to send() was written
    OnDisconnected on_disconnected;  // link is gone; fired at most once
};

struct ITransport
{
    virtual bool start(const Settings &s, Callbacks cb) = 0;
    // One write of at most max_write_size() bytes. Returns false when the
    // write could not be initiated; success is confirmed through on_sent.
    virtual bool        send(const Frame &one_packet)   = 0;
    virtual void        disconnect()                    = 0;
    virtual std::size_t max_write_size() const          = 0;
    virtual std::string name() const { return ""; }
    virtual bool        link_ready() const = 0;
    virtual ~ITransport() = default;
};

}  // namespace transport
