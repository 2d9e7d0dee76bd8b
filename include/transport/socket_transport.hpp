#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

#include "transport/itransport.hpp"

namespace transport
{

inline constexpr std::size_t LENGTH_PREFIX_SIZE = 4;  // little-endian frame length

// Full-duplex stream socket link (SPP-style). Every frame goes on the wire
// as [u32 length LE][frame]. A writer thread performs the writes and reports
// on_sent; a reader thread splits inbound bytes into frames for on_rx.
class SocketTransport final : public ITransport
{
  public:
    SocketTransport() = default;
    ~SocketTransport() override;

    SocketTransport(const SocketTransport &)            = delete;
    SocketTransport &operator=(const SocketTransport &) = delete;

    // Link setup; exactly one of these before start().
    bool connect_unix(const std::string &path);
    bool listen_unix(const std::string &path);  // blocks until one peer connects
    bool adopt(int fd);                         // takes ownership

    bool        start(const Settings &s, Callbacks cb) override;
    bool        send(const Frame &one_packet) override;
    void        disconnect() override;
    std::size_t max_write_size() const override { return max_write_; }
    std::string name() const override { return "socket"; }
    bool        link_ready() const override { return running_.load(); }

  private:
    void reader_loop();
    void writer_loop();
    bool write_all(const std::uint8_t *data, std::size_t len);
    void fail_link(const char *why);
    void join_threads();

    int                     fd_{-1};
    std::size_t             max_write_{700};
    std::atomic_bool        running_{false};
    std::mutex              mu_;  // cb_, out_
    std::condition_variable cv_;
    Callbacks               cb_{};
    std::deque<Frame>       out_;
    std::thread             reader_;
    std::thread             writer_;
    std::mutex              join_mu_;
};

}  // namespace transport
