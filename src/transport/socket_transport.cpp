#include <cerrno>
#include <cstddef>
#include <cstring>
#include <endian.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include "ctl/ipc.hpp"
#include "transport/socket_transport.hpp"
#include "util/log.hpp"

namespace transport
{

namespace
{
constexpr int POLL_TIMEOUT_MS = 200;

// set on the reader/writer threads of a transport
thread_local const SocketTransport *tls_io_owner = nullptr;
}  // namespace

SocketTransport::~SocketTransport()
{
    disconnect();
    join_threads();
    if (fd_ != -1)
    {
        ::close(fd_);
        fd_ = -1;
    }
}

bool SocketTransport::adopt(int fd)
{
    if (fd < 0 || fd_ != -1)
        return false;
    fd_ = fd;
    return true;
}

bool SocketTransport::connect_unix(const std::string &path)
{
    sockaddr_un addr{};
    socklen_t   addr_len = 0;
    if (!ipc::make_unix_addr(path, addr, addr_len))
        return false;

    int fd = ipc::make_unix_socket();
    if (fd == -1)
        return false;
    if (::connect(fd, reinterpret_cast<sockaddr *>(&addr), addr_len) == -1)
    {
        int saved = errno;
        ::close(fd);
        errno = saved;
        LOG_ERROR("connect(%s) failed: %s", path.c_str(), std::strerror(errno));
        return false;
    }
    LOG_INFO("Connected to link %s", path.c_str());
    return adopt(fd);
}

bool SocketTransport::listen_unix(const std::string &path)
{
    sockaddr_un addr{};
    socklen_t   addr_len = 0;
    if (!ipc::make_unix_addr(path, addr, addr_len))
        return false;

    (void)::unlink(path.c_str());  // stale socket from a previous run

    int lfd = ipc::make_unix_socket();
    if (lfd == -1)
        return false;
    if (::bind(lfd, reinterpret_cast<sockaddr *>(&addr), addr_len) == -1 || ::listen(lfd, 1) == -1)
    {
        int saved = errno;
        ::close(lfd);
        errno = saved;
        LOG_ERROR("bind/listen(%s) failed: %s", path.c_str(), std::strerror(errno));
        return false;
    }

    LOG_INFO("Waiting for link peer on %s", path.c_str());
    int fd = -1;
    while (fd == -1)
    {
        fd = ::accept(lfd, nullptr, nullptr);
        if (fd == -1 && errno != EINTR)
        {
            LOG_ERROR("accept() failed: %s", std::strerror(errno));
            break;
        }
    }
    ::close(lfd);
    ::unlink(path.c_str());
    if (fd == -1)
        return false;

    ipc::set_cloexec(fd);
    LOG_INFO("Link peer connected on %s", path.c_str());
    return adopt(fd);
}

bool SocketTransport::start(const Settings &s, Callbacks cb)
{
    if (fd_ == -1)
    {
        LOG_ERROR("start: no link socket");
        return false;
    }
    if (running_.load() || reader_.joinable() || writer_.joinable())
    {
        LOG_ERROR("start: transport already started");
        return false;
    }
    {
        std::lock_guard<std::mutex> lk(mu_);
        cb_ = std::move(cb);
        out_.clear();
    }
    max_write_ = s.max_write_size;
    running_.store(true);
    reader_ = std::thread([this] { reader_loop(); });
    writer_ = std::thread([this] { writer_loop(); });
    return true;
}

bool SocketTransport::send(const Frame &one_packet)
{
    if (!running_.load())
    {
        LOG_ERROR("send: link is down");
        return false;
    }
    if (one_packet.size() > max_write_)
    {
        LOG_ERROR("send: frame of %zu bytes exceeds max write size %zu", one_packet.size(),
                  max_write_);
        return false;
    }
    {
        std::lock_guard<std::mutex> lk(mu_);
        out_.push_back(one_packet);
    }
    cv_.notify_one();
    return true;
}

void SocketTransport::disconnect()
{
    if (running_.exchange(false))
    {
        LOG_INFO("Disconnecting link");
        if (fd_ != -1)
            ::shutdown(fd_, SHUT_RDWR);

        OnDisconnected on_disconnected;
        {
            std::lock_guard<std::mutex> lk(mu_);
            out_.clear();
            on_disconnected = std::move(cb_.on_disconnected);
        }
        cv_.notify_all();
        if (on_disconnected)
            on_disconnected();
    }

    // the I/O threads only signal; the owner joins them
    if (tls_io_owner == this)
        return;
    join_threads();
}

void SocketTransport::join_threads()
{
    std::lock_guard<std::mutex> lk(join_mu_);
    if (reader_.joinable())
        reader_.join();
    if (writer_.joinable())
        writer_.join();
}

void SocketTransport::fail_link(const char *why)
{
    if (!running_.load())
        return;  // already going down
    LOG_ERROR("Link failure: %s", why);
    disconnect();
}

bool SocketTransport::write_all(const std::uint8_t *data, std::size_t len)
{
    std::size_t sent = 0;
    while (sent < len)
    {
        ssize_t n = ::send(fd_, data + sent, len - sent, MSG_NOSIGNAL);
        if (n > 0)
        {
            sent += static_cast<std::size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR)
            continue;
        LOG_ERROR("send() failed: %s", std::strerror(errno));
        return false;
    }
    return true;
}

void SocketTransport::writer_loop()
{
    tls_io_owner = this;
    while (true)
    {
        Frame   frame;
        OnFrame on_sent;
        {
            std::unique_lock<std::mutex> lk(mu_);
            cv_.wait(lk, [this] { return !running_.load() || !out_.empty(); });
            if (!running_.load())
                return;
            frame = std::move(out_.front());
            out_.pop_front();
            on_sent = cb_.on_sent;
        }

        std::uint8_t prefix[LENGTH_PREFIX_SIZE];
        std::uint32_t len_le = htole32(static_cast<std::uint32_t>(frame.size()));
        std::memcpy(prefix, &len_le, sizeof len_le);

        if (!write_all(prefix, sizeof prefix) ||
            (!frame.empty() && !write_all(frame.data(), frame.size())))
        {
            fail_link("write error");
            return;
        }
        LOG_DEBUG("Wrote frame of %zu bytes", frame.size());
        if (on_sent)
            on_sent(frame);
    }
}

void SocketTransport::reader_loop()
{
    tls_io_owner = this;
    std::vector<std::uint8_t> buf;
    std::uint8_t              chunk[4096];

    while (running_.load())
    {
        pollfd pfd{};
        pfd.fd     = fd_;
        pfd.events = POLLIN;
        int pr     = ::poll(&pfd, 1, POLL_TIMEOUT_MS);
        if (pr == 0)
            continue;
        if (pr == -1)
        {
            if (errno == EINTR)
                continue;
            fail_link("poll error");
            return;
        }

        ssize_t n = ::recv(fd_, chunk, sizeof chunk, 0);
        if (n == 0)
        {
            fail_link("peer closed the link");
            return;
        }
        if (n == -1)
        {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            fail_link(std::strerror(errno));
            return;
        }
        buf.insert(buf.end(), chunk, chunk + n);

        // split complete [len][frame] records
        std::size_t off = 0;
        while (buf.size() - off >= LENGTH_PREFIX_SIZE)
        {
            std::uint32_t len_le = 0;
            std::memcpy(&len_le, buf.data() + off, sizeof len_le);
            const std::size_t len = le32toh(len_le);
            if (len > max_write_)
            {
                LOG_ERROR("Inbound frame of %zu bytes exceeds max %zu", len, max_write_);
                fail_link("oversized frame");
                return;
            }
            if (buf.size() - off - LENGTH_PREFIX_SIZE < len)
                break;  // wait for the rest

            const auto begin = buf.begin() + static_cast<std::ptrdiff_t>(off + LENGTH_PREFIX_SIZE);
            Frame      frame(begin, begin + static_cast<std::ptrdiff_t>(len));
            off += LENGTH_PREFIX_SIZE + len;

            OnFrame on_rx;
            {
                std::lock_guard<std::mutex> lk(mu_);
                on_rx = cb_.on_rx;
            }
            if (on_rx)
                on_rx(frame);
            if (!running_.load())
                return;
        }
        buf.erase(buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(off));
    }
}

}  // namespace transport
