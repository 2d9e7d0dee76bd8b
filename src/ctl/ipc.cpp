#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

#include "ctl/ipc.hpp"
#include "util/log.hpp"

namespace ipc
{
namespace fs = std::filesystem;

static bool ensure_parent_dir(const std::string &sock_path)
{
    std::error_code ec;
    fs::path        dir = fs::path(sock_path).parent_path();
    if (dir.empty())
        return true;  // socket in CWD

    if (!fs::exists(dir, ec) && !fs::create_directories(dir, ec))
    {
        LOG_ERROR("create_directories(%s) failed: %s", dir.string().c_str(),
                  ec.message().c_str());
        return false;
    }
    // owner only
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec)
        LOG_WARN("permissions(%s, 0700) failed: %s", dir.string().c_str(), ec.message().c_str());
    return true;
}

static bool write_all(int fd, const char *buf, std::size_t len)
{
    std::size_t sent = 0;
    while (sent < len)
    {
        ssize_t n = ::send(fd, buf + sent, len - sent, MSG_NOSIGNAL);
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

// Reads until `stop_at_newline` sees '\n', or EOF. False on a socket error.
static bool read_text(int fd, std::string &out, bool stop_at_newline)
{
    char buf[256];
    while (true)
    {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n > 0)
        {
            out.append(buf, static_cast<std::size_t>(n));
            if (stop_at_newline && out.find('\n') != std::string::npos)
                return true;
            continue;
        }
        if (n == 0)
            return true;  // EOF
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
        {
            LOG_WARN("recv() timed out; dropping client");
            return false;
        }
        LOG_ERROR("recv() failed: %s", std::strerror(errno));
        return false;
    }
}

static void set_recv_timeout(int fd, int timeout_ms)
{
    if (timeout_ms <= 0)
        return;
    timeval tv{};
    tv.tv_sec  = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == -1)
        LOG_WARN("setsockopt(SO_RCVTIMEO) failed: %s", std::strerror(errno));
}

void set_cloexec(int fd)
{
    int fd_flags = fcntl(fd, F_GETFD, 0);
    if (fd_flags != -1)
        fcntl(fd, F_SETFD, fd_flags | FD_CLOEXEC);
}

bool make_unix_addr(const std::string &path, sockaddr_un &addr, socklen_t &addr_len)
{
    std::memset(&addr, 0, sizeof(addr));
    if (path.empty())
    {
        errno = EINVAL;
        LOG_ERROR("Invalid socket path");
        return false;
    }
    if (path.size() >= sizeof(addr.sun_path))
    {
        errno = ENAMETOOLONG;
        LOG_ERROR("Path name too long for AF_UNIX: %s", path.c_str());
        return false;
    }
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    addr_len = static_cast<socklen_t>(offsetof(struct sockaddr_un, sun_path) +
                                      std::strlen(addr.sun_path) + 1);
    return true;
}

int make_unix_socket()
{
    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd == -1)
    {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        return -1;
    }
    set_cloexec(fd);
    return fd;
}

bool start_server(const std::string &sock_path, const LineHandler &on_line, int recv_timeout_ms)
{
    sockaddr_un addr{};
    socklen_t   addr_len = 0;
    if (!make_unix_addr(sock_path, addr, addr_len))
        return false;

    // mkdir -p
    if (!ensure_parent_dir(sock_path))
        return false;

    (void)::unlink(sock_path.c_str());  // stale socket

    int fd = make_unix_socket();
    if (fd == -1)
        return false;

    if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), addr_len) == -1)
    {
        int saved = errno;
        ::close(fd);
        errno = saved;
        LOG_ERROR("bind() failed: %s", std::strerror(errno));
        return false;
    }
    if (::listen(fd, 4) == -1)
    {
        int saved = errno;
        ::close(fd);
        ::unlink(sock_path.c_str());
        errno = saved;
        LOG_ERROR("listen() failed: %s", std::strerror(errno));
        return false;
    }

    LOG_DEBUG("Listening on %s", sock_path.c_str());

    while (true)
    {
        int newfd = ::accept(fd, nullptr, nullptr);
        if (newfd == -1)
        {
            if (errno == EINTR)
                continue;
            int saved = errno;
            ::close(fd);
            ::unlink(sock_path.c_str());
            errno = saved;
            LOG_ERROR("accept() failed: %s", std::strerror(errno));
            return false;
        }
        set_cloexec(newfd);
        set_recv_timeout(newfd, recv_timeout_ms);

        std::string line;
        if (!read_text(newfd, line, true))
        {
            ::close(newfd);
            continue;  // keep serving
        }

        // first line only, without '\r'
        auto        pos   = line.find('\n');
        std::string first = (pos == std::string::npos) ? line : line.substr(0, pos);
        if (!first.empty() && first.back() == '\r')
            first.pop_back();

        if (on_line)
        {
            std::string reply = on_line(first);
            if (!reply.empty())
            {
                if (reply.back() != '\n')
                    reply.push_back('\n');
                (void)write_all(newfd, reply.data(), reply.size());  // client may be gone
            }
        }
        ::close(newfd);

        if (first == "QUIT")
            break;
    }

    ::close(fd);
    ::unlink(sock_path.c_str());
    return true;
}

bool send_line(const std::string &sock_path, const std::string &line, std::string *reply)
{
    if (line.empty())
    {
        errno = EINVAL;
        LOG_ERROR("Invalid line");
        return false;
    }
    sockaddr_un addr{};
    socklen_t   addr_len = 0;
    if (!make_unix_addr(sock_path, addr, addr_len))
        return false;

    int fd = make_unix_socket();
    if (fd == -1)
        return false;

    if (::connect(fd, reinterpret_cast<sockaddr *>(&addr), addr_len) == -1)
    {
        int saved = errno;
        ::close(fd);
        errno = saved;
        LOG_ERROR("connect() failed: %s", std::strerror(errno));
        return false;
    }

    LOG_DEBUG("Sending line: %s", line.c_str());
    if (!write_all(fd, line.data(), line.size()))
    {
        ::close(fd);
        return false;
    }

    bool ok = true;
    if (reply)
    {
        ::shutdown(fd, SHUT_WR);
        reply->clear();
        ok = read_text(fd, *reply, false);
    }
    ::close(fd);
    return ok;
}

std::string expand_user(const std::string &p)
{
    // leading '~' or '~/' -> $HOME
    if (!p.empty() && p[0] == '~' && (p.size() == 1 || p[1] == '/'))
    {
        const char *home = std::getenv("HOME");
        if (home && *home)
            return (p.size() == 1) ? std::string(home) : std::string(home) + p.substr(1);
    }
    return p;
}

}  // namespace ipc
