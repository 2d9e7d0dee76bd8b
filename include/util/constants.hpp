#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>

#include "util/log.hpp"

namespace constants
{
// Max bytes per link write. Matches the SPP link of the companion app.
inline constexpr std::size_t DEFAULT_MAX_WRITE_SIZE = 700;
inline constexpr std::size_t MIN_MAX_WRITE_SIZE     = 32;
inline constexpr std::size_t MAX_MAX_WRITE_SIZE     = 65535;

// Message ids stay non-negative as int32 on the wire.
inline constexpr std::uint64_t MESSAGE_ID_BOUND = std::uint64_t{1} << 31;

// Message versions understood by MessageStream::create
inline constexpr int MESSAGE_VERSION_NO_COMPRESSION = 2;
inline constexpr int MESSAGE_VERSION_COMPRESSION    = 3;

// A control client must send its line within this time.
inline constexpr int CTL_RECV_TIMEOUT_MS = 2000;

// Default path under $HOME/.cache/msgstream (or /tmp when HOME is unset)
[[maybe_unused]] static std::string cache_path(const char *file_name)
{
    const char *home = std::getenv("HOME");
    std::string base = home && *home ? std::string(home) : "/tmp";
    return base + "/.cache/msgstream/" + file_name;
}

// Control socket path (Unix domain socket)
[[maybe_unused]] static std::string ctl_sock_path()
{
    if (const char *p = std::getenv("MSGSTREAM_CTL_SOCK"); p && *p)
    {
        return std::string(p);
    }
    std::string sock_path = cache_path("ctl.sock");
    LOG_SYSTEM("Listening on %s", sock_path.c_str());
    return sock_path;
}

}  // namespace constants
