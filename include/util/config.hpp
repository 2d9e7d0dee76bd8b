#pragma once
#include <cstddef>
#include <optional>
#include <string>


namespace config
{

enum class TransportKind
{
    Loopback,
    Socket
};

enum class LinkRole
{
    Listen,
    Connect
};

struct DaemonConfig
{
    std::string                log_level       = "info";
    TransportKind              transport       = TransportKind::Loopback;
    LinkRole                   role            = LinkRole::Listen;
    std::string                link_path;        // unix socket of the link
    std::size_t                max_write_size  = 0;
    int                        message_version = 0;
    std::optional<std::string> key_hex{};        // set when MSGSTREAM_KEY is present
    std::string                ctl_sock;
};

// Reads MSGSTREAM_* from the environment. Invalid values are logged and
// replaced by their defaults.
DaemonConfig load_from_env();

// Parses a decimal size in [lo, hi]; nullopt when malformed or out of range.
std::optional<std::size_t> parse_size(const char *s, std::size_t lo, std::size_t hi);

}  // namespace config
