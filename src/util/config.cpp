#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

#include "ctl/ipc.hpp"
#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace config
{

static std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<std::size_t> parse_size(const char *s, std::size_t lo, std::size_t hi)
{
    if (!s || !*s)
        return std::nullopt;
    char         *end = nullptr;
    unsigned long v   = std::strtoul(s, &end, 10);
    if (!end || *end != '\0' || s[0] == '-')
        return std::nullopt;
    if (v < lo || v > hi)
        return std::nullopt;
    return static_cast<std::size_t>(v);
}

DaemonConfig load_from_env()
{
    DaemonConfig cfg;

    if (const char *lv = std::getenv("MSGSTREAM_LOG_LEVEL"); lv && *lv)
        cfg.log_level = lv;

    if (const char *t = std::getenv("MSGSTREAM_TRANSPORT"); t && *t)
    {
        const std::string v = to_lower(t);
        if (v == "socket")
            cfg.transport = TransportKind::Socket;
        else if (v != "loopback")
            LOG_WARN("Ignoring unknown MSGSTREAM_TRANSPORT='%s' (expect loopback|socket)", t);
    }

    if (const char *r = std::getenv("MSGSTREAM_ROLE"); r && *r)
    {
        const std::string v = to_lower(r);
        if (v == "connect")
            cfg.role = LinkRole::Connect;
        else if (v != "listen")
            LOG_WARN("Ignoring unknown MSGSTREAM_ROLE='%s' (expect listen|connect)", r);
    }

    cfg.link_path = constants::cache_path("link.sock");
    if (const char *l = std::getenv("MSGSTREAM_LINK"); l && *l)
        cfg.link_path = ipc::expand_user(l);

    cfg.max_write_size = constants::DEFAULT_MAX_WRITE_SIZE;
    if (const char *e = std::getenv("MSGSTREAM_MAX_WRITE"))
    {
        if (auto v = parse_size(e, constants::MIN_MAX_WRITE_SIZE, constants::MAX_MAX_WRITE_SIZE))
        {
            cfg.max_write_size = *v;
            LOG_INFO("Using max_write_size=%zu (from MSGSTREAM_MAX_WRITE)", cfg.max_write_size);
        }
        else
        {
            LOG_WARN("Ignoring invalid MSGSTREAM_MAX_WRITE='%s' (expect %zu..%zu)", e,
                     constants::MIN_MAX_WRITE_SIZE, constants::MAX_MAX_WRITE_SIZE);
        }
    }

    cfg.message_version = constants::MESSAGE_VERSION_COMPRESSION;
    if (const char *e = std::getenv("MSGSTREAM_VERSION"))
    {
        auto v = parse_size(e, constants::MESSAGE_VERSION_NO_COMPRESSION,
                            constants::MESSAGE_VERSION_COMPRESSION);
        if (v)
            cfg.message_version = static_cast<int>(*v);
        else
            LOG_WARN("Ignoring invalid MSGSTREAM_VERSION='%s' (expect 2 or 3)", e);
    }

    if (const char *k = std::getenv("MSGSTREAM_KEY"); k && *k)
        cfg.key_hex = std::string(k);

    cfg.ctl_sock = ipc::expand_user(constants::ctl_sock_path());
    return cfg;
}

}  // namespace config
