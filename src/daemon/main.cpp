#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>

#include "crypto/key.hpp"
#include "ctl/ipc.hpp"
#include "stream/message_stream.hpp"
#include "transport/loopback_transport.hpp"
#include "transport/socket_transport.hpp"
#include "util/config.hpp"
#include "util/log.hpp"

namespace
{

// Prints what the stream reports.
class DaemonObserver : public stream::MessageStream::Callback
{
  public:
    void set_tail(bool on) { tail_.store(on); }

    void on_message_received(const packet::StreamMessage &msg) override
    {
        if (!tail_.load())
            return;
        std::string text(msg.payload.begin(), msg.payload.end());
        LOG_SYSTEM("[RECV] op=%d %zu bytes: %s", static_cast<int>(msg.operation),
                   msg.payload.size(), text.c_str());
    }

    void on_message_sent(std::uint32_t message_id) override
    {
        LOG_SYSTEM("[SENT] message %u", message_id);
    }

  private:
    std::atomic_bool tail_{false};
};

stream::MessageStream *g_stream = nullptr;
DaemonObserver        *g_observer = nullptr;

std::unique_ptr<transport::ITransport> make_transport(const config::DaemonConfig &cfg)
{
    if (cfg.transport == config::TransportKind::Loopback)
        return std::make_unique<transport::LoopbackTransport>();

    auto sock = std::make_unique<transport::SocketTransport>();
    const bool ok = (cfg.role == config::LinkRole::Connect) ? sock->connect_unix(cfg.link_path)
                                                            : sock->listen_unix(cfg.link_path);
    if (!ok)
        return nullptr;
    return sock;
}

std::string trim(const std::string &s)
{
    auto l = s.find_first_not_of(" \t\r");
    if (l == std::string::npos)
        return {};
    auto r = s.find_last_not_of(" \t\r");
    return s.substr(l, r - l + 1);
}

std::string send_text(const std::string &text, bool encrypted)
{
    if (text.empty())
    {
        LOG_WARN("CMD: SEND ignored (empty payload)");
        return "ERR empty payload";
    }

    packet::StreamMessage msg;
    msg.operation            = packet::OperationType::ClientMessage;
    msg.is_payload_encrypted = encrypted;
    msg.payload.assign(text.begin(), text.end());
    try
    {
        const std::uint32_t id = g_stream->send_message(std::move(msg));
        return "OK " + std::to_string(id);
    }
    catch (const stream::ContractViolation &e)
    {
        LOG_ERROR("CMD: send rejected: %s", e.what());
        return std::string("ERR ") + e.what();
    }
}

std::string on_line(const std::string &line)
{
    LOG_DEBUG("IPC line: %s", line.c_str());
    if (line == "QUIT")
    {
        LOG_INFO("Received QUIT command, exiting...");
        return "OK";
    }
    if (line == "TAIL on" || line == "TAIL off")
    {
        const bool on = (line == "TAIL on");
        g_observer->set_tail(on);
        LOG_INFO("TAIL %s", on ? "Enabled" : "Disabled");
        return "OK";
    }
    if (line.rfind("SEND ", 0) == 0)
        return send_text(trim(line.substr(5)), false);
    if (line.rfind("SENDX ", 0) == 0)
        return send_text(trim(line.substr(6)), true);
    if (line == "STATUS")
    {
        char buf[160];
        std::snprintf(buf, sizeof buf, "connected=%d compression=%d encryption_key=%d queued=%zu",
                      g_stream->is_connected() ? 1 : 0, g_stream->compression_enabled() ? 1 : 0,
                      g_stream->encryption_key() ? 1 : 0, g_stream->queued_packets());
        LOG_SYSTEM("[STATUS] %s", buf);
        return buf;
    }
    if (line == "DISCONNECT")
    {
        g_stream->disconnect();
        LOG_SYSTEM("[DISCONNECT] link dropped");
        return "OK";
    }
    LOG_WARN("Unknown command: %s", line.c_str());
    return "ERR unknown command";
}

}  // namespace

int main()
{
    // log level first so config parsing is filtered too
    msgstream::set_log_level_by_name(std::getenv("MSGSTREAM_LOG_LEVEL"));

    const config::DaemonConfig cfg = config::load_from_env();
    LOG_SYSTEM("Config: transport=%s role=%s link=%s max_write=%zu version=%d key=%s",
               cfg.transport == config::TransportKind::Socket ? "socket" : "loopback",
               cfg.role == config::LinkRole::Connect ? "connect" : "listen", cfg.link_path.c_str(),
               cfg.max_write_size, cfg.message_version, cfg.key_hex ? "set" : "(none)");

    auto tx = make_transport(cfg);
    if (!tx)
    {
        LOG_ERROR("Link setup failed");
        return 1;
    }

    auto ms = stream::MessageStream::create(cfg.message_version, *tx);
    if (!ms)
        return 1;

    if (cfg.key_hex)
    {
        if (auto k = crypto::SodiumKey::from_hex(*cfg.key_hex))
        {
            LOG_INFO("Using SodiumKey (key from MSGSTREAM_KEY)");
            ms->set_encryption_key(std::make_shared<crypto::SodiumKey>(*k));
        }
        else
        {
            LOG_WARN("Ignoring invalid MSGSTREAM_KEY (expect 64 hex characters); encryption "
                     "disabled");
        }
    }

    DaemonObserver observer;
    if (!ms->register_callback(&observer))
        return 1;
    g_observer = &observer;
    g_stream   = ms.get();

    transport::Settings s{};
    s.role           = (cfg.transport == config::TransportKind::Loopback)
                           ? "loopback"
                           : (cfg.role == config::LinkRole::Connect ? "connect" : "listen");
    s.max_write_size = cfg.max_write_size;
    if (!ms->start(s))
    {
        LOG_ERROR("Message stream start failed");
        return 1;
    }

    const bool ok = ipc::start_server(cfg.ctl_sock, &on_line);
    ms->unregister_callback(&observer);
    g_stream   = nullptr;
    g_observer = nullptr;
    if (!ok)
    {
        LOG_ERROR("start_server failed");
        return 1;
    }
    return 0;
}
