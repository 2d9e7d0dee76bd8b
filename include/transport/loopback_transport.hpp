#pragma once
#include <cstddef>
#include <deque>
#include <mutex>

#include "transport/itransport.hpp"

namespace transport {

// In-process link. A written frame is delivered to the peer's on_rx (or our
// own when no peer is set), then confirmed through on_sent.
class LoopbackTransport final : public ITransport {
public:
  bool start(const Settings& s, Callbacks cb) override;
  bool send(const Frame& one_packet) override;
  void disconnect() override;
  std::size_t max_write_size() const override;
  std::string name() const override { return "loopback"; }
  bool link_ready() const override;

  // Deliver our writes to `peer` instead of echoing them back.
  void connect_peer(LoopbackTransport* peer);

  // Hold writes until confirm_next() is called.
  void set_manual_confirm(bool on);
  // Completes the oldest held write. Returns false when none is pending.
  bool confirm_next();
  std::size_t pending_writes() const;

  // Make the next send() calls fail.
  void set_fail_writes(bool on);

  std::size_t writes() const;
  std::size_t disconnects() const;

private:
  void deliver(const Frame& f);
  void receive(const Frame& f);

  mutable std::mutex mu_;
  Callbacks cb_{};
  std::size_t max_write_{0};
  bool started_{false};
  bool manual_confirm_{false};
  bool fail_writes_{false};
  LoopbackTransport* peer_{nullptr};
  std::deque<Frame> pending_;
  std::size_t writes_{0};
  std::size_t disconnects_{0};
};

} // namespace transport
