#pragma once

#include <asio.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>

#include "log.hpp"
#include "transport.hpp"

// Reconnects to the selected peer after an unexpected disconnect.
// Delay grows linearly with the attempt number: base, 2*base, 3*base.
class RetryCoordinator {
public:
  struct Config {
    int max_retries = 3;
    std::chrono::milliseconds base_delay{2000};
  };

  using ReconnectHandler = std::function<void(const Peer&)>;
  using GiveUpHandler = std::function<void(const Peer&)>;

  RetryCoordinator(asio::io_context& io, Config config, std::shared_ptr<Logger> logger);
  ~RetryCoordinator();

  void set_reconnect_handler(ReconnectHandler handler) { reconnect_ = std::move(handler); }
  void set_give_up_handler(GiveUpHandler handler) { give_up_ = std::move(handler); }

  // Returns false when the cap was reached (counter reset, nothing scheduled).
  bool schedule_reconnect(const Peer& peer);
  void on_connected();
  void cancel();

  int attempt() const { return attempt_; }
  bool pending() const { return pending_peer_.has_value(); }
  std::chrono::milliseconds last_delay() const { return last_delay_; }
  const Config& config() const { return config_; }

private:
  Config config_;
  std::shared_ptr<Logger> logger_;
  asio::steady_timer timer_;
  std::optional<Peer> pending_peer_;
  int attempt_ = 0;
  uint64_t generation_ = 0;
  std::chrono::milliseconds last_delay_{0};
  ReconnectHandler reconnect_;
  GiveUpHandler give_up_;
};
