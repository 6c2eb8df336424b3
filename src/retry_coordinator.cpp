#include "retry_coordinator.hpp"

#include <algorithm>

RetryCoordinator::RetryCoordinator(asio::io_context& io,
                                   Config config,
                                   std::shared_ptr<Logger> logger)
  : config_(config),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("retry")),
    timer_(io) {
  if(config_.max_retries < 0) config_.max_retries = 0;
}

RetryCoordinator::~RetryCoordinator() {
  std::error_code ec;
  timer_.cancel(ec);
}

bool RetryCoordinator::schedule_reconnect(const Peer& peer) {
  cancel();

  if(attempt_ >= config_.max_retries) {
    logger_->warn("Max reconnect attempts ({}) reached for {}, giving up", config_.max_retries, peer.identity);
    attempt_ = 0;
    if(give_up_) give_up_(peer);
    return false;
  }

  ++attempt_;
  last_delay_ = config_.base_delay * std::min(attempt_, config_.max_retries);
  pending_peer_ = peer;
  const auto generation = ++generation_;

  logger_->info("Scheduling reconnect attempt {}/{} to {} in {}ms",
                attempt_, config_.max_retries, peer.identity, last_delay_.count());

  timer_.expires_after(last_delay_);
  timer_.async_wait([this, generation](const std::error_code& ec){
    if(ec || generation != generation_ || !pending_peer_) return;
    Peer target = *pending_peer_;
    pending_peer_.reset();
    logger_->info("Reconnect attempt {} to {}", attempt_, target.identity);
    if(reconnect_) reconnect_(target);
  });
  return true;
}

void RetryCoordinator::on_connected() {
  if(attempt_ > 0) {
    logger_->debug("Connected, resetting reconnect counter (was {})", attempt_);
  }
  attempt_ = 0;
  cancel();
}

void RetryCoordinator::cancel() {
  ++generation_;
  pending_peer_.reset();
  std::error_code ec;
  timer_.cancel(ec);
}
