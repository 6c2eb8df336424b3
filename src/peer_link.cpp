#include "peer_link.hpp"

#include <algorithm>
#include <filesystem>

#include "retry_coordinator.hpp"

const char* to_string(SessionState state) {
  switch(state) {
    case SessionState::Idle: return "idle";
    case SessionState::Discovering: return "discovering";
    case SessionState::Connecting: return "connecting";
    case SessionState::Connected: return "connected";
    case SessionState::Disconnected: return "disconnected";
  }
  return "unknown";
}

PeerLink::PeerLink(asio::io_context& io,
                   Transport& transport,
                   Config config,
                   std::shared_ptr<Logger> logger)
  : transport_(transport),
    config_(std::move(config)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("peer-link")),
    discovery_retry_timer_(io) {
  transport_.set_listener(this);
}

PeerLink::~PeerLink() {
  teardown();
}

void PeerLink::set_retry_coordinator(RetryCoordinator* retry) {
  retry_ = retry;
  if(!retry_) return;
  retry_->set_reconnect_handler([this](const Peer& peer){
    if(torn_down_) return;
    invite(peer);
  });
  retry_->set_give_up_handler([this](const Peer& peer){
    if(selected_ && *selected_ == peer) selected_.reset();
  });
}

void PeerLink::start_discovery() {
  if(torn_down_) return;
  discovery_wanted_ = true;
  if(discovery_active_) return;
  discovery_active_ = true;

  if(config_.role == PeerRole::Advertiser) {
    logger_->info("Advertising as {}", transport_.local_identity());
    transport_.start_advertising();
  } else {
    discovered_.clear();
    logger_->info("Browsing for peers as {}", transport_.local_identity());
    transport_.start_browsing();
  }

  if(state_ == SessionState::Idle || state_ == SessionState::Disconnected) {
    set_state(SessionState::Discovering);
  }
}

void PeerLink::stop_discovery() {
  discovery_wanted_ = false;
  std::error_code ec;
  discovery_retry_timer_.cancel(ec);
  if(!discovery_active_) return;
  discovery_active_ = false;

  if(config_.role == PeerRole::Advertiser) {
    transport_.stop_advertising();
  } else {
    transport_.stop_browsing();
  }
  if(state_ == SessionState::Discovering) set_state(SessionState::Idle);
}

void PeerLink::invite(const Peer& peer) {
  if(torn_down_) return;
  if(state_ == SessionState::Connected) {
    if(is_session_peer(peer)) {
      logger_->debug("Already connected to {}, ignoring invite", peer.identity);
    } else {
      logger_->info("Connected to {}, not inviting {}", session_->peer.identity, peer.identity);
    }
    return;
  }
  if(state_ == SessionState::Connecting) {
    logger_->debug("Invitation already outstanding, ignoring invite to {}", peer.identity);
    return;
  }

  selected_ = peer;
  session_ = Session{peer, SessionState::Connecting, {}};
  set_state(SessionState::Connecting);
  logger_->info("Inviting {}", peer.identity);
  transport_.invite(peer, config_.invite_context);
}

void PeerLink::disconnect() {
  // An explicit disconnect is not something to recover from.
  selected_.reset();
  if(retry_) retry_->cancel();
  transport_.disconnect();
}

void PeerLink::teardown() {
  if(torn_down_) return;
  if(retry_) retry_->cancel();
  stop_discovery();
  selected_.reset();
  torn_down_ = true;
  transport_.disconnect();
  transport_.set_listener(nullptr);
  session_.reset();
  state_ = SessionState::Idle;
}

std::optional<Peer> PeerLink::connected_peer() const {
  if(!connected()) return std::nullopt;
  return session_->peer;
}

bool PeerLink::send_data(const std::string& bytes, std::string& error) {
  if(!connected()) {
    error = "not connected";
    return false;
  }
  return transport_.send_data(session_->peer, bytes, error);
}

std::size_t PeerLink::outbound_backlog() const {
  if(!connected()) return 0;
  return transport_.outbound_backlog(session_->peer);
}

std::shared_ptr<ResourceSend> PeerLink::send_resource(const std::string& path,
                                                      const std::string& name,
                                                      Transport::ProgressHandler on_progress,
                                                      Transport::CompletionHandler on_complete) {
  if(!connected()) return nullptr;
  return transport_.send_resource(session_->peer, path, name,
                                  std::move(on_progress), std::move(on_complete));
}

void PeerLink::on_peer_found(const Peer& peer) {
  auto it = std::find(discovered_.begin(), discovered_.end(), peer);
  if(it != discovered_.end()) {
    *it = peer;
    return;
  }
  discovered_.push_back(peer);
  logger_->info("Found peer {}", peer.identity);
  if(delegate_) delegate_->on_peer_found(peer);

  if(config_.role == PeerRole::Browser && !selected_ && matches_auto_invite(peer)) {
    logger_->info("Auto-inviting {}", peer.identity);
    invite(peer);
  }
}

void PeerLink::on_peer_lost(const Peer& peer) {
  auto it = std::find(discovered_.begin(), discovered_.end(), peer);
  if(it == discovered_.end()) return;
  discovered_.erase(it);
  logger_->info("Lost peer {}", peer.identity);
  if(delegate_) delegate_->on_peer_lost(peer);
}

void PeerLink::on_discovery_failed(const std::string& reason, bool channel_busy) {
  logger_->warn("Discovery failed: {}{}", reason, channel_busy ? " (channel busy)" : "");
  discovery_active_ = false;
  if(delegate_) {
    delegate_->on_error(MediaError(MediaErrorCode::ConnectionFailed, "discovery", reason));
  }
  schedule_discovery_retry(channel_busy);
}

void PeerLink::on_invitation(const Peer& peer,
                             const std::string& context,
                             std::function<void(bool)> respond) {
  if(state_ == SessionState::Connected) {
    logger_->info("Declining invitation from {}: already in a session", peer.identity);
    respond(false);
    return;
  }
  bool accepted = context.empty() ||
                  context.find(config_.accept_context_marker) != std::string::npos;
  if(!accepted) {
    logger_->info("Declining invitation from {} with context '{}'", peer.identity, context);
    respond(false);
    return;
  }
  logger_->info("Accepting invitation from {}", peer.identity);
  session_ = Session{peer, SessionState::Connecting, {}};
  set_state(SessionState::Connecting);
  respond(true);
}

void PeerLink::on_link_state(const Peer& peer, LinkState state) {
  switch(state) {
    case LinkState::Connecting:
      logger_->debug("Link to {} connecting", peer.identity);
      if(state_ != SessionState::Connected) set_state(SessionState::Connecting);
      break;
    case LinkState::Connected:
      handle_connected(peer);
      break;
    case LinkState::NotConnected:
      handle_disconnected(peer);
      break;
  }
}

void PeerLink::on_data(const Peer& peer, const std::string& bytes) {
  if(!is_session_peer(peer)) {
    logger_->debug("Dropping {} bytes from non-session peer {}", bytes.size(), peer.identity);
    return;
  }
  if(observer_) observer_->on_session_data(peer, bytes);
}

void PeerLink::on_resource_started(const Peer& peer, const std::string& name, int64_t total_bytes) {
  if(!is_session_peer(peer)) return;
  if(observer_) observer_->on_session_resource_started(peer, name, total_bytes);
}

void PeerLink::on_resource_finished(const Peer& peer,
                                    const std::string& name,
                                    const std::string& local_path,
                                    const std::string& error) {
  if(!is_session_peer(peer)) {
    if(!local_path.empty()) {
      std::error_code ec;
      std::filesystem::remove(local_path, ec);
    }
    return;
  }
  if(observer_) observer_->on_session_resource_finished(peer, name, local_path, error);
}

bool PeerLink::is_session_peer(const Peer& peer) const {
  return session_ && session_->peer == peer;
}

bool PeerLink::matches_auto_invite(const Peer& peer) const {
  if(config_.auto_invite_marker.empty()) return false;
  return peer.identity.find(config_.auto_invite_marker) != std::string::npos;
}

void PeerLink::set_state(SessionState next) {
  if(state_ == next) return;
  logger_->debug("Session {} -> {}", to_string(state_), to_string(next));
  state_ = next;
  if(session_) session_->state = next;
}

void PeerLink::schedule_discovery_retry(bool channel_busy) {
  auto delay = channel_busy ? config_.discovery_busy_retry : config_.discovery_retry;
  logger_->info("Retrying discovery in {}ms", delay.count());
  discovery_retry_timer_.expires_after(delay);
  discovery_retry_timer_.async_wait([this](const std::error_code& ec){
    if(ec || torn_down_) return;
    if(!discovery_wanted_ || discovery_active_ || state_ == SessionState::Connected) return;
    start_discovery();
  });
}

void PeerLink::handle_connected(const Peer& peer) {
  if(state_ == SessionState::Connected) {
    if(!is_session_peer(peer)) {
      logger_->warn("Ignoring second session from {} while connected to {}",
                    peer.identity, session_->peer.identity);
    }
    return;
  }

  session_ = Session{peer, SessionState::Connected, std::chrono::system_clock::now()};
  set_state(SessionState::Connected);
  logger_->info("Connected to {}", peer.identity);

  // Discovery stays off for the lifetime of the session.
  bool wanted = discovery_wanted_;
  stop_discovery();
  discovery_wanted_ = wanted;

  if(retry_) retry_->on_connected();
  if(observer_) observer_->on_session_connected(peer);
  if(delegate_) delegate_->on_connection_state_changed(peer, true);
}

void PeerLink::handle_disconnected(const Peer& peer) {
  if(session_ && !is_session_peer(peer)) {
    logger_->debug("Ignoring disconnect of non-session peer {}", peer.identity);
    return;
  }

  bool was_connected = state_ == SessionState::Connected;
  bool was_selected = selected_ && *selected_ == peer;

  set_state(SessionState::Disconnected);
  session_.reset();
  logger_->info("{} {}", was_connected ? "Disconnected from" : "Could not connect to", peer.identity);

  if(was_connected && observer_) observer_->on_session_disconnected(peer);
  if(delegate_) delegate_->on_connection_state_changed(peer, false);
  if(torn_down_) return;

  start_discovery();
  if(discovery_active_) set_state(SessionState::Discovering);

  if(was_selected && retry_) retry_->schedule_reconnect(peer);
}
