#pragma once

#include <asio.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "event_delegate.hpp"
#include "log.hpp"
#include "transport.hpp"

class RetryCoordinator;

enum class SessionState { Idle, Discovering, Connecting, Connected, Disconnected };

const char* to_string(SessionState state);

struct Session {
  Peer peer;
  SessionState state = SessionState::Idle;
  std::chrono::system_clock::time_point established_at{};
};

// Receives traffic of the active session. PeerLink filters out anything that
// does not come from the session peer.
class SessionObserver {
public:
  virtual ~SessionObserver() = default;
  virtual void on_session_connected(const Peer&) {}
  virtual void on_session_disconnected(const Peer&) {}
  virtual void on_session_data(const Peer&, const std::string& bytes) = 0;
  virtual void on_session_resource_started(const Peer&, const std::string& name, int64_t total_bytes) = 0;
  virtual void on_session_resource_finished(const Peer&,
                                            const std::string& name,
                                            const std::string& local_path,
                                            const std::string& error) = 0;
};

// Discovery plus a single-session state machine on top of a Transport.
class PeerLink : public TransportListener {
public:
  struct Config {
    PeerRole role = PeerRole::Browser;
    std::string invite_context = "Sender-Connection";
    std::string accept_context_marker = "Sender";
    std::string auto_invite_marker = "TV";
    std::chrono::milliseconds discovery_retry{5000};
    std::chrono::milliseconds discovery_busy_retry{10000};
  };

  PeerLink(asio::io_context& io,
           Transport& transport,
           Config config,
           std::shared_ptr<Logger> logger);
  ~PeerLink() override;

  PeerLink(const PeerLink&) = delete;
  PeerLink& operator=(const PeerLink&) = delete;

  void set_delegate(EventDelegate* delegate) { delegate_ = delegate; }
  void set_session_observer(SessionObserver* observer) { observer_ = observer; }
  void set_retry_coordinator(RetryCoordinator* retry);

  void start_discovery();
  void stop_discovery();
  bool discovery_active() const { return discovery_active_; }

  void invite(const Peer& peer);
  void disconnect();
  void teardown();

  SessionState state() const { return state_; }
  bool connected() const { return state_ == SessionState::Connected && session_.has_value(); }
  std::optional<Peer> connected_peer() const;
  const std::optional<Session>& session() const { return session_; }
  const std::optional<Peer>& selected_peer() const { return selected_; }
  void clear_selection() { selected_.reset(); }
  const std::vector<Peer>& discovered_peers() const { return discovered_; }
  const Config& config() const { return config_; }

  // Session data channel; false with error set when no session is connected.
  bool send_data(const std::string& bytes, std::string& error);
  std::size_t outbound_backlog() const;
  std::shared_ptr<ResourceSend> send_resource(const std::string& path,
                                              const std::string& name,
                                              Transport::ProgressHandler on_progress,
                                              Transport::CompletionHandler on_complete);

  // TransportListener
  void on_peer_found(const Peer& peer) override;
  void on_peer_lost(const Peer& peer) override;
  void on_discovery_failed(const std::string& reason, bool channel_busy) override;
  void on_invitation(const Peer& peer,
                     const std::string& context,
                     std::function<void(bool)> respond) override;
  void on_link_state(const Peer& peer, LinkState state) override;
  void on_data(const Peer& peer, const std::string& bytes) override;
  void on_resource_started(const Peer& peer, const std::string& name, int64_t total_bytes) override;
  void on_resource_finished(const Peer& peer,
                            const std::string& name,
                            const std::string& local_path,
                            const std::string& error) override;

private:
  bool is_session_peer(const Peer& peer) const;
  bool matches_auto_invite(const Peer& peer) const;
  void set_state(SessionState next);
  void schedule_discovery_retry(bool channel_busy);
  void handle_connected(const Peer& peer);
  void handle_disconnected(const Peer& peer);

  Transport& transport_;
  Config config_;
  std::shared_ptr<Logger> logger_;
  asio::steady_timer discovery_retry_timer_;

  EventDelegate* delegate_ = nullptr;
  SessionObserver* observer_ = nullptr;
  RetryCoordinator* retry_ = nullptr;

  SessionState state_ = SessionState::Idle;
  std::optional<Session> session_;
  std::optional<Peer> selected_;
  std::vector<Peer> discovered_;
  bool discovery_active_ = false;
  bool discovery_wanted_ = false;
  bool torn_down_ = false;
};
