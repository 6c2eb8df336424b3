#pragma once

#include <asio.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <deque>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "connection.hpp"
#include "log.hpp"
#include "transport.hpp"
#include "utils.hpp"

// Transport over a local network: UDP beacons for discovery, one TCP
// connection per session carrying newline delimited JSON.
class LanTransport : public Transport, public ConnectionHandler {
public:
  struct Config {
    std::string device_name;
    std::string service_type = "mediabeam";
    std::string listen_ip = "0.0.0.0";
    uint16_t listen_port = 0;
    uint16_t discovery_port = 47800;
    std::string discovery_target = "255.255.255.255";
    std::chrono::milliseconds beacon_interval{1000};
    std::chrono::milliseconds peer_timeout{5000};
    std::chrono::milliseconds invite_timeout{10000};
    std::size_t resource_chunk_size = 64 * 1024;
    std::string inbox_dir;
    std::map<std::string, std::string> discovery_info;
  };

  LanTransport(asio::io_context& io, Config config, std::shared_ptr<Logger> logger);
  ~LanTransport() override;

  LanTransport(const LanTransport&) = delete;
  LanTransport& operator=(const LanTransport&) = delete;

  // Ports actually bound; 0 until the corresponding socket is open.
  uint16_t session_port() const;
  uint16_t discovery_bound_port() const;

  // Transport
  void set_listener(TransportListener* listener) override { listener_ = listener; }
  const std::string& local_identity() const override { return identity_; }
  void start_advertising() override;
  void stop_advertising() override;
  void start_browsing() override;
  void stop_browsing() override;
  void invite(const Peer& peer, const std::string& context) override;
  void disconnect() override;
  std::vector<Peer> connected_peers() const override;
  bool send_data(const Peer& peer, const std::string& bytes, std::string& error) override;
  std::size_t outbound_backlog(const Peer& peer) const override;
  std::shared_ptr<ResourceSend> send_resource(const Peer& peer,
                                              const std::string& path,
                                              const std::string& name,
                                              ProgressHandler on_progress,
                                              CompletionHandler on_complete) override;

  // ConnectionHandler
  void on_message(const std::shared_ptr<Connection>& conn, const nlohmann::json& j) override;
  void on_closed(const std::shared_ptr<Connection>& conn, const std::error_code& ec) override;

private:
  struct KnownPeer {
    Peer peer;
    std::string host;
    uint16_t port = 0;
    std::chrono::steady_clock::time_point last_seen{};
  };

  class OutgoingResource;

  struct IncomingResource {
    std::string name;
    std::string path;
    std::ofstream file;
    int64_t size = 0;
    int64_t received = 0;
    Sha256Stream hash;
  };

  bool open_acceptor(std::string& error, bool& busy);
  void do_accept();
  void send_beacon();
  void arm_beacon_timer();
  void do_receive_beacon();
  void handle_beacon(const std::string& datagram, const asio::ip::udp::endpoint& from);
  void arm_expiry_timer();
  void expire_peers();
  void report_discovery_failure(const std::string& reason, bool busy);

  void handle_invite(const std::shared_ptr<Connection>& conn, const nlohmann::json& j);
  void handle_invite_response(const std::shared_ptr<Connection>& conn, const nlohmann::json& j);
  void establish_session(const std::shared_ptr<Connection>& conn, const Peer& peer);
  void end_session(const std::string& reason);
  void fail_pending_invite();

  void handle_session_message(const std::string& type, const nlohmann::json& j);
  void handle_resource_begin(const nlohmann::json& j);
  void handle_resource_chunk(const nlohmann::json& j);
  void handle_resource_end(const nlohmann::json& j);
  void handle_resource_cancel(const nlohmann::json& j);
  void drop_incoming(uint64_t id, const std::string& error);

  void pump_resources();
  void cancel_resource(uint64_t id);
  void finish_outgoing(const std::shared_ptr<OutgoingResource>& resource, const std::string& error);
  void fail_all_outgoing(const std::string& error);

  void notify_link(const Peer& peer, LinkState state);

  asio::io_context& io_;
  Config config_;
  std::shared_ptr<Logger> logger_;
  std::string identity_;
  TransportListener* listener_ = nullptr;
  std::shared_ptr<int> alive_;

  asio::ip::tcp::acceptor acceptor_;
  asio::ip::udp::socket beacon_socket_;
  asio::ip::udp::socket discovery_socket_;
  asio::ip::udp::endpoint beacon_sender_;
  std::array<char, 2048> beacon_buf_{};
  asio::steady_timer beacon_timer_;
  asio::steady_timer expiry_timer_;
  asio::steady_timer invite_timer_;
  bool advertising_ = false;
  bool browsing_ = false;

  // every peer ever heard from, so invites still work after a peer drops
  // out of the visible set
  std::map<std::string, KnownPeer> address_book_;
  std::set<std::string> visible_;

  std::set<std::shared_ptr<Connection>> handshaking_;
  std::shared_ptr<Connection> pending_invite_;
  std::optional<Peer> pending_peer_;
  std::shared_ptr<Connection> session_;
  std::optional<Peer> session_peer_;

  uint64_t next_resource_id_ = 1;
  std::deque<std::shared_ptr<OutgoingResource>> outgoing_;
  bool chunk_in_flight_ = false;
  std::map<uint64_t, std::unique_ptr<IncomingResource>> incoming_;
};
