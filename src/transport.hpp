#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

enum class PeerRole { Advertiser, Browser };

struct Peer {
  std::string identity;
  PeerRole role = PeerRole::Advertiser;
  std::map<std::string, std::string> discovery_info;

  bool operator==(const Peer& other) const { return identity == other.identity; }
  bool operator!=(const Peer& other) const { return !(*this == other); }
};

// State of the transport-level session towards one peer.
enum class LinkState { NotConnected, Connecting, Connected };

// Handle for an outbound resource send. Cancelling is idempotent.
class ResourceSend {
public:
  virtual ~ResourceSend() = default;
  virtual void cancel() = 0;
  virtual bool cancelled() const = 0;
};

// Events the platform transport delivers. All of them arrive on the
// coordinating io_context thread.
class TransportListener {
public:
  virtual ~TransportListener() = default;

  virtual void on_peer_found(const Peer& peer) = 0;
  virtual void on_peer_lost(const Peer& peer) = 0;
  virtual void on_discovery_failed(const std::string& reason, bool channel_busy) = 0;

  // Receiver side. respond(true) accepts and joins the session.
  virtual void on_invitation(const Peer& peer,
                             const std::string& context,
                             std::function<void(bool)> respond) = 0;

  virtual void on_link_state(const Peer& peer, LinkState state) = 0;
  virtual void on_data(const Peer& peer, const std::string& bytes) = 0;

  virtual void on_resource_started(const Peer& peer,
                                   const std::string& name,
                                   int64_t total_bytes) = 0;
  // local_path is empty when error is set
  virtual void on_resource_finished(const Peer& peer,
                                    const std::string& name,
                                    const std::string& local_path,
                                    const std::string& error) = 0;
};

// Advertise/browse, invite/accept, reliable byte messages and resource
// transfer with progress. Encryption belongs to the concrete transport.
class Transport {
public:
  using ProgressHandler = std::function<void(int64_t transferred, int64_t total)>;
  using CompletionHandler = std::function<void(const std::string& error)>;

  virtual ~Transport() = default;

  virtual void set_listener(TransportListener* listener) = 0;
  virtual const std::string& local_identity() const = 0;

  virtual void start_advertising() = 0;
  virtual void stop_advertising() = 0;
  virtual void start_browsing() = 0;
  virtual void stop_browsing() = 0;

  virtual void invite(const Peer& peer, const std::string& context) = 0;
  virtual void disconnect() = 0;
  virtual std::vector<Peer> connected_peers() const = 0;

  virtual bool send_data(const Peer& peer, const std::string& bytes, std::string& error) = 0;
  // Bytes accepted by send_data but not yet written; used to pace streams.
  virtual std::size_t outbound_backlog(const Peer&) const { return 0; }

  // nullptr when the send cannot start; completion fires exactly once otherwise
  virtual std::shared_ptr<ResourceSend> send_resource(const Peer& peer,
                                                      const std::string& path,
                                                      const std::string& name,
                                                      ProgressHandler on_progress,
                                                      CompletionHandler on_complete) = 0;
};
