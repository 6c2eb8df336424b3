#include "lan_transport.hpp"

#include <algorithm>
#include <filesystem>

#include "protocol.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

class LanTransport::OutgoingResource : public ResourceSend {
public:
  uint64_t id = 0;
  std::string path;
  std::string name;
  std::ifstream file;
  int64_t size = 0;
  int64_t sent = 0;
  Sha256Stream hash;
  bool begun = false;
  bool done = false;
  ProgressHandler on_progress;
  CompletionHandler on_complete;
  std::function<void()> on_cancel;

  void cancel() override {
    if(cancelled_ || done) return;
    cancelled_ = true;
    if(on_cancel) on_cancel();
  }
  bool cancelled() const override { return cancelled_; }

private:
  bool cancelled_ = false;
};

LanTransport::LanTransport(asio::io_context& io, Config config, std::shared_ptr<Logger> logger)
  : io_(io),
    config_(std::move(config)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("lan-transport")),
    alive_(std::make_shared<int>(0)),
    acceptor_(io),
    beacon_socket_(io),
    discovery_socket_(io),
    beacon_timer_(io),
    expiry_timer_(io),
    invite_timer_(io) {
  identity_ = config_.device_name.empty() ? "mediabeam-" + random_hex_id(3) : config_.device_name;
  if(config_.resource_chunk_size == 0) config_.resource_chunk_size = 64 * 1024;
  if(config_.inbox_dir.empty()) {
    config_.inbox_dir = (fs::temp_directory_path() / ("mediabeam-inbox-" + random_hex_id(4))).string();
  }
}

LanTransport::~LanTransport() {
  alive_.reset();
  listener_ = nullptr;
  std::error_code ec;
  beacon_timer_.cancel(ec);
  expiry_timer_.cancel(ec);
  invite_timer_.cancel(ec);
  acceptor_.close(ec);
  beacon_socket_.close(ec);
  discovery_socket_.close(ec);

  std::vector<std::shared_ptr<Connection>> conns(handshaking_.begin(), handshaking_.end());
  if(pending_invite_) conns.push_back(pending_invite_);
  if(session_) conns.push_back(session_);
  for(auto& conn : conns) {
    conn->detach();
    conn->close();
  }
  fail_all_outgoing("transport closed");
  for(auto& kv : incoming_) {
    kv.second->file.close();
    fs::remove(kv.second->path, ec);
  }
}

uint16_t LanTransport::session_port() const {
  if(!acceptor_.is_open()) return 0;
  std::error_code ec;
  auto ep = acceptor_.local_endpoint(ec);
  return ec ? 0 : ep.port();
}

uint16_t LanTransport::discovery_bound_port() const {
  if(!discovery_socket_.is_open()) return 0;
  std::error_code ec;
  auto ep = discovery_socket_.local_endpoint(ec);
  return ec ? 0 : ep.port();
}

// ---- discovery -------------------------------------------------------------

void LanTransport::start_advertising() {
  if(advertising_) return;
  std::string error;
  bool busy = false;
  if(!open_acceptor(error, busy)) {
    report_discovery_failure(error, busy);
    return;
  }
  if(!beacon_socket_.is_open()) {
    std::error_code ec;
    beacon_socket_.open(asio::ip::udp::v4(), ec);
    if(!ec) beacon_socket_.set_option(asio::socket_base::broadcast(true), ec);
    if(ec) {
      beacon_socket_.close(ec);
      report_discovery_failure("cannot open beacon socket", false);
      return;
    }
  }
  advertising_ = true;
  logger_->info("Advertising {} on port {}", config_.service_type, session_port());
  send_beacon();
  arm_beacon_timer();
}

void LanTransport::stop_advertising() {
  if(!advertising_) return;
  advertising_ = false;
  std::error_code ec;
  beacon_timer_.cancel(ec);
  beacon_socket_.close(ec);
  logger_->debug("Stopped advertising");
}

void LanTransport::start_browsing() {
  if(browsing_) return;
  visible_.clear();
  std::error_code ec;
  discovery_socket_.open(asio::ip::udp::v4(), ec);
  if(!ec) discovery_socket_.set_option(asio::socket_base::reuse_address(true), ec);
  if(!ec) discovery_socket_.bind(asio::ip::udp::endpoint(asio::ip::address_v4::any(), config_.discovery_port), ec);
  if(ec) {
    bool busy = ec == asio::error::address_in_use;
    std::error_code ignored;
    discovery_socket_.close(ignored);
    report_discovery_failure(fmt::format("cannot bind discovery port {}: {}", config_.discovery_port, ec.message()),
                             busy);
    return;
  }
  browsing_ = true;
  logger_->info("Browsing for {} on port {}", config_.service_type, discovery_bound_port());
  do_receive_beacon();
  arm_expiry_timer();
}

void LanTransport::stop_browsing() {
  if(!browsing_) return;
  browsing_ = false;
  std::error_code ec;
  discovery_socket_.close(ec);
  expiry_timer_.cancel(ec);
  visible_.clear();
  logger_->debug("Stopped browsing");
}

bool LanTransport::open_acceptor(std::string& error, bool& busy) {
  if(acceptor_.is_open()) return true;
  std::error_code ec;
  auto address = asio::ip::make_address(config_.listen_ip, ec);
  if(ec) {
    error = fmt::format("invalid listen address {}", config_.listen_ip);
    return false;
  }
  asio::ip::tcp::endpoint endpoint(address, config_.listen_port);
  acceptor_.open(endpoint.protocol(), ec);
  if(!ec) acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
  if(!ec) acceptor_.bind(endpoint, ec);
  if(!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  if(ec) {
    busy = ec == asio::error::address_in_use;
    error = fmt::format("cannot listen on {}:{}: {}", config_.listen_ip, config_.listen_port, ec.message());
    std::error_code ignored;
    acceptor_.close(ignored);
    return false;
  }
  do_accept();
  return true;
}

void LanTransport::do_accept() {
  std::weak_ptr<int> alive = alive_;
  acceptor_.async_accept([this, alive](std::error_code ec, asio::ip::tcp::socket sock){
    if(alive.expired()) return;
    if(ec) {
      if(ec == asio::error::operation_aborted) return;
      logger_->warn("accept failed: {}", ec.message());
      if(acceptor_.is_open()) do_accept();
      return;
    }
    auto conn = Connection::create(std::move(sock), this, logger_);
    logger_->debug("Accepted connection from {}", conn->remote_address());
    handshaking_.insert(conn);
    conn->start();
    do_accept();
  });
}

void LanTransport::send_beacon() {
  std::error_code ec;
  auto address = asio::ip::make_address(config_.discovery_target, ec);
  if(ec) {
    logger_->warn("Invalid discovery target {}", config_.discovery_target);
    return;
  }
  json info = json::object();
  for(const auto& kv : config_.discovery_info) info[kv.first] = kv.second;
  auto payload = std::make_shared<std::string>(
    make_beacon(config_.service_type, identity_, session_port(), info).dump());
  asio::ip::udp::endpoint target(address, config_.discovery_port);
  std::weak_ptr<int> alive = alive_;
  beacon_socket_.async_send_to(asio::buffer(*payload), target,
    [this, alive, payload](std::error_code ec, std::size_t){
      if(alive.expired() || !ec || ec == asio::error::operation_aborted) return;
      logger_->debug("Beacon send failed: {}", ec.message());
    });
}

void LanTransport::arm_beacon_timer() {
  std::weak_ptr<int> alive = alive_;
  beacon_timer_.expires_after(config_.beacon_interval);
  beacon_timer_.async_wait([this, alive](const std::error_code& ec){
    if(ec || alive.expired() || !advertising_) return;
    send_beacon();
    arm_beacon_timer();
  });
}

void LanTransport::do_receive_beacon() {
  std::weak_ptr<int> alive = alive_;
  discovery_socket_.async_receive_from(asio::buffer(beacon_buf_), beacon_sender_,
    [this, alive](std::error_code ec, std::size_t bytes){
      if(alive.expired()) return;
      if(ec) {
        if(ec == asio::error::operation_aborted || !browsing_) return;
        logger_->debug("Discovery receive error: {}", ec.message());
      } else {
        handle_beacon(std::string(beacon_buf_.data(), bytes), beacon_sender_);
      }
      if(browsing_) do_receive_beacon();
    });
}

void LanTransport::handle_beacon(const std::string& datagram, const asio::ip::udp::endpoint& from) {
  auto j = json::parse(datagram, nullptr, false);
  if(j.is_discarded() || !j.is_object()) return;

  auto text = [&j](const char* key){
    auto it = j.find(key);
    return (it != j.end() && it->is_string()) ? it->get<std::string>() : std::string();
  };
  if(text("type") != "beacon" || text("service") != config_.service_type) return;
  auto peer_id = text("peer_id");
  if(peer_id.empty() || peer_id == identity_) return;
  auto port_it = j.find("port");
  if(port_it == j.end() || !port_it->is_number_unsigned()) return;
  auto port = port_it->get<uint64_t>();
  if(port == 0 || port > 65535) return;

  auto& known = address_book_[peer_id];
  known.peer.identity = peer_id;
  known.peer.role = PeerRole::Advertiser;
  known.peer.discovery_info.clear();
  auto info = j.find("info");
  if(info != j.end() && info->is_object()) {
    for(auto it = info->begin(); it != info->end(); ++it) {
      if(it->is_string()) known.peer.discovery_info[it.key()] = it->get<std::string>();
    }
  }
  known.host = from.address().to_string();
  known.port = static_cast<uint16_t>(port);
  known.last_seen = std::chrono::steady_clock::now();

  if(visible_.insert(peer_id).second) {
    logger_->debug("Beacon from {} at {}:{}", peer_id, known.host, known.port);
    if(listener_) listener_->on_peer_found(known.peer);
  }
}

void LanTransport::arm_expiry_timer() {
  auto interval = std::max(config_.peer_timeout / 2, std::chrono::milliseconds(50));
  std::weak_ptr<int> alive = alive_;
  expiry_timer_.expires_after(interval);
  expiry_timer_.async_wait([this, alive](const std::error_code& ec){
    if(ec || alive.expired() || !browsing_) return;
    expire_peers();
    arm_expiry_timer();
  });
}

void LanTransport::expire_peers() {
  auto now = std::chrono::steady_clock::now();
  for(auto it = visible_.begin(); it != visible_.end();) {
    auto& known = address_book_[*it];
    if(now - known.last_seen > config_.peer_timeout) {
      Peer lost = known.peer;
      it = visible_.erase(it);
      logger_->debug("Peer {} timed out", lost.identity);
      if(listener_) listener_->on_peer_lost(lost);
    } else {
      ++it;
    }
  }
}

void LanTransport::report_discovery_failure(const std::string& reason, bool busy) {
  logger_->warn("Discovery failed: {}", reason);
  std::weak_ptr<int> alive = alive_;
  asio::post(io_, [this, alive, reason, busy](){
    if(alive.expired() || !listener_) return;
    listener_->on_discovery_failed(reason, busy);
  });
}

// ---- session ---------------------------------------------------------------

void LanTransport::invite(const Peer& peer, const std::string& context) {
  std::weak_ptr<int> alive = alive_;
  if(session_ || pending_peer_) {
    logger_->warn("Invite to {} ignored: a session is already {}", peer.identity,
                  session_ ? "active" : "being set up");
    return;
  }
  auto it = address_book_.find(peer.identity);
  if(it == address_book_.end()) {
    logger_->warn("No address known for {}", peer.identity);
    asio::post(io_, [this, alive, peer](){
      if(!alive.expired()) notify_link(peer, LinkState::NotConnected);
    });
    return;
  }

  pending_peer_ = peer;
  notify_link(peer, LinkState::Connecting);
  logger_->info("Connecting to {} at {}:{}", peer.identity, it->second.host, it->second.port);

  Connection::connect_outgoing(io_, it->second.host, it->second.port, this, logger_,
    [this, alive, peer, context](const std::error_code& ec, std::shared_ptr<Connection> conn){
      if(alive.expired() || !pending_peer_ || *pending_peer_ != peer || pending_invite_) {
        if(conn) {
          conn->detach();
          conn->close();
        }
        return;
      }
      if(ec || !conn) {
        fail_pending_invite();
        return;
      }
      pending_invite_ = conn;
      conn->set_peer_id(peer.identity);
      conn->async_send_json(make_invite(identity_, context));
    });

  invite_timer_.expires_after(config_.invite_timeout);
  invite_timer_.async_wait([this, alive, peer](const std::error_code& ec){
    if(ec || alive.expired()) return;
    if(pending_peer_ && *pending_peer_ == peer) {
      logger_->warn("Invitation to {} timed out", peer.identity);
      fail_pending_invite();
    }
  });
}

void LanTransport::disconnect() {
  if(pending_peer_) fail_pending_invite();
  if(session_) {
    auto conn = session_;
    conn->close();
  }
}

std::vector<Peer> LanTransport::connected_peers() const {
  if(!session_peer_) return {};
  return {*session_peer_};
}

bool LanTransport::send_data(const Peer& peer, const std::string& bytes, std::string& error) {
  if(!session_ || !session_peer_ || *session_peer_ != peer) {
    error = "not connected to " + peer.identity;
    return false;
  }
  session_->async_send_json(make_data_message(bytes));
  return true;
}

std::size_t LanTransport::outbound_backlog(const Peer& peer) const {
  if(!session_ || !session_peer_ || *session_peer_ != peer) return 0;
  return session_->backlog();
}

void LanTransport::on_message(const std::shared_ptr<Connection>& conn, const json& j) {
  auto type_it = j.find("type");
  if(type_it == j.end() || !type_it->is_string()) {
    logger_->warn("Message without type from {}", conn->remote_address());
    return;
  }
  auto type = type_it->get<std::string>();
  try {
    if(conn == session_) {
      handle_session_message(type, j);
    } else if(conn == pending_invite_) {
      if(type == "invite_response") handle_invite_response(conn, j);
      else logger_->warn("Unexpected {} before invite response", type);
    } else if(handshaking_.count(conn)) {
      if(type == "invite") handle_invite(conn, j);
      else logger_->warn("Unexpected {} before invite", type);
    }
  } catch(const json::exception& ex) {
    logger_->warn("Malformed {} message: {}", type, ex.what());
  }
}

void LanTransport::on_closed(const std::shared_ptr<Connection>& conn, const std::error_code& ec) {
  handshaking_.erase(conn);
  if(conn == pending_invite_) {
    pending_invite_.reset();
    fail_pending_invite();
    return;
  }
  if(conn == session_) {
    end_session(ec ? ec.message() : "closed");
  }
}

void LanTransport::handle_invite(const std::shared_ptr<Connection>& conn, const json& j) {
  auto peer_id = j.at("peer_id").get<std::string>();
  auto context = j.value("context", std::string());
  conn->set_peer_id(peer_id);

  Peer peer;
  peer.identity = peer_id;
  peer.role = PeerRole::Browser;
  auto known = address_book_.find(peer_id);
  if(known != address_book_.end()) peer.discovery_info = known->second.peer.discovery_info;

  auto reject = [this](const std::shared_ptr<Connection>& c){
    c->async_send_json(make_invite_response(identity_, false), [c](const std::error_code&){ c->close(); });
  };
  if(session_ || !listener_) {
    logger_->info("Rejecting invitation from {}: busy", peer_id);
    reject(conn);
    return;
  }

  std::weak_ptr<int> alive = alive_;
  std::weak_ptr<Connection> weak = conn;
  auto answered = std::make_shared<bool>(false);
  listener_->on_invitation(peer, context, [this, alive, weak, peer, answered, reject](bool accepted){
    if(alive.expired() || *answered) return;
    *answered = true;
    auto c = weak.lock();
    if(!c || !c->is_open()) return;
    if(!accepted || session_) {
      reject(c);
      return;
    }
    handshaking_.erase(c);
    c->async_send_json(make_invite_response(identity_, true));
    establish_session(c, peer);
  });
}

void LanTransport::handle_invite_response(const std::shared_ptr<Connection>& conn, const json& j) {
  bool accepted = j.value("accepted", false);
  if(!accepted || session_ || !pending_peer_) {
    logger_->info("Invitation declined by {}", conn->peer_id());
    fail_pending_invite();
    return;
  }
  std::error_code ec;
  invite_timer_.cancel(ec);
  Peer peer = *pending_peer_;
  auto known = address_book_.find(peer.identity);
  if(known != address_book_.end()) peer = known->second.peer;
  pending_invite_.reset();
  pending_peer_.reset();
  establish_session(conn, peer);
}

void LanTransport::establish_session(const std::shared_ptr<Connection>& conn, const Peer& peer) {
  session_ = conn;
  session_peer_ = peer;
  logger_->info("Session established with {}", peer.identity);
  notify_link(peer, LinkState::Connected);
}

void LanTransport::fail_pending_invite() {
  std::error_code ec;
  invite_timer_.cancel(ec);
  auto conn = pending_invite_;
  auto peer = pending_peer_;
  pending_invite_.reset();
  pending_peer_.reset();
  if(conn) {
    conn->detach();
    conn->close();
  }
  if(peer) notify_link(*peer, LinkState::NotConnected);
}

void LanTransport::end_session(const std::string& reason) {
  auto peer = session_peer_;
  session_.reset();
  session_peer_.reset();
  logger_->info("Session with {} ended: {}", peer ? peer->identity : std::string("?"), reason);

  fail_all_outgoing("disconnected");
  std::vector<uint64_t> ids;
  for(const auto& kv : incoming_) ids.push_back(kv.first);
  for(auto id : ids) {
    auto it = incoming_.find(id);
    if(it == incoming_.end()) continue;
    auto entry = std::move(it->second);
    incoming_.erase(it);
    entry->file.close();
    std::error_code ec;
    fs::remove(entry->path, ec);
    if(listener_ && peer) listener_->on_resource_finished(*peer, entry->name, "", "disconnected");
  }
  if(peer) notify_link(*peer, LinkState::NotConnected);
}

void LanTransport::handle_session_message(const std::string& type, const json& j) {
  if(type == "data") {
    auto bytes = base64_decode(j.at("payload").get<std::string>());
    if(!bytes) {
      logger_->warn("Dropping data message with a malformed payload");
      return;
    }
    if(listener_) listener_->on_data(*session_peer_, *bytes);
  } else if(type == "resource_begin") {
    handle_resource_begin(j);
  } else if(type == "resource_chunk") {
    handle_resource_chunk(j);
  } else if(type == "resource_end") {
    handle_resource_end(j);
  } else if(type == "resource_cancel") {
    handle_resource_cancel(j);
  } else {
    logger_->debug("Ignoring {} message", type);
  }
}

// ---- resources, receiving side ---------------------------------------------

void LanTransport::handle_resource_begin(const json& j) {
  auto id = j.at("id").get<uint64_t>();
  auto name = j.at("name").get<std::string>();
  auto size = j.at("size").get<int64_t>();
  if(size < 0 || incoming_.count(id)) {
    logger_->warn("Ignoring resource {} ({})", name, size < 0 ? "bad size" : "duplicate id");
    return;
  }

  std::error_code ec;
  fs::create_directories(config_.inbox_dir, ec);
  auto entry = std::make_unique<IncomingResource>();
  entry->name = name;
  entry->size = size;
  entry->path = (fs::path(config_.inbox_dir) / (random_hex_id(8) + ".part")).string();
  entry->file.open(entry->path, std::ios::binary | std::ios::trunc);
  if(!entry->file) {
    logger_->error("Cannot create {} for {}", entry->path, name);
    if(listener_) listener_->on_resource_finished(*session_peer_, name, "", "cannot create download file");
    return;
  }
  incoming_[id] = std::move(entry);
  if(listener_) listener_->on_resource_started(*session_peer_, name, size);
}

void LanTransport::handle_resource_chunk(const json& j) {
  auto id = j.at("id").get<uint64_t>();
  auto it = incoming_.find(id);
  if(it == incoming_.end()) return;
  auto& entry = *it->second;

  auto offset = j.at("offset").get<int64_t>();
  if(offset != entry.received) {
    drop_incoming(id, fmt::format("chunk at {} while expecting {}", offset, entry.received));
    return;
  }
  auto data = base64_decode(j.at("data").get<std::string>());
  if(!data) {
    drop_incoming(id, "malformed chunk");
    return;
  }
  if(entry.received + static_cast<int64_t>(data->size()) > entry.size) {
    drop_incoming(id, "more data than announced");
    return;
  }
  entry.file.write(data->data(), static_cast<std::streamsize>(data->size()));
  if(!entry.file) {
    drop_incoming(id, "write failed");
    return;
  }
  entry.hash.update(data->data(), data->size());
  entry.received += static_cast<int64_t>(data->size());
}

void LanTransport::handle_resource_end(const json& j) {
  auto id = j.at("id").get<uint64_t>();
  auto it = incoming_.find(id);
  if(it == incoming_.end()) return;
  auto expected_digest = j.at("sha256").get<std::string>();

  auto& entry = *it->second;
  entry.file.close();
  if(entry.received != entry.size) {
    drop_incoming(id, fmt::format("received {} of {} bytes", entry.received, entry.size));
    return;
  }
  if(entry.hash.finish_hex() != expected_digest) {
    drop_incoming(id, "checksum mismatch");
    return;
  }
  auto done = std::move(it->second);
  incoming_.erase(it);
  logger_->debug("Resource {} complete ({} bytes)", done->name, done->size);
  if(listener_) listener_->on_resource_finished(*session_peer_, done->name, done->path, "");
}

void LanTransport::handle_resource_cancel(const json& j) {
  auto id = j.at("id").get<uint64_t>();
  if(incoming_.count(id)) drop_incoming(id, "cancelled");
}

void LanTransport::drop_incoming(uint64_t id, const std::string& error) {
  auto it = incoming_.find(id);
  if(it == incoming_.end()) return;
  auto entry = std::move(it->second);
  incoming_.erase(it);
  entry->file.close();
  std::error_code ec;
  fs::remove(entry->path, ec);
  logger_->warn("Resource {} dropped: {}", entry->name, error);
  if(listener_ && session_peer_) listener_->on_resource_finished(*session_peer_, entry->name, "", error);
}

// ---- resources, sending side -----------------------------------------------

std::shared_ptr<ResourceSend> LanTransport::send_resource(const Peer& peer,
                                                          const std::string& path,
                                                          const std::string& name,
                                                          ProgressHandler on_progress,
                                                          CompletionHandler on_complete) {
  if(!session_ || !session_peer_ || *session_peer_ != peer) return nullptr;

  std::error_code ec;
  auto size = fs::file_size(path, ec);
  if(ec) {
    logger_->warn("Cannot send {}: {}", path, ec.message());
    return nullptr;
  }
  auto resource = std::make_shared<OutgoingResource>();
  resource->file.open(path, std::ios::binary);
  if(!resource->file) {
    logger_->warn("Cannot open {}", path);
    return nullptr;
  }
  resource->id = next_resource_id_++;
  resource->path = path;
  resource->name = name;
  resource->size = static_cast<int64_t>(size);
  resource->on_progress = std::move(on_progress);
  resource->on_complete = std::move(on_complete);

  std::weak_ptr<int> alive = alive_;
  auto id = resource->id;
  asio::io_context& io = io_;
  resource->on_cancel = [this, alive, id, &io](){
    asio::post(io, [this, alive, id](){
      if(!alive.expired()) cancel_resource(id);
    });
  };

  outgoing_.push_back(resource);
  pump_resources();
  return resource;
}

void LanTransport::pump_resources() {
  std::weak_ptr<int> alive = alive_;
  while(session_ && !chunk_in_flight_ && !outgoing_.empty()) {
    auto resource = outgoing_.front();
    if(resource->cancelled()) {
      if(resource->begun) session_->async_send_json(make_resource_cancel(resource->id));
      finish_outgoing(resource, "cancelled");
      continue;
    }
    if(!resource->begun) {
      resource->begun = true;
      session_->async_send_json(make_resource_begin(resource->id, resource->name, resource->size));
    }

    std::string chunk(config_.resource_chunk_size, '\0');
    resource->file.read(&chunk[0], static_cast<std::streamsize>(chunk.size()));
    auto count = static_cast<std::size_t>(resource->file.gcount());
    chunk.resize(count);

    if(count > 0) {
      resource->hash.update(chunk.data(), count);
      auto offset = resource->sent;
      chunk_in_flight_ = true;
      session_->async_send_json(make_resource_chunk(resource->id, offset, chunk),
        [this, alive, resource, count](const std::error_code& ec){
          if(alive.expired()) return;
          chunk_in_flight_ = false;
          if(ec) return;
          resource->sent += static_cast<int64_t>(count);
          if(resource->on_progress && !resource->cancelled()) {
            resource->on_progress(resource->sent, resource->size);
          }
          pump_resources();
        });
      return;
    }

    if(resource->sent != resource->size) {
      session_->async_send_json(make_resource_cancel(resource->id));
      finish_outgoing(resource, "file changed while sending");
      continue;
    }

    chunk_in_flight_ = true;
    session_->async_send_json(make_resource_end(resource->id, resource->hash.finish_hex()),
      [this, alive, resource](const std::error_code& ec){
        if(alive.expired()) return;
        chunk_in_flight_ = false;
        if(ec) return;
        finish_outgoing(resource, resource->cancelled() ? "cancelled" : "");
        pump_resources();
      });
    return;
  }
}

void LanTransport::cancel_resource(uint64_t id) {
  auto it = std::find_if(outgoing_.begin(), outgoing_.end(),
                         [id](const std::shared_ptr<OutgoingResource>& r){ return r->id == id; });
  if(it == outgoing_.end()) return;
  // the in-flight chunk's completion picks the cancellation up
  if(it == outgoing_.begin() && chunk_in_flight_) return;
  auto resource = *it;
  if(resource->begun && session_) session_->async_send_json(make_resource_cancel(resource->id));
  finish_outgoing(resource, "cancelled");
  pump_resources();
}

void LanTransport::finish_outgoing(const std::shared_ptr<OutgoingResource>& resource, const std::string& error) {
  auto it = std::find(outgoing_.begin(), outgoing_.end(), resource);
  if(it != outgoing_.end()) outgoing_.erase(it);
  if(resource->done) return;
  resource->done = true;
  resource->file.close();
  auto callback = std::move(resource->on_complete);
  resource->on_complete = nullptr;
  resource->on_progress = nullptr;
  resource->on_cancel = nullptr;
  if(callback) callback(error);
}

void LanTransport::fail_all_outgoing(const std::string& error) {
  chunk_in_flight_ = false;
  auto pending = std::move(outgoing_);
  outgoing_.clear();
  for(auto& resource : pending) finish_outgoing(resource, error);
}

void LanTransport::notify_link(const Peer& peer, LinkState state) {
  if(listener_) listener_->on_link_state(peer, state);
}
