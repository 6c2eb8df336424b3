#pragma once

#include <asio.hpp>

#include <chrono>
#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "event_delegate.hpp"
#include "log.hpp"
#include "media_storage.hpp"
#include "media_types.hpp"
#include "media_validator.hpp"
#include "peer_link.hpp"
#include "protocol.hpp"
#include "thumbnail_cache.hpp"

class IngestQueue;

// Moves media over the PeerLink session: resource sends with progress on the
// sending side, persistence and acknowledgement on the receiving side.
//
// One outbound transfer at a time. Starting a new send while another one is
// still running supersedes it; the older transfer's callbacks are dropped.
class TransferEngine : public SessionObserver {
public:
  struct Config {
    std::chrono::milliseconds settle_delay{1000};
    std::size_t stream_chunk_size = 64 * 1024;
    // stream sends pause while this many bytes wait in the transport
    std::size_t stream_backlog_limit = 4 * 64 * 1024;
    int64_t max_stream_size = 2000000000;
  };

  // `workers` must be joined before the engine is destroyed.
  TransferEngine(asio::io_context& io,
                 asio::thread_pool& workers,
                 PeerLink& link,
                 MediaStorage& storage,
                 ThumbnailCache& thumbnails,
                 MediaValidator validator,
                 Config config,
                 std::shared_ptr<Logger> logger);
  ~TransferEngine() override;

  TransferEngine(const TransferEngine&) = delete;
  TransferEngine& operator=(const TransferEngine&) = delete;

  void set_delegate(EventDelegate* delegate) { delegate_ = delegate; }
  void set_ingest_queue(IngestQueue* ingest) { ingest_ = ingest; }

  bool send_image(const std::string& path);
  bool send_video(const std::string& path);
  // Fallback that streams the file over the data channel in sequenced chunks.
  bool send_video_stream(const std::string& path);
  void cancel_current_transfer();

  // The thumbnail goes out ahead of the video and is deleted once sent.
  void register_custom_thumbnail(const std::string& video_path, const std::string& thumbnail_path);
  bool has_custom_thumbnail(const std::string& video_path) const;

  bool send_move_mode(bool enabled);
  bool peer_in_move_mode() const { return peer_move_mode_; }

  const std::optional<Transfer>& outbound() const { return outbound_; }
  const std::optional<Transfer>& inbound() const { return inbound_; }
  bool sending() const { return outbound_ && !outbound_->terminal() && !outbound_complete_; }

  // SessionObserver
  void on_session_disconnected(const Peer& peer) override;
  void on_session_data(const Peer& peer, const std::string& bytes) override;
  void on_session_resource_started(const Peer& peer, const std::string& name, int64_t total_bytes) override;
  void on_session_resource_finished(const Peer& peer,
                                    const std::string& name,
                                    const std::string& local_path,
                                    const std::string& error) override;

private:
  struct OutboundStream {
    uint64_t transfer_id = 0;
    std::ifstream file;
    uint32_t sequence = 0;
    int64_t sent = 0;
    int64_t size = 0;
  };

  struct InboundStream {
    uint64_t transfer_id = 0;
    int64_t expected = 0;
    uint32_t next_sequence = 0;
    std::string buffer;
  };

  bool begin_send(const std::string& path, MediaKind kind);
  uint64_t start_outbound(const std::string& path, MediaKind kind, std::optional<int64_t> total);
  void send_custom_thumbnail(const std::string& video_path);
  void handle_send_progress(uint64_t id, int64_t transferred, int64_t total);
  void handle_send_complete(uint64_t id, const std::string& error);
  void finish_outbound(uint64_t id);
  void fail_outbound(uint64_t id, const MediaError& error);
  void pump_stream(std::shared_ptr<OutboundStream> stream);

  void handle_delivery_ack(const Peer& peer, MediaKind kind);
  void handle_video_header(int64_t size);
  void handle_video_chunk(const ControlMessage& msg);
  void handle_video_complete();
  void handle_remote_video_error();
  void fail_inbound_stream(const std::string& reason);
  void persist_bytes(std::string bytes, MediaKind kind);
  void deliver_received(const std::string& path, MediaKind kind);
  void store_custom_thumbnail(const std::string& name, const std::string& local_path);
  bool send_control(const std::string& bytes);

  asio::io_context& io_;
  asio::thread_pool& workers_;
  PeerLink& link_;
  MediaStorage& storage_;
  ThumbnailCache& thumbnails_;
  MediaValidator validator_;
  Config config_;
  std::shared_ptr<Logger> logger_;
  asio::steady_timer settle_timer_;
  asio::steady_timer pace_timer_;
  std::shared_ptr<int> alive_;

  EventDelegate* delegate_ = nullptr;
  IngestQueue* ingest_ = nullptr;

  uint64_t next_transfer_id_ = 1;
  std::optional<Transfer> outbound_;
  bool outbound_complete_ = false;
  std::shared_ptr<ResourceSend> active_send_;
  std::shared_ptr<OutboundStream> outbound_stream_;
  std::map<std::string, std::string> custom_thumbnails_;

  std::optional<Transfer> inbound_;
  std::optional<InboundStream> inbound_stream_;
  bool peer_move_mode_ = false;
};
