#include "transfer_engine.hpp"

#include <algorithm>
#include <filesystem>
#include <vector>

#include "ingest_queue.hpp"

namespace {

constexpr std::size_t kMaxStreamReserve = 64 * 1024 * 1024;
constexpr std::chrono::milliseconds kStreamPaceInterval{5};

bool is_thumbnail_name(const std::string& name) {
  return name.compare(0, std::char_traits<char>::length(kThumbnailPrefix), kThumbnailPrefix) == 0;
}

} // namespace

TransferEngine::TransferEngine(asio::io_context& io,
                               asio::thread_pool& workers,
                               PeerLink& link,
                               MediaStorage& storage,
                               ThumbnailCache& thumbnails,
                               MediaValidator validator,
                               Config config,
                               std::shared_ptr<Logger> logger)
  : io_(io),
    workers_(workers),
    link_(link),
    storage_(storage),
    thumbnails_(thumbnails),
    validator_(validator),
    config_(config),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("transfer")),
    settle_timer_(io),
    pace_timer_(io),
    alive_(std::make_shared<int>(0)) {
  if(config_.stream_chunk_size == 0) config_.stream_chunk_size = 64 * 1024;
  link_.set_session_observer(this);
}

TransferEngine::~TransferEngine() {
  alive_.reset();
  std::error_code ec;
  settle_timer_.cancel(ec);
  pace_timer_.cancel(ec);
  if(active_send_) active_send_->cancel();
  link_.set_session_observer(nullptr);
}

// ---- sending ---------------------------------------------------------------

bool TransferEngine::send_image(const std::string& path) {
  if(!begin_send(path, MediaKind::Image)) return false;

  std::error_code ec;
  auto size = static_cast<int64_t>(std::filesystem::file_size(path, ec));
  auto id = start_outbound(path, MediaKind::Image, ec ? std::nullopt : std::optional<int64_t>(size));
  std::weak_ptr<int> alive = alive_;
  active_send_ = link_.send_resource(
    path, file_name_of(path),
    [this, alive, id](int64_t transferred, int64_t total){
      if(alive.expired()) return;
      handle_send_progress(id, transferred, total);
    },
    [this, alive, id](const std::string& error){
      if(alive.expired()) return;
      handle_send_complete(id, error);
    });
  if(!active_send_) {
    fail_outbound(id, MediaError(MediaErrorCode::TransferFailed, path, "transport refused the send"));
    return false;
  }
  logger_->info("Sending image {}", file_name_of(path));
  return true;
}

bool TransferEngine::send_video(const std::string& path) {
  if(!begin_send(path, MediaKind::Video)) return false;

  send_custom_thumbnail(path);

  std::error_code ec;
  auto size = static_cast<int64_t>(std::filesystem::file_size(path, ec));
  auto id = start_outbound(path, MediaKind::Video, ec ? std::nullopt : std::optional<int64_t>(size));
  std::weak_ptr<int> alive = alive_;
  active_send_ = link_.send_resource(
    path, file_name_of(path),
    [this, alive, id](int64_t transferred, int64_t total){
      if(alive.expired()) return;
      handle_send_progress(id, transferred, total);
    },
    [this, alive, id](const std::string& error){
      if(alive.expired()) return;
      handle_send_complete(id, error);
    });
  if(!active_send_) {
    fail_outbound(id, MediaError(MediaErrorCode::TransferFailed, path, "transport refused the send"));
    return false;
  }
  logger_->info("Sending video {} ({})", file_name_of(path), format_byte_count(size));
  return true;
}

bool TransferEngine::send_video_stream(const std::string& path) {
  if(!begin_send(path, MediaKind::Video)) return false;

  auto stream = std::make_shared<OutboundStream>();
  stream->file.open(path, std::ios::binary);
  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);
  if(!stream->file || ec) {
    MediaError error(MediaErrorCode::FileNotFound, path);
    logger_->warn("Cannot stream {}: {}", path, ec ? ec.message() : "open failed");
    if(delegate_) delegate_->on_error(error);
    return false;
  }
  stream->size = static_cast<int64_t>(size);
  stream->transfer_id = start_outbound(path, MediaKind::Video, stream->size);

  if(!send_control(make_video_header(stream->size))) {
    fail_outbound(stream->transfer_id,
                  MediaError(MediaErrorCode::TransferFailed, path, "could not send video header"));
    return false;
  }
  logger_->info("Streaming video {} ({})", file_name_of(path), format_byte_count(stream->size));

  outbound_stream_ = stream;
  std::weak_ptr<int> alive = alive_;
  asio::post(io_, [this, alive, stream](){
    if(alive.expired()) return;
    pump_stream(stream);
  });
  return true;
}

void TransferEngine::cancel_current_transfer() {
  if(!outbound_ || outbound_->terminal() || outbound_complete_) return;

  outbound_->state = TransferState::Cancelled;
  logger_->info("Cancelled {} transfer {}", to_string(outbound_->kind), file_name_of(outbound_->path));

  if(active_send_) {
    active_send_->cancel();
    active_send_.reset();
  }
  if(outbound_stream_) {
    outbound_stream_.reset();
    std::error_code ec;
    pace_timer_.cancel(ec);
    // lets the receiver drop what it buffered so far
    send_control(kVideoError);
  }
  std::error_code ec;
  settle_timer_.cancel(ec);
}

void TransferEngine::register_custom_thumbnail(const std::string& video_path,
                                               const std::string& thumbnail_path) {
  custom_thumbnails_[video_path] = thumbnail_path;
  logger_->debug("Registered thumbnail {} for {}", file_name_of(thumbnail_path), file_name_of(video_path));
}

bool TransferEngine::has_custom_thumbnail(const std::string& video_path) const {
  return custom_thumbnails_.count(video_path) > 0;
}

bool TransferEngine::send_move_mode(bool enabled) {
  if(!link_.connected()) return false;
  return send_control(make_move_mode(enabled));
}

bool TransferEngine::begin_send(const std::string& path, MediaKind kind) {
  if(!link_.connected()) {
    logger_->warn("Cannot send {}: not connected", file_name_of(path));
    return false;
  }
  if(auto error = validator_.validate(path, kind)) {
    logger_->warn("Rejected {}: {}", file_name_of(path), error->message());
    if(delegate_) delegate_->on_error(*error);
    return false;
  }
  return true;
}

uint64_t TransferEngine::start_outbound(const std::string& path,
                                        MediaKind kind,
                                        std::optional<int64_t> total) {
  if(sending()) {
    logger_->warn("Starting {} while {} is still in flight", file_name_of(path), file_name_of(outbound_->path));
    if(active_send_) active_send_->cancel();
  }
  active_send_.reset();
  outbound_stream_.reset();
  std::error_code ec;
  settle_timer_.cancel(ec);
  pace_timer_.cancel(ec);

  Transfer transfer;
  transfer.id = next_transfer_id_++;
  transfer.direction = TransferDirection::Outbound;
  transfer.kind = kind;
  transfer.path = path;
  transfer.total_bytes = total;
  outbound_ = transfer;
  outbound_complete_ = false;
  return transfer.id;
}

void TransferEngine::send_custom_thumbnail(const std::string& video_path) {
  auto it = custom_thumbnails_.find(video_path);
  if(it == custom_thumbnails_.end()) return;
  std::string thumbnail = it->second;
  custom_thumbnails_.erase(it);

  if(!storage_.file_exists(thumbnail)) {
    logger_->warn("Registered thumbnail {} is gone, sending video without it", thumbnail);
    return;
  }
  auto name = std::string(kThumbnailPrefix) + file_name_of(video_path);
  std::weak_ptr<int> alive = alive_;
  auto send = link_.send_resource(thumbnail, name, nullptr,
    [this, alive, thumbnail, name](const std::string& error){
      if(alive.expired()) return;
      if(error.empty()) {
        logger_->debug("Sent thumbnail {}", name);
      } else {
        logger_->warn("Thumbnail {} not delivered: {}", name, error);
      }
      storage_.remove_item(thumbnail);
    });
  if(!send) {
    logger_->warn("Could not start thumbnail send for {}", file_name_of(video_path));
    storage_.remove_item(thumbnail);
  }
}

void TransferEngine::handle_send_progress(uint64_t id, int64_t transferred, int64_t total) {
  if(!outbound_ || outbound_->id != id || outbound_complete_) return;
  if(total > 0 && !outbound_->total_bytes) outbound_->total_bytes = total;
  if(!outbound_->advance(transferred)) return;
  if(delegate_) delegate_->on_transfer_progress(outbound_->kind, outbound_->percent());
}

void TransferEngine::handle_send_complete(uint64_t id, const std::string& error) {
  if(!outbound_ || outbound_->id != id) {
    logger_->debug("Completion for superseded transfer {}", id);
    return;
  }
  active_send_.reset();
  if(outbound_->terminal() || outbound_complete_) return;

  if(!error.empty()) {
    auto code = error == "cancelled" ? MediaErrorCode::TransferCancelled : MediaErrorCode::TransferFailed;
    fail_outbound(id, MediaError(code, outbound_->path, error));
    return;
  }
  finish_outbound(id);
}

void TransferEngine::finish_outbound(uint64_t id) {
  if(!outbound_ || outbound_->id != id || outbound_->terminal() || outbound_complete_) return;
  if(outbound_->total_bytes) outbound_->advance(*outbound_->total_bytes);
  if(outbound_->state == TransferState::Pending) outbound_->state = TransferState::InProgress;
  outbound_complete_ = true;

  auto kind = outbound_->kind;
  logger_->info("{} {} sent, awaiting confirmation", to_string(kind), file_name_of(outbound_->path));
  if(delegate_) delegate_->on_transfer_progress(kind, 100.0);

  settle_timer_.expires_after(config_.settle_delay);
  settle_timer_.async_wait([this, kind](const std::error_code& ec){
    if(ec) return;
    if(delegate_) delegate_->on_transfer_settled(kind);
  });
}

void TransferEngine::fail_outbound(uint64_t id, const MediaError& error) {
  if(!outbound_ || outbound_->id != id || outbound_->terminal()) return;
  outbound_->state = TransferState::Failed;
  if(active_send_) {
    active_send_->cancel();
    active_send_.reset();
  }
  outbound_stream_.reset();
  std::error_code ec;
  settle_timer_.cancel(ec);
  pace_timer_.cancel(ec);

  logger_->warn("{} transfer failed: {}", to_string(outbound_->kind), error.message());
  if(delegate_) {
    // terminal zero tick for observers that only follow progress
    delegate_->on_transfer_progress(outbound_->kind, 0.0);
    delegate_->on_transfer_failed(outbound_->kind, error);
  }
}

void TransferEngine::pump_stream(std::shared_ptr<OutboundStream> stream) {
  if(outbound_stream_ != stream) return;
  auto id = stream->transfer_id;

  if(!link_.connected()) {
    fail_outbound(id, MediaError(MediaErrorCode::TransferFailed, outbound_->path, "peer disconnected"));
    return;
  }

  std::weak_ptr<int> alive = alive_;
  if(link_.outbound_backlog() > config_.stream_backlog_limit) {
    pace_timer_.expires_after(kStreamPaceInterval);
    pace_timer_.async_wait([this, alive, stream](const std::error_code& ec){
      if(ec || alive.expired()) return;
      pump_stream(stream);
    });
    return;
  }

  std::vector<char> buffer(config_.stream_chunk_size);
  stream->file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
  auto count = static_cast<std::size_t>(stream->file.gcount());
  if(count > 0) {
    if(!send_control(make_video_chunk(stream->sequence, buffer.data(), count))) {
      fail_outbound(id, MediaError(MediaErrorCode::TransferFailed, outbound_->path, "chunk send failed"));
      return;
    }
    ++stream->sequence;
    stream->sent += static_cast<int64_t>(count);
    handle_send_progress(id, stream->sent, stream->size);
  }

  if(stream->sent >= stream->size || !stream->file) {
    if(stream->sent != stream->size) {
      fail_outbound(id, MediaError(MediaErrorCode::FileCorrupted, outbound_->path,
                                   "file changed while streaming"));
      return;
    }
    outbound_stream_.reset();
    if(!send_control(kVideoComplete)) {
      fail_outbound(id, MediaError(MediaErrorCode::TransferFailed, outbound_->path,
                                   "could not send completion"));
      return;
    }
    logger_->debug("Streamed {} chunks", stream->sequence);
    finish_outbound(id);
    return;
  }

  asio::post(io_, [this, alive, stream](){
    if(alive.expired()) return;
    pump_stream(stream);
  });
}

// ---- receiving -------------------------------------------------------------

void TransferEngine::on_session_disconnected(const Peer& peer) {
  if(peer_move_mode_) {
    peer_move_mode_ = false;
    if(delegate_) delegate_->on_move_mode_state_changed(false);
  }
  if(inbound_stream_) {
    logger_->warn("Discarding partial video from {}", peer.identity);
    inbound_stream_.reset();
    if(inbound_ && !inbound_->terminal()) inbound_->state = TransferState::Failed;
  }
  if(outbound_ && !outbound_->terminal()) {
    if(outbound_complete_) {
      logger_->info("{} never confirmed by {}", file_name_of(outbound_->path), peer.identity);
    } else {
      fail_outbound(outbound_->id,
                    MediaError(MediaErrorCode::TransferFailed, outbound_->path, "peer disconnected"));
    }
  }
}

void TransferEngine::on_session_data(const Peer& peer, const std::string& bytes) {
  if(bytes.empty()) return;
  auto msg = parse_control_message(bytes);
  if(!msg) {
    if(inbound_stream_) {
      fail_inbound_stream("unframed data inside a video stream");
      return;
    }
    logger_->info("Received {} of image data", format_byte_count(static_cast<int64_t>(bytes.size())));
    persist_bytes(bytes, MediaKind::Image);
    return;
  }

  switch(msg->type) {
    case ControlType::DeliveryAck:
      handle_delivery_ack(peer, msg->ack_kind);
      break;
    case ControlType::MoveModeOn:
    case ControlType::MoveModeOff: {
      bool enabled = msg->type == ControlType::MoveModeOn;
      logger_->info("Peer move mode {}", enabled ? "on" : "off");
      if(peer_move_mode_ != enabled) {
        peer_move_mode_ = enabled;
        if(delegate_) delegate_->on_move_mode_state_changed(enabled);
      }
      break;
    }
    case ControlType::VideoHeader:
      handle_video_header(msg->video_size);
      break;
    case ControlType::VideoChunk:
      handle_video_chunk(*msg);
      break;
    case ControlType::VideoComplete:
      handle_video_complete();
      break;
    case ControlType::VideoError:
      handle_remote_video_error();
      break;
  }
}

void TransferEngine::on_session_resource_started(const Peer& peer, const std::string& name, int64_t total_bytes) {
  if(is_thumbnail_name(name)) {
    logger_->debug("Receiving thumbnail {}", name);
    return;
  }
  auto kind = media_kind_for_path(name);
  Transfer transfer;
  transfer.id = next_transfer_id_++;
  transfer.direction = TransferDirection::Inbound;
  transfer.kind = kind ? *kind : MediaKind::Image;
  transfer.path = name;
  if(total_bytes > 0) transfer.total_bytes = total_bytes;
  transfer.state = TransferState::InProgress;
  inbound_ = transfer;
  logger_->info("Receiving {} from {}", name, peer.identity);
}

void TransferEngine::on_session_resource_finished(const Peer& peer,
                                                  const std::string& name,
                                                  const std::string& local_path,
                                                  const std::string& error) {
  bool thumbnail = is_thumbnail_name(name);
  if(!error.empty()) {
    logger_->warn("Receiving {} from {} failed: {}", name, peer.identity, error);
    if(!local_path.empty()) storage_.remove_item(local_path);
    if(thumbnail) return;
    if(inbound_ && !inbound_->terminal()) inbound_->state = TransferState::Failed;
    if(delegate_) delegate_->on_error(MediaError(MediaErrorCode::TransferCorrupted, name, error));
    return;
  }
  if(thumbnail) {
    store_custom_thumbnail(name, local_path);
    return;
  }

  auto kind = media_kind_for_path(name);
  if(!kind) {
    logger_->warn("Discarding {}: not a supported media file", name);
    storage_.remove_item(local_path);
    if(inbound_ && !inbound_->terminal()) inbound_->state = TransferState::Failed;
    if(delegate_) delegate_->on_error(MediaError(MediaErrorCode::UnsupportedFormat, name));
    return;
  }

  auto stored = storage_.move_into(local_path, name);
  if(!stored) {
    storage_.remove_item(local_path);
    if(inbound_ && !inbound_->terminal()) inbound_->state = TransferState::Failed;
    if(delegate_) delegate_->on_error(MediaError(MediaErrorCode::StorageFailed, name));
    return;
  }
  if(inbound_ && !inbound_->terminal()) {
    inbound_->path = *stored;
    inbound_->state = TransferState::Confirmed;
  }
  send_control(make_delivery_ack(*kind));
  deliver_received(*stored, *kind);
}

void TransferEngine::handle_delivery_ack(const Peer& peer, MediaKind kind) {
  if(outbound_ && !outbound_->terminal() && outbound_->kind == kind) {
    // the ack can overtake the local completion callback
    if(!outbound_complete_) finish_outbound(outbound_->id);
    outbound_->state = TransferState::Confirmed;
    active_send_.reset();
    logger_->info("{} confirmed by {}", file_name_of(outbound_->path), peer.identity);
  } else {
    logger_->debug("{} ack from {} without a matching transfer", to_string(kind), peer.identity);
  }
  if(delegate_) delegate_->on_delivery_confirmed(peer);
}

void TransferEngine::handle_video_header(int64_t size) {
  if(inbound_stream_) {
    logger_->warn("New video header before completion, dropping {} buffered bytes",
                  inbound_stream_->buffer.size());
    inbound_stream_.reset();
  }
  if(size <= 0 || size > config_.max_stream_size) {
    logger_->warn("Refusing video stream of {} bytes", size);
    send_control(kVideoError);
    if(delegate_) {
      delegate_->on_error(MediaError(size <= 0 ? MediaErrorCode::FileCorrupted : MediaErrorCode::FileTooLarge,
                                     "received_video", format_byte_count(size)));
    }
    return;
  }

  InboundStream stream;
  stream.transfer_id = next_transfer_id_++;
  stream.expected = size;
  stream.buffer.reserve(std::min<std::size_t>(static_cast<std::size_t>(size), kMaxStreamReserve));
  inbound_stream_ = std::move(stream);

  Transfer transfer;
  transfer.id = inbound_stream_->transfer_id;
  transfer.direction = TransferDirection::Inbound;
  transfer.kind = MediaKind::Video;
  transfer.total_bytes = size;
  transfer.state = TransferState::InProgress;
  inbound_ = transfer;
  logger_->info("Receiving streamed video of {}", format_byte_count(size));
}

void TransferEngine::handle_video_chunk(const ControlMessage& msg) {
  if(!inbound_stream_) {
    logger_->warn("Video chunk {} without a header, dropped", msg.sequence);
    return;
  }
  auto& stream = *inbound_stream_;
  if(msg.sequence != stream.next_sequence) {
    fail_inbound_stream(fmt::format("chunk {} arrived, expected {}", msg.sequence, stream.next_sequence));
    return;
  }
  if(static_cast<int64_t>(stream.buffer.size() + msg.payload.size()) > stream.expected) {
    fail_inbound_stream("more data than announced");
    return;
  }
  stream.buffer.append(msg.payload);
  ++stream.next_sequence;
  if(inbound_) inbound_->advance(static_cast<int64_t>(stream.buffer.size()));
}

void TransferEngine::handle_video_complete() {
  if(!inbound_stream_) {
    logger_->warn("Video completion without a stream");
    return;
  }
  if(static_cast<int64_t>(inbound_stream_->buffer.size()) != inbound_stream_->expected) {
    fail_inbound_stream(fmt::format("got {} of {} bytes",
                                    inbound_stream_->buffer.size(), inbound_stream_->expected));
    return;
  }
  std::string bytes = std::move(inbound_stream_->buffer);
  inbound_stream_.reset();
  persist_bytes(std::move(bytes), MediaKind::Video);
}

void TransferEngine::handle_remote_video_error() {
  if(inbound_stream_) {
    logger_->info("Sender aborted the video stream");
    inbound_stream_.reset();
    if(inbound_ && !inbound_->terminal()) inbound_->state = TransferState::Cancelled;
    return;
  }
  if(outbound_ && outbound_->kind == MediaKind::Video && !outbound_->terminal()) {
    fail_outbound(outbound_->id, MediaError(MediaErrorCode::TransferFailed, outbound_->path,
                                            "receiver could not store the video"));
  }
}

void TransferEngine::fail_inbound_stream(const std::string& reason) {
  logger_->warn("Video stream failed: {}", reason);
  inbound_stream_.reset();
  if(inbound_ && !inbound_->terminal()) inbound_->state = TransferState::Failed;
  send_control(kVideoError);
  if(delegate_) delegate_->on_error(MediaError(MediaErrorCode::TransferCorrupted, "received_video", reason));
}

void TransferEngine::persist_bytes(std::string bytes, MediaKind kind) {
  auto data = std::make_shared<std::string>(std::move(bytes));
  auto transfer_id = (kind == MediaKind::Video && inbound_) ? inbound_->id : 0;
  std::weak_ptr<int> alive = alive_;
  MediaStorage& storage = storage_;
  asio::io_context& io = io_;
  asio::post(workers_, [this, alive, data, kind, transfer_id, &storage, &io](){
    auto path = storage.save_bytes(*data, kind);
    asio::post(io, [this, alive, path, kind, transfer_id](){
      if(alive.expired()) return;
      bool tracked = transfer_id != 0 && inbound_ && inbound_->id == transfer_id;
      if(!path) {
        if(kind == MediaKind::Video) send_control(kVideoError);
        if(tracked) inbound_->state = TransferState::Failed;
        if(delegate_) {
          delegate_->on_error(MediaError(MediaErrorCode::StorageFailed,
                                         kind == MediaKind::Video ? "received_video" : "received_image"));
        }
        return;
      }
      if(tracked) {
        inbound_->path = *path;
        inbound_->state = TransferState::Confirmed;
      }
      send_control(make_delivery_ack(kind));
      deliver_received(*path, kind);
    });
  });
}

void TransferEngine::deliver_received(const std::string& path, MediaKind kind) {
  logger_->info("Received {} {}", to_string(kind), file_name_of(path));
  if(delegate_) delegate_->on_media_received(path, kind);
  if(ingest_) ingest_->offer(path, kind);
}

void TransferEngine::store_custom_thumbnail(const std::string& name, const std::string& local_path) {
  auto video_name = name.substr(std::char_traits<char>::length(kThumbnailPrefix));
  if(video_name.empty()) {
    storage_.remove_item(local_path);
    return;
  }
  auto stored = storage_.move_thumbnail(local_path, name);
  if(!stored) {
    logger_->warn("Could not keep thumbnail {}", name);
    storage_.remove_item(local_path);
    return;
  }
  auto video_path = (storage_.media_dir() / video_name).string();
  thumbnails_.put(ThumbnailCache::key_for(video_path), *stored);
  logger_->info("Cached custom thumbnail for {}", video_name);
}

bool TransferEngine::send_control(const std::string& bytes) {
  std::string error;
  if(!link_.send_data(bytes, error)) {
    logger_->warn("Control message not sent: {}", error);
    return false;
  }
  return true;
}
