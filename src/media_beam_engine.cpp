#include "media_beam_engine.hpp"

#include <algorithm>
#include <stdexcept>

#include "asset_cache.hpp"
#include "event_delegate.hpp"
#include "ingest_queue.hpp"
#include "lan_transport.hpp"
#include "media_library.hpp"
#include "media_probe.hpp"
#include "media_storage.hpp"
#include "media_validator.hpp"
#include "memory_pressure_monitor.hpp"
#include "peer_link.hpp"
#include "retry_coordinator.hpp"
#include "settings_manager.hpp"
#include "thumbnail_cache.hpp"
#include "transfer_engine.hpp"

namespace {

std::chrono::milliseconds ms_setting(const SettingsManager& settings, const std::string& key) {
  return std::chrono::milliseconds(settings.get<int>(key));
}

} // namespace

MediaBeamEngine::MediaBeamEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("mediabeam")) {
  if(options_.workspace_root.empty()) {
    options_.workspace_root = std::filesystem::current_path();
  }
}

MediaBeamEngine::~MediaBeamEngine() {
  stop();
}

void MediaBeamEngine::start() {
  if(started_) return;

  settings_->validate();
  init(settings_->get<bool>("verbose"));

  build_components();
  if(!storage_->ensure_directories()) {
    throw std::runtime_error("Cannot create media directory " + media_dir_.string());
  }

  int keep = settings_->get<int>("keep_recent");
  if(keep > 0) {
    auto removed = storage_->cleanup_old(static_cast<std::size_t>(keep));
    if(removed > 0) logger_->info("Removed {} old item(s) from {}", removed, media_dir_.string());
  }
  load_library();

  if(memory_) memory_->start();
  link_->start_discovery();
  started_ = true;

  logger_->info("{} '{}' ready, media in {}",
                sender_ ? "Sender" : "Receiver",
                transport_->local_identity(),
                media_dir_.string());
}

void MediaBeamEngine::build_components() {
  const auto& s = *settings_;
  sender_ = s.get<std::string>("role") == "sender";
  stream_videos_ = s.get<std::string>("video_transport") == "stream";
  preload_window_ = static_cast<std::size_t>(s.get<int>("preload_window"));

  media_dir_ = s.get<std::string>("media_dir");
  if(media_dir_.is_relative()) media_dir_ = options_.workspace_root / media_dir_;

  auto device_name = s.get<std::string>("device_name");
  if(!device_name.empty()) logger_->set_name(device_name);

  workers_ = std::make_unique<asio::thread_pool>(static_cast<std::size_t>(s.get<int>("preload_workers")));

  storage_ = std::make_unique<MediaStorage>(media_dir_, logger_->child("storage"));
  library_ = std::make_unique<MediaLibrary>();
  thumbnails_ = std::make_unique<ThumbnailCache>(200, logger_->child("thumbnails"));

  AssetCache::Config cache_config;
  cache_config.capacity = static_cast<std::size_t>(s.get<int>("cache_capacity"));
  assets_ = std::make_unique<AssetCache>(*workers_,
                                         std::make_shared<ProbeAssetLoader>(),
                                         cache_config,
                                         logger_->child("asset-cache"));

  LanTransport::Config lan;
  lan.device_name = device_name;
  lan.service_type = s.get<std::string>("service_type");
  lan.listen_ip = s.get<std::string>("listen_ip");
  lan.listen_port = static_cast<uint16_t>(s.get<int>("listen_port"));
  lan.discovery_port = static_cast<uint16_t>(s.get<int>("discovery_port"));
  lan.discovery_target = s.get<std::string>("discovery_target");
  lan.beacon_interval = ms_setting(s, "beacon_interval_ms");
  lan.peer_timeout = ms_setting(s, "peer_timeout_ms");
  lan.invite_timeout = ms_setting(s, "invite_timeout_ms");
  lan.inbox_dir = storage_->inbox_dir().string();
  lan.discovery_info["role"] = sender_ ? "sender" : "receiver";
  transport_ = std::make_unique<LanTransport>(io_, lan, logger_->child("lan-transport"));

  RetryCoordinator::Config retry_config;
  retry_config.max_retries = s.get<int>("retry_max");
  retry_config.base_delay = ms_setting(s, "retry_base_delay_ms");
  retry_ = std::make_unique<RetryCoordinator>(io_, retry_config, logger_->child("retry"));

  PeerLink::Config link_config;
  link_config.role = sender_ ? PeerRole::Browser : PeerRole::Advertiser;
  link_config.invite_context = s.get<std::string>("invite_context");
  link_config.accept_context_marker = s.get<std::string>("accept_context_marker");
  link_config.auto_invite_marker = s.get<std::string>("auto_invite_marker");
  link_config.discovery_retry = ms_setting(s, "discovery_retry_ms");
  link_config.discovery_busy_retry = ms_setting(s, "discovery_busy_retry_ms");
  link_ = std::make_unique<PeerLink>(io_, *transport_, link_config, logger_->child("peer-link"));
  link_->set_retry_coordinator(retry_.get());
  link_->set_delegate(delegate_);

  IngestQueue::Config ingest_config;
  ingest_config.modal_drain_delay = ms_setting(s, "modal_drain_delay_ms");
  ingest_ = std::make_unique<IngestQueue>(io_, *library_, ingest_config, logger_->child("ingest"));
  ingest_->set_delegate(delegate_);

  TransferEngine::Config transfer_config;
  transfer_config.settle_delay = ms_setting(s, "progress_settle_ms");
  transfer_config.stream_chunk_size = static_cast<std::size_t>(s.get<int>("stream_chunk_size"));
  transfer_config.stream_backlog_limit = transfer_config.stream_chunk_size * 4;
  transfer_ = std::make_unique<TransferEngine>(io_,
                                               *workers_,
                                               *link_,
                                               *storage_,
                                               *thumbnails_,
                                               MediaValidator(),
                                               transfer_config,
                                               logger_->child("transfer"));
  transfer_->set_delegate(delegate_);
  transfer_->set_ingest_queue(ingest_.get());

  ingest_->set_move_mode_handler([this](bool enabled){
    if(link_->connected()) transfer_->send_move_mode(enabled);
  });

  library_->set_change_listener([this](const MediaLibrary& library){
    if(library.empty()) return;
    assets_->preload_around(library.current_index(), preload_window_ / 2, library.items());
  });
  storage_->set_replace_listener([this](const std::string& path){ assets_->invalidate(path); });

  int poll_ms = s.get<int>("memory_poll_ms");
  if(options_.enable_memory_monitor && poll_ms > 0) {
    MemoryPressureMonitor::Config memory_config;
    memory_config.poll_interval = std::chrono::milliseconds(poll_ms);
    memory_config.warning_ratio = s.get<double>("memory_warning_ratio");
    memory_config.critical_ratio = s.get<double>("memory_critical_ratio");
    memory_config.meminfo_path = options_.meminfo_path;
    memory_ = std::make_unique<MemoryPressureMonitor>(io_, memory_config, logger_->child("memory"));
    memory_->set_handler([this](MemoryPressure level){
      assets_->handle_memory_pressure(level);
      thumbnails_->handle_memory_pressure(level);
      if(level == MemoryPressure::Critical && delegate_) {
        delegate_->on_error(MediaError(MediaErrorCode::MemoryPressure, "asset cache", "caches cleared"));
      }
    });
  }
}

void MediaBeamEngine::load_library() {
  auto existing = storage_->list_media();
  if(existing.empty()) return;
  library_->add_batch(existing);
  std::size_t count = std::min(preload_window_, existing.size());
  for(std::size_t i = 0; i < count; ++i) {
    assets_->preload(existing[i]);
  }
  logger_->info("Loaded {} item(s), preloading {}", existing.size(), count);
}

bool MediaBeamEngine::send_media(const std::string& path) {
  if(!started_) return false;
  auto kind = media_kind_for_path(path);
  if(!kind) {
    logger_->warn("Not a supported media file: {}", path);
    if(delegate_) delegate_->on_error(MediaError(MediaErrorCode::UnsupportedFormat, file_name_of(path)));
    return false;
  }
  if(*kind == MediaKind::Image) return transfer_->send_image(path);
  return stream_videos_ ? transfer_->send_video_stream(path) : transfer_->send_video(path);
}

void MediaBeamEngine::post(std::function<void()> fn) {
  asio::post(io_, std::move(fn));
}

void MediaBeamEngine::run() {
  if(!started_) start();
  auto guard = asio::make_work_guard(io_);
  io_.run();
}

void MediaBeamEngine::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  io_thread_ = std::thread([this](){
    auto guard = asio::make_work_guard(io_);
    io_.run();
  });
}

void MediaBeamEngine::stop() {
  if(!started_) return;
  started_ = false;

  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }

  // io is idle from here on; components can be touched from this thread
  if(memory_) memory_->stop();
  if(transfer_) transfer_->cancel_current_transfer();
  if(link_) link_->teardown();
  if(workers_) workers_->join();
  io_.restart();
}

LogListenerHandle MediaBeamEngine::add_log_listener(Logger::Listener listener, void* user_data) {
  return logger_->add_listener(std::move(listener), user_data);
}

void MediaBeamEngine::remove_log_listener(LogListenerHandle handle) {
  if(handle != 0) logger_->remove_listener(handle);
}

void MediaBeamEngine::clear_log_listeners() {
  logger_->clear_listeners();
}
