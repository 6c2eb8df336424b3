#pragma once

#include <asio.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include "log.hpp"

class AssetCache;
class EventDelegate;
class IngestQueue;
class LanTransport;
class MediaLibrary;
class MediaStorage;
class MemoryPressureMonitor;
class PeerLink;
class RetryCoordinator;
class SettingsManager;
class ThumbnailCache;
class TransferEngine;

// Builds one of every component from the settings and runs them on a single
// io_context. Receivers advertise and store what arrives; senders browse,
// auto-invite and send.
class MediaBeamEngine {
public:
  struct Options {
    std::filesystem::path workspace_root = std::filesystem::current_path();
    bool enable_memory_monitor = true;
    std::string meminfo_path = "/proc/meminfo";
  };

  MediaBeamEngine(std::shared_ptr<SettingsManager> settings, Options options);
  ~MediaBeamEngine();

  MediaBeamEngine(const MediaBeamEngine&) = delete;
  MediaBeamEngine& operator=(const MediaBeamEngine&) = delete;

  // Must be set before start(); not owned.
  void set_delegate(EventDelegate* delegate) { delegate_ = delegate; }

  // Throws std::runtime_error on invalid settings.
  void start();
  void run();
  void start_background();
  void stop();

  // Runs `fn` on the io thread. Safe from any thread.
  void post(std::function<void()> fn);

  // Picks image or video from the extension; io thread only.
  bool send_media(const std::string& path);

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  bool started() const { return started_; }
  bool is_sender() const { return sender_; }
  const std::filesystem::path& media_dir() const { return media_dir_; }

  asio::io_context& io() { return io_; }
  LanTransport& transport() { return *transport_; }
  PeerLink& link() { return *link_; }
  RetryCoordinator& retry() { return *retry_; }
  TransferEngine& transfer() { return *transfer_; }
  IngestQueue& ingest() { return *ingest_; }
  MediaLibrary& library() { return *library_; }
  MediaStorage& storage() { return *storage_; }
  AssetCache& assets() { return *assets_; }
  ThumbnailCache& thumbnails() { return *thumbnails_; }

  LogListenerHandle add_log_listener(Logger::Listener listener, void* user_data = nullptr);
  void remove_log_listener(LogListenerHandle handle);
  void clear_log_listeners();

private:
  void build_components();
  void load_library();

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  std::thread io_thread_;
  std::unique_ptr<asio::thread_pool> workers_;
  EventDelegate* delegate_ = nullptr;

  std::unique_ptr<MediaStorage> storage_;
  std::unique_ptr<MediaLibrary> library_;
  std::unique_ptr<ThumbnailCache> thumbnails_;
  std::unique_ptr<AssetCache> assets_;
  std::unique_ptr<LanTransport> transport_;
  std::unique_ptr<RetryCoordinator> retry_;
  std::unique_ptr<PeerLink> link_;
  std::unique_ptr<IngestQueue> ingest_;
  std::unique_ptr<TransferEngine> transfer_;
  std::unique_ptr<MemoryPressureMonitor> memory_;

  std::filesystem::path media_dir_;
  std::size_t preload_window_ = 5;
  bool stream_videos_ = false;
  bool sender_ = false;
  bool started_ = false;
};
