#pragma once

#include <asio.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "event_delegate.hpp"
#include "log.hpp"
#include "media_library.hpp"
#include "media_types.hpp"

// Buffers received media while the consumer is locked (move mode or an open
// modal) and appends it to the library in arrival order once unlocked.
class IngestQueue {
public:
  struct Config {
    std::chrono::milliseconds modal_drain_delay{300};
  };

  using MoveModeHandler = std::function<void(bool enabled)>;

  IngestQueue(asio::io_context& io,
              MediaLibrary& library,
              Config config,
              std::shared_ptr<Logger> logger);
  ~IngestQueue();

  void set_delegate(EventDelegate* delegate) { delegate_ = delegate; }
  // Called on every local move mode change, e.g. to tell the peer.
  void set_move_mode_handler(MoveModeHandler handler) { move_mode_handler_ = std::move(handler); }

  // Routes an arriving item to the library, or to the buffer when locked or
  // while earlier items still wait for their drain.
  void offer(const std::string& path, MediaKind kind);
  void enqueue(const std::string& path, MediaKind kind);
  void drain();

  void set_move_mode(bool enabled);
  void set_modal_open(bool open);

  bool move_mode() const { return move_mode_; }
  bool modal_open() const { return modal_open_; }
  bool locked() const { return move_mode_ || modal_open_; }
  bool drain_scheduled() const { return drain_scheduled_; }
  const std::vector<QueuedItem>& pending() const { return pending_; }

private:
  void schedule_drain();

  MediaLibrary& library_;
  Config config_;
  std::shared_ptr<Logger> logger_;
  asio::steady_timer drain_timer_;
  EventDelegate* delegate_ = nullptr;
  MoveModeHandler move_mode_handler_;

  std::vector<QueuedItem> pending_;
  bool move_mode_ = false;
  bool modal_open_ = false;
  bool draining_ = false;
  bool drain_scheduled_ = false;
};
