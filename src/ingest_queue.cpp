#include "ingest_queue.hpp"

IngestQueue::IngestQueue(asio::io_context& io,
                         MediaLibrary& library,
                         Config config,
                         std::shared_ptr<Logger> logger)
  : library_(library),
    config_(config),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("ingest")),
    drain_timer_(io) {}

IngestQueue::~IngestQueue() {
  std::error_code ec;
  drain_timer_.cancel(ec);
}

void IngestQueue::offer(const std::string& path, MediaKind kind) {
  // Items still waiting for a drain go first; a scheduled drain picks this
  // one up too.
  if(locked() || !pending_.empty() || drain_scheduled_) {
    enqueue(path, kind);
    if(!drain_scheduled_) drain();
    return;
  }
  if(library_.add(path)) {
    library_.select_last();
    logger_->info("Added {} {} to library", to_string(kind), file_name_of(path));
  } else {
    logger_->debug("{} already in library", file_name_of(path));
  }
}

void IngestQueue::enqueue(const std::string& path, MediaKind kind) {
  pending_.push_back(QueuedItem{path, kind});
  logger_->info("Queued {} {} ({} pending)", to_string(kind), file_name_of(path), pending_.size());
  if(delegate_) delegate_->on_media_queued(path, kind);
}

void IngestQueue::drain() {
  if(draining_ || locked() || pending_.empty()) return;
  draining_ = true;

  std::vector<std::string> paths;
  paths.reserve(pending_.size());
  for(const auto& item : pending_) paths.push_back(item.path);
  auto count = pending_.size();
  pending_.clear();

  auto added = library_.add_batch(paths);
  library_.select_last();
  logger_->info("Drained {} queued item(s), {} new", count, added);
  if(delegate_) delegate_->on_queue_drained(count, library_.current_index());

  draining_ = false;
}

void IngestQueue::set_move_mode(bool enabled) {
  if(move_mode_ == enabled) return;
  move_mode_ = enabled;
  logger_->info("Move mode {}", enabled ? "on" : "off");
  if(move_mode_handler_) move_mode_handler_(enabled);
  if(!enabled) drain();
}

void IngestQueue::set_modal_open(bool open) {
  if(modal_open_ == open) return;
  modal_open_ = open;
  if(open) {
    std::error_code ec;
    drain_timer_.cancel(ec);
    drain_scheduled_ = false;
    return;
  }
  schedule_drain();
}

void IngestQueue::schedule_drain() {
  drain_scheduled_ = true;
  drain_timer_.expires_after(config_.modal_drain_delay);
  drain_timer_.async_wait([this](const std::error_code& ec){
    if(ec) return;
    drain_scheduled_ = false;
    drain();
  });
}
