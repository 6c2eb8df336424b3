#include "thumbnail_cache.hpp"

#include <algorithm>

ThumbnailCache::ThumbnailCache(std::size_t capacity, std::shared_ptr<Logger> logger)
  : capacity_(capacity == 0 ? 1 : capacity),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("thumbnails")) {}

std::string ThumbnailCache::key_for(const std::string& path) {
  return path;
}

std::string ThumbnailCache::key_for(const std::string& path, uint32_t width, uint32_t height) {
  return fmt::format("{}_{}x{}", path, width, height);
}

void ThumbnailCache::put(const std::string& key, const std::string& thumbnail_path) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& entry = entries_[key];
  entry.file = thumbnail_path;
  entry.last_access = ++tick_;
  evict_locked();
}

std::optional<std::string> ThumbnailCache::get(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(key);
  if(it == entries_.end()) return std::nullopt;
  it->second.last_access = ++tick_;
  return it->second.file;
}

bool ThumbnailCache::remove(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.erase(key) > 0;
}

void ThumbnailCache::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
}

void ThumbnailCache::handle_memory_pressure(MemoryPressure level) {
  if(level != MemoryPressure::Critical) return;
  clear();
  logger_->info("Cleared thumbnail cache under critical memory pressure");
}

std::size_t ThumbnailCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

void ThumbnailCache::evict_locked() {
  while(entries_.size() > capacity_) {
    auto oldest = std::min_element(entries_.begin(), entries_.end(),
                                   [](const auto& a, const auto& b){
                                     return a.second.last_access < b.second.last_access;
                                   });
    entries_.erase(oldest);
  }
}
