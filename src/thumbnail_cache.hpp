#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "asset_cache.hpp"
#include "log.hpp"

// Thumbnail files keyed by media path ("<path>") or by sized variant
// ("<path>_<W>x<H>"). Entries point at files under the thumbnails directory.
class ThumbnailCache {
public:
  explicit ThumbnailCache(std::size_t capacity = 200, std::shared_ptr<Logger> logger = nullptr);

  static std::string key_for(const std::string& path);
  static std::string key_for(const std::string& path, uint32_t width, uint32_t height);

  void put(const std::string& key, const std::string& thumbnail_path);
  std::optional<std::string> get(const std::string& key);
  bool remove(const std::string& key);
  void clear();
  void handle_memory_pressure(MemoryPressure level);

  std::size_t size() const;
  std::size_t capacity() const { return capacity_; }

private:
  struct Entry {
    std::string file;
    uint64_t last_access = 0;
  };

  void evict_locked();

  std::size_t capacity_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
  uint64_t tick_ = 0;
};
