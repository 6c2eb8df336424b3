#pragma once

#include <asio.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "log.hpp"
#include "media_probe.hpp"

enum class MemoryPressure { Normal, Warning, Critical };

const char* to_string(MemoryPressure level);

struct CacheEntry {
  std::string key;
  std::shared_ptr<const Asset> asset;
  uint64_t last_access = 0;
};

// Bounded LRU of loaded assets keyed by file path. get() runs on the caller,
// preloads run on the worker pool; both sides share the map under a mutex.
class AssetCache {
public:
  struct Config {
    std::size_t capacity = 10;
  };

  AssetCache(asio::thread_pool& workers,
             std::shared_ptr<AssetLoader> loader,
             Config config,
             std::shared_ptr<Logger> logger);

  AssetCache(const AssetCache&) = delete;
  AssetCache& operator=(const AssetCache&) = delete;

  std::shared_ptr<const Asset> get(const std::string& key);
  // false when the key is already cached or being loaded
  bool preload(const std::string& key);
  void preload_around(std::size_t index, std::size_t window, const std::vector<std::string>& paths);

  void clear();
  // Drops the entry for a file whose contents changed on disk. A preload of
  // it already in flight is discarded as well.
  void invalidate(const std::string& key);
  void handle_memory_pressure(MemoryPressure level);

  bool contains(const std::string& key) const;
  std::size_t size() const;
  std::size_t capacity() const;
  std::size_t in_flight() const;
  std::vector<CacheEntry> entries() const;

private:
  struct State {
    mutable std::mutex mutex;
    std::unordered_map<std::string, CacheEntry> entries;
    std::unordered_set<std::string> loading;
    std::unordered_set<std::string> stale; // loading, but invalidated meanwhile
    std::size_t capacity = 10;
    uint64_t tick = 0;
    uint64_t generation = 0;
  };

  static void insert_locked(State& state, const std::string& key, std::shared_ptr<const Asset> asset);
  static void evict_locked(State& state);

  asio::thread_pool& workers_;
  std::shared_ptr<AssetLoader> loader_;
  Config config_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<State> state_;
};
