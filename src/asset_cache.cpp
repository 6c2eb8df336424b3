#include "asset_cache.hpp"

#include <algorithm>
#include <filesystem>

const char* to_string(MemoryPressure level) {
  switch(level) {
    case MemoryPressure::Normal: return "normal";
    case MemoryPressure::Warning: return "warning";
    case MemoryPressure::Critical: return "critical";
  }
  return "unknown";
}

AssetCache::AssetCache(asio::thread_pool& workers,
                       std::shared_ptr<AssetLoader> loader,
                       Config config,
                       std::shared_ptr<Logger> logger)
  : workers_(workers),
    loader_(loader ? std::move(loader) : std::make_shared<ProbeAssetLoader>()),
    config_(config),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("asset-cache")),
    state_(std::make_shared<State>()) {
  if(config_.capacity == 0) config_.capacity = 1;
  state_->capacity = config_.capacity;
}

std::shared_ptr<const Asset> AssetCache::get(const std::string& key) {
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->entries.find(key);
    if(it != state_->entries.end()) {
      it->second.last_access = ++state_->tick;
      return it->second.asset;
    }
  }

  std::error_code ec;
  if(!std::filesystem::is_regular_file(key, ec)) return nullptr;
  auto asset = loader_->load(key);
  if(!asset) {
    logger_->warn("Could not load {}", key);
    return nullptr;
  }
  std::lock_guard<std::mutex> lock(state_->mutex);
  insert_locked(*state_, key, asset);
  return asset;
}

bool AssetCache::preload(const std::string& key) {
  uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if(state_->entries.count(key) || state_->loading.count(key)) return false;
    state_->loading.insert(key);
    generation = state_->generation;
  }

  auto state = state_;
  auto loader = loader_;
  auto logger = logger_;
  asio::post(workers_, [state, loader, logger, key, generation](){
    auto asset = loader->load(key);
    std::lock_guard<std::mutex> lock(state->mutex);
    if(generation != state->generation) {
      logger->debug("Discarding preload of {} after cache reset", key);
      return;
    }
    state->loading.erase(key);
    if(state->stale.erase(key)) {
      logger->debug("Discarding preload of {} replaced on disk", key);
      return;
    }
    if(!asset) {
      logger->debug("Preload of {} produced nothing", key);
      return;
    }
    insert_locked(*state, key, std::move(asset));
  });
  return true;
}

void AssetCache::preload_around(std::size_t index,
                                std::size_t window,
                                const std::vector<std::string>& paths) {
  if(paths.empty() || index >= paths.size()) return;
  std::size_t first = index > window ? index - window : 0;
  std::size_t last = std::min(paths.size() - 1, index + window);
  for(std::size_t i = first; i <= last; ++i) preload(paths[i]);
}

void AssetCache::clear() {
  std::lock_guard<std::mutex> lock(state_->mutex);
  state_->entries.clear();
}

void AssetCache::invalidate(const std::string& key) {
  std::lock_guard<std::mutex> lock(state_->mutex);
  state_->entries.erase(key);
  if(state_->loading.count(key)) state_->stale.insert(key);
}

void AssetCache::handle_memory_pressure(MemoryPressure level) {
  std::lock_guard<std::mutex> lock(state_->mutex);
  switch(level) {
    case MemoryPressure::Normal:
      state_->capacity = config_.capacity;
      break;
    case MemoryPressure::Warning:
      state_->capacity = std::max<std::size_t>(1, config_.capacity / 2);
      evict_locked(*state_);
      break;
    case MemoryPressure::Critical:
      state_->entries.clear();
      state_->loading.clear();
      state_->stale.clear();
      ++state_->generation;
      break;
  }
  logger_->info("Memory pressure {}: {} cached, capacity {}",
                to_string(level), state_->entries.size(), state_->capacity);
}

bool AssetCache::contains(const std::string& key) const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->entries.count(key) > 0;
}

std::size_t AssetCache::size() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->entries.size();
}

std::size_t AssetCache::capacity() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->capacity;
}

std::size_t AssetCache::in_flight() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->loading.size();
}

std::vector<CacheEntry> AssetCache::entries() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  std::vector<CacheEntry> out;
  out.reserve(state_->entries.size());
  for(const auto& kv : state_->entries) out.push_back(kv.second);
  std::sort(out.begin(), out.end(), [](const CacheEntry& a, const CacheEntry& b){
    return a.last_access > b.last_access;
  });
  return out;
}

void AssetCache::insert_locked(State& state, const std::string& key, std::shared_ptr<const Asset> asset) {
  auto& entry = state.entries[key];
  entry.key = key;
  entry.asset = std::move(asset);
  entry.last_access = ++state.tick;
  evict_locked(state);
}

void AssetCache::evict_locked(State& state) {
  while(state.entries.size() > state.capacity) {
    auto oldest = std::min_element(state.entries.begin(), state.entries.end(),
                                   [](const auto& a, const auto& b){
                                     return a.second.last_access < b.second.last_access;
                                   });
    state.entries.erase(oldest);
  }
}
