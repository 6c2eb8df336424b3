#include "media_storage.hpp"

#include <algorithm>
#include <fstream>
#include <utility>

#include "media_error.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

// Only the last path component of a peer supplied name is used.
std::string safe_file_name(const std::string& name) {
  auto base = fs::path(name).filename().string();
  if(base.empty() || base == "." || base == "..") return std::string();
  return base;
}

} // namespace

MediaStorage::MediaStorage(fs::path media_dir, std::shared_ptr<Logger> logger)
  : media_dir_(std::move(media_dir)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("storage")) {}

bool MediaStorage::ensure_directories() {
  for(const auto& dir : {media_dir_, thumbnails_dir(), inbox_dir()}) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if(ec) {
      logger_->error("Cannot create {}: {}", dir.string(), ec.message());
      return false;
    }
  }
  return true;
}

bool MediaStorage::file_exists(const std::string& path) const {
  std::error_code ec;
  return fs::is_regular_file(path, ec);
}

bool MediaStorage::remove_item(const std::string& path) {
  std::error_code ec;
  bool removed = fs::remove(path, ec);
  if(ec) {
    logger_->warn("Failed to remove {}: {}", path, ec.message());
    return false;
  }
  if(removed) logger_->debug("Removed {}", file_name_of(path));
  return removed;
}

std::optional<ItemAttributes> MediaStorage::attributes_of_item(const std::string& path) const {
  std::error_code ec;
  auto size = fs::file_size(path, ec);
  if(ec) return std::nullopt;
  auto created = fs::last_write_time(path, ec);
  if(ec) return std::nullopt;
  ItemAttributes attrs;
  attrs.size = static_cast<int64_t>(size);
  attrs.created = created;
  return attrs;
}

std::optional<std::string> MediaStorage::save_bytes(const std::string& bytes, MediaKind kind) {
  if(!ensure_directories()) return std::nullopt;
  auto name = random_hex_id() + (kind == MediaKind::Video ? ".mp4" : ".jpg");
  auto target = media_dir_ / name;
  auto temp = inbox_dir() / (name + ".part");
  {
    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    if(!out) {
      logger_->error("Cannot open {} for writing", temp.string());
      return std::nullopt;
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if(!out) {
      logger_->error("Short write to {}", temp.string());
      std::error_code ec;
      fs::remove(temp, ec);
      return std::nullopt;
    }
  }
  std::error_code ec;
  fs::rename(temp, target, ec);
  if(ec) {
    logger_->error("Cannot store {}: {}", name, ec.message());
    fs::remove(temp, ec);
    return std::nullopt;
  }
  logger_->info("Saved {} ({})", name, format_byte_count(static_cast<int64_t>(bytes.size())));
  return target.string();
}

std::optional<std::string> MediaStorage::move_into(const std::string& source, const std::string& name) {
  bool replaced = false;
  auto stored = move_file(source, media_dir_, name, replaced);
  if(stored && replaced) {
    logger_->info("Replaced {}", file_name_of(*stored));
    if(replace_listener_) replace_listener_(*stored);
  }
  return stored;
}

std::optional<std::string> MediaStorage::move_thumbnail(const std::string& source, const std::string& name) {
  bool replaced = false;
  return move_file(source, thumbnails_dir(), name, replaced);
}

std::optional<std::string> MediaStorage::move_file(const std::string& source,
                                                   const fs::path& target_dir,
                                                   const std::string& name,
                                                   bool& replaced) {
  replaced = false;
  auto file_name = safe_file_name(name);
  if(file_name.empty()) {
    logger_->warn("Rejecting item with unusable name '{}'", name);
    return std::nullopt;
  }
  if(!ensure_directories()) return std::nullopt;

  auto target = target_dir / file_name;
  std::error_code ec;
  if(fs::exists(target, ec)) {
    fs::remove(target, ec);
    if(ec) {
      logger_->error("Cannot replace {}: {}", target.string(), ec.message());
      return std::nullopt;
    }
    replaced = true;
  }

  fs::rename(source, target, ec);
  if(ec) {
    // different filesystem: copy then drop the source
    std::error_code copy_ec;
    fs::copy_file(source, target, fs::copy_options::overwrite_existing, copy_ec);
    if(copy_ec) {
      logger_->error("Cannot move {} to {}: {}", source, target.string(), copy_ec.message());
      return std::nullopt;
    }
    fs::remove(source, ec);
  }
  logger_->debug("Stored {}", target.string());
  return target.string();
}

std::vector<std::string> MediaStorage::list_media() const {
  std::vector<std::pair<fs::file_time_type, std::string>> entries;
  std::error_code ec;
  for(fs::directory_iterator it(media_dir_, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code entry_ec;
    if(!it->is_regular_file(entry_ec)) continue;
    auto path = it->path().string();
    if(!media_kind_for_path(path)) continue;
    auto when = it->last_write_time(entry_ec);
    if(entry_ec) continue;
    entries.emplace_back(when, path);
  }
  std::sort(entries.begin(), entries.end());
  std::vector<std::string> out;
  out.reserve(entries.size());
  for(auto& entry : entries) out.push_back(std::move(entry.second));
  return out;
}

std::size_t MediaStorage::cleanup_old(std::size_t keep_most_recent) {
  auto items = list_media();
  if(items.size() <= keep_most_recent) return 0;
  auto excess = items.size() - keep_most_recent;
  std::size_t removed = 0;
  for(std::size_t i = 0; i < excess; ++i) {
    if(remove_item(items[i])) {
      logger_->info("Removed old item {}", file_name_of(items[i]));
      ++removed;
    }
  }
  return removed;
}
