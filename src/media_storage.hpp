#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "log.hpp"
#include "media_types.hpp"

struct ItemAttributes {
  int64_t size = 0;
  std::filesystem::file_time_type created{};
};

// Owns the media directory received items are stored in.
class MediaStorage {
public:
  using ReplaceListener = std::function<void(const std::string& path)>;

  explicit MediaStorage(std::filesystem::path media_dir,
                        std::shared_ptr<Logger> logger = nullptr);

  // Called by move_into when an existing media file was overwritten.
  void set_replace_listener(ReplaceListener listener) { replace_listener_ = std::move(listener); }

  bool ensure_directories();
  const std::filesystem::path& media_dir() const { return media_dir_; }
  std::filesystem::path thumbnails_dir() const { return media_dir_ / ".thumbnails"; }
  std::filesystem::path inbox_dir() const { return media_dir_ / ".inbox"; }

  bool file_exists(const std::string& path) const;
  bool remove_item(const std::string& path);
  std::optional<ItemAttributes> attributes_of_item(const std::string& path) const;

  // Writes bytes under a fresh random name; safe to call from a worker.
  std::optional<std::string> save_bytes(const std::string& bytes, MediaKind kind);
  // Moves a finished download into the media directory as `name`,
  // replacing an existing file with the same name.
  std::optional<std::string> move_into(const std::string& source, const std::string& name);
  // Same as move_into but below thumbnails_dir().
  std::optional<std::string> move_thumbnail(const std::string& source, const std::string& name);

  // Media files, oldest first.
  std::vector<std::string> list_media() const;
  // Removes everything but the `keep_most_recent` newest items.
  std::size_t cleanup_old(std::size_t keep_most_recent = 100);

private:
  std::optional<std::string> move_file(const std::string& source,
                                       const std::filesystem::path& target_dir,
                                       const std::string& name,
                                       bool& replaced);

  std::filesystem::path media_dir_;
  std::shared_ptr<Logger> logger_;
  ReplaceListener replace_listener_;
};
