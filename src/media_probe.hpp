#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "media_types.hpp"

struct ImageInfo {
  uint32_t width = 0;
  uint32_t height = 0;
};

struct VideoInfo {
  std::optional<double> duration_seconds;
  int track_count = 0;
};

// Header-level facts about a media file. Decoding pixels or frames is left
// to the presentation layer.
struct Asset {
  std::string path;
  MediaKind kind = MediaKind::Image;
  int64_t file_size = 0;
  std::optional<ImageInfo> image;
  // Image size scaled to fit the display bounds, aspect preserved.
  uint32_t target_width = 0;
  uint32_t target_height = 0;
  std::optional<VideoInfo> video;
};

// PNG IHDR or JPEG SOFn; nullopt for anything else (HEIC included).
std::optional<ImageInfo> probe_image(const std::string& path);
// ISO base media (mp4/mov/m4v): mvhd duration and trak count.
std::optional<VideoInfo> probe_video(const std::string& path);

std::pair<uint32_t, uint32_t> aspect_fit(uint32_t width, uint32_t height,
                                         uint32_t max_width, uint32_t max_height);

class AssetLoader {
public:
  virtual ~AssetLoader() = default;
  // nullptr when the file is missing or not a media file we know.
  // Called from worker threads.
  virtual std::shared_ptr<const Asset> load(const std::string& path) = 0;
};

class ProbeAssetLoader : public AssetLoader {
public:
  ProbeAssetLoader(uint32_t max_width = 1920, uint32_t max_height = 1080)
    : max_width_(max_width), max_height_(max_height) {}

  std::shared_ptr<const Asset> load(const std::string& path) override;

private:
  uint32_t max_width_;
  uint32_t max_height_;
};
