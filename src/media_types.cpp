#include "media_types.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>

namespace {

std::string lowercase_extension(const std::string& path) {
  std::string ext = std::filesystem::path(path).extension().string();
  if(!ext.empty() && ext.front() == '.') ext.erase(ext.begin());
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return ext;
}

const std::array<const char*, 4> kImageExtensions = {"jpg", "jpeg", "png", "heic"};
const std::array<const char*, 3> kVideoExtensions = {"mp4", "mov", "m4v"};

} // namespace

std::optional<MediaKind> media_kind_for_path(const std::string& path) {
  auto ext = lowercase_extension(path);
  if(ext.empty()) return std::nullopt;
  for(const auto* candidate : kVideoExtensions) {
    if(ext == candidate) return MediaKind::Video;
  }
  for(const auto* candidate : kImageExtensions) {
    if(ext == candidate) return MediaKind::Image;
  }
  return std::nullopt;
}

bool is_video_path(const std::string& path) {
  auto kind = media_kind_for_path(path);
  return kind && *kind == MediaKind::Video;
}

bool Transfer::advance(int64_t transferred) {
  if(terminal()) return false;
  if(transferred < transferred_bytes) return false;
  if(total_bytes && transferred > *total_bytes) {
    transferred = *total_bytes;
  }
  transferred_bytes = transferred;
  if(state == TransferState::Pending) state = TransferState::InProgress;
  return true;
}

double Transfer::percent() const {
  if(!total_bytes || *total_bytes <= 0) return 0.0;
  return static_cast<double>(transferred_bytes) / static_cast<double>(*total_bytes) * 100.0;
}
