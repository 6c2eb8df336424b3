#include "media_validator.hpp"

#include <spdlog/fmt/fmt.h>

#include <filesystem>

#include "media_probe.hpp"

std::optional<MediaError> MediaValidator::validate(const std::string& path, MediaKind expected) const {
  auto name = file_name_of(path);
  std::error_code ec;
  if(!std::filesystem::is_regular_file(path, ec)) {
    return MediaError(MediaErrorCode::FileNotFound, name);
  }

  auto kind = media_kind_for_path(path);
  if(!kind || *kind != expected) {
    return MediaError(MediaErrorCode::UnsupportedFormat, name,
                      fmt::format("expected {}", to_string(expected)));
  }

  auto size = std::filesystem::file_size(path, ec);
  if(ec) {
    return MediaError(MediaErrorCode::PermissionDenied, name, ec.message());
  }
  if(size == 0) {
    return MediaError(MediaErrorCode::FileCorrupted, name, "empty file");
  }
  if(static_cast<int64_t>(size) > limits_.max_file_size) {
    return MediaError(MediaErrorCode::FileTooLarge, name,
                      fmt::format("{} exceeds {}",
                                  format_byte_count(static_cast<int64_t>(size)),
                                  format_byte_count(limits_.max_file_size)));
  }

  if(expected == MediaKind::Video) {
    auto info = probe_video(path);
    if(!info) {
      return MediaError(MediaErrorCode::FileCorrupted, name, "unable to analyze video file");
    }
    if(info->duration_seconds &&
       *info->duration_seconds > static_cast<double>(limits_.max_video_duration.count())) {
      return MediaError(MediaErrorCode::VideoDurationInvalid, name,
                        fmt::format("{} minutes", static_cast<int64_t>(*info->duration_seconds / 60)));
    }
  }
  return std::nullopt;
}
