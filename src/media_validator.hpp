#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "media_error.hpp"
#include "media_types.hpp"

// Checks a file before it is offered to the peer.
class MediaValidator {
public:
  struct Limits {
    int64_t max_file_size = 2000000000;
    std::chrono::seconds max_video_duration{2 * 60 * 60};
  };

  MediaValidator() = default;
  explicit MediaValidator(Limits limits) : limits_(limits) {}

  // nullopt when the file may be sent as `expected`
  std::optional<MediaError> validate(const std::string& path, MediaKind expected) const;

  const Limits& limits() const { return limits_; }

private:
  Limits limits_;
};
