#pragma once

#include <cstdint>
#include <optional>
#include <string>

enum class MediaKind { Image, Video };

inline const char* to_string(MediaKind kind) {
  return kind == MediaKind::Video ? "video" : "image";
}

// Classifies by extension; nullopt for anything we do not handle.
std::optional<MediaKind> media_kind_for_path(const std::string& path);
bool is_video_path(const std::string& path);

enum class TransferDirection { Outbound, Inbound };

enum class TransferState { Pending, InProgress, Confirmed, Failed, Cancelled };

inline const char* to_string(TransferState state) {
  switch(state) {
    case TransferState::Pending: return "pending";
    case TransferState::InProgress: return "in_progress";
    case TransferState::Confirmed: return "confirmed";
    case TransferState::Failed: return "failed";
    case TransferState::Cancelled: return "cancelled";
  }
  return "unknown";
}

struct Transfer {
  uint64_t id = 0;
  TransferDirection direction = TransferDirection::Outbound;
  MediaKind kind = MediaKind::Image;
  std::string path;
  std::optional<int64_t> total_bytes;
  int64_t transferred_bytes = 0;
  TransferState state = TransferState::Pending;

  bool terminal() const {
    return state == TransferState::Confirmed ||
           state == TransferState::Failed ||
           state == TransferState::Cancelled;
  }

  // Applies a progress tick. Returns false when the tick must be discarded
  // (terminal transfer or a value that would move progress backwards).
  bool advance(int64_t transferred);

  double percent() const;
};

struct QueuedItem {
  std::string path;
  MediaKind kind = MediaKind::Image;
};
