#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

#include "media_types.hpp"

using json = nlohmann::json;

// ---- application control messages (carried over the session data channel) --

inline constexpr const char* kImageReceived = "IMAGE_RECEIVED";
inline constexpr const char* kVideoReceived = "VIDEO_RECEIVED";
inline constexpr const char* kMoveModeEnabled = "MOVE_MODE_ENABLED";
inline constexpr const char* kMoveModeDisabled = "MOVE_MODE_DISABLED";
inline constexpr const char* kVideoComplete = "VIDEO_COMPLETE";
inline constexpr const char* kVideoError = "VIDEO_ERROR";

inline constexpr const char* kThumbnailPrefix = "thumbnail_";

enum class ControlType {
  DeliveryAck,
  MoveModeOn,
  MoveModeOff,
  VideoHeader,
  VideoComplete,
  VideoError,
  VideoChunk
};

struct ControlMessage {
  ControlType type = ControlType::DeliveryAck;
  MediaKind ack_kind = MediaKind::Image;   // DeliveryAck
  int64_t video_size = 0;                  // VideoHeader
  uint32_t sequence = 0;                   // VideoChunk
  std::string payload;                     // VideoChunk
};

std::string make_delivery_ack(MediaKind kind);
std::string make_move_mode(bool enabled);
std::string make_video_header(int64_t size);

// Stream chunks carry a sequence number so a reordered or dropped chunk is
// detected instead of silently corrupting the accumulated video.
inline constexpr const char kVideoChunkMagic[4] = {'V', 'C', 'H', 'K'};
inline constexpr std::size_t kVideoChunkHeaderSize = 8;
std::string make_video_chunk(uint32_t sequence, const char* data, std::size_t size);

// nullopt for bytes that are not a control message
std::optional<ControlMessage> parse_control_message(const std::string& bytes);

// ---- LAN transport wire messages (newline delimited JSON) ------------------

inline constexpr int kProtocolVersion = 1;

json make_beacon(const std::string& service_type,
                 const std::string& peer_id,
                 uint16_t session_port,
                 const json& discovery_info);
json make_invite(const std::string& peer_id, const std::string& context);
json make_invite_response(const std::string& peer_id, bool accepted);
json make_data_message(const std::string& bytes);
json make_resource_begin(uint64_t id, const std::string& name, int64_t size);
json make_resource_chunk(uint64_t id, int64_t offset, const std::string& bytes);
json make_resource_end(uint64_t id, const std::string& sha256);
json make_resource_cancel(uint64_t id);
