#include "media_error.hpp"

#include <spdlog/fmt/fmt.h>

#include <filesystem>

const char* to_string(MediaErrorCode code) {
  switch(code) {
    case MediaErrorCode::FileNotFound: return "file_not_found";
    case MediaErrorCode::FileCorrupted: return "file_corrupted";
    case MediaErrorCode::UnsupportedFormat: return "unsupported_format";
    case MediaErrorCode::FileTooLarge: return "file_too_large";
    case MediaErrorCode::VideoDurationInvalid: return "video_duration_invalid";
    case MediaErrorCode::StorageFailed: return "storage_failed";
    case MediaErrorCode::PermissionDenied: return "permission_denied";
    case MediaErrorCode::NotConnected: return "not_connected";
    case MediaErrorCode::ConnectionFailed: return "connection_failed";
    case MediaErrorCode::TransferFailed: return "transfer_failed";
    case MediaErrorCode::TransferCorrupted: return "transfer_corrupted";
    case MediaErrorCode::TransferCancelled: return "transfer_cancelled";
    case MediaErrorCode::MemoryPressure: return "memory_pressure";
    case MediaErrorCode::Unknown: break;
  }
  return "unknown";
}

std::string file_name_of(const std::string& path) {
  return std::filesystem::path(path).filename().string();
}

std::string format_byte_count(int64_t bytes) {
  constexpr double kMB = 1024.0 * 1024.0;
  constexpr double kGB = kMB * 1024.0;
  if(bytes >= static_cast<int64_t>(kGB)) {
    return fmt::format("{:.2f} GB", static_cast<double>(bytes) / kGB);
  }
  return fmt::format("{:.1f} MB", static_cast<double>(bytes) / kMB);
}

std::string MediaError::message() const {
  std::string text;
  switch(code) {
    case MediaErrorCode::FileNotFound:
      text = "File not found: " + file_name_of(subject);
      break;
    case MediaErrorCode::FileCorrupted:
      text = "File appears to be corrupted: " + file_name_of(subject);
      break;
    case MediaErrorCode::UnsupportedFormat:
      text = "Unsupported format: " + file_name_of(subject);
      break;
    case MediaErrorCode::FileTooLarge:
      text = "File too large: " + file_name_of(subject);
      break;
    case MediaErrorCode::VideoDurationInvalid:
      text = "Invalid video duration: " + file_name_of(subject);
      break;
    case MediaErrorCode::StorageFailed:
      text = "Could not save " + file_name_of(subject);
      break;
    case MediaErrorCode::PermissionDenied:
      text = "Permission denied for " + subject;
      break;
    case MediaErrorCode::NotConnected:
      text = "Not connected to a device";
      break;
    case MediaErrorCode::ConnectionFailed:
      text = subject.empty() ? std::string("Connection failed") : "Connection failed to " + subject;
      break;
    case MediaErrorCode::TransferFailed:
      text = "Transfer failed: " + file_name_of(subject);
      break;
    case MediaErrorCode::TransferCorrupted:
      text = "Transfer corrupted: " + file_name_of(subject);
      break;
    case MediaErrorCode::TransferCancelled:
      text = "Transfer cancelled: " + file_name_of(subject);
      break;
    case MediaErrorCode::MemoryPressure:
      text = "Low memory warning";
      break;
    case MediaErrorCode::Unknown:
      text = "Unknown error";
      break;
  }
  if(!detail.empty()) {
    text += " (" + detail + ")";
  }
  return text;
}

bool MediaError::recoverable() const {
  switch(code) {
    case MediaErrorCode::ConnectionFailed:
    case MediaErrorCode::TransferFailed:
    case MediaErrorCode::TransferCorrupted:
    case MediaErrorCode::StorageFailed:
    case MediaErrorCode::MemoryPressure:
    case MediaErrorCode::NotConnected:
      return true;
    default:
      return false;
  }
}

bool MediaError::transient() const {
  return code == MediaErrorCode::ConnectionFailed ||
         code == MediaErrorCode::MemoryPressure ||
         code == MediaErrorCode::TransferCancelled;
}
