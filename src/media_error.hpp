#pragma once

#include <cstdint>
#include <string>
#include <utility>

enum class MediaErrorCode {
  FileNotFound,
  FileCorrupted,
  UnsupportedFormat,
  FileTooLarge,
  VideoDurationInvalid,
  StorageFailed,
  PermissionDenied,
  NotConnected,
  ConnectionFailed,
  TransferFailed,
  TransferCorrupted,
  TransferCancelled,
  MemoryPressure,
  Unknown
};

const char* to_string(MediaErrorCode code);

struct MediaError {
  MediaErrorCode code = MediaErrorCode::Unknown;
  std::string subject;   // file name, peer name or operation the error is about
  std::string detail;

  MediaError() = default;
  MediaError(MediaErrorCode c, std::string s, std::string d = std::string())
    : code(c), subject(std::move(s)), detail(std::move(d)) {}

  // Text suitable for an alert or a toast.
  std::string message() const;

  // Whether the UI should offer the user a retry action.
  bool recoverable() const;

  // Transient errors are shown as a status line rather than an alert.
  bool transient() const;
};

std::string file_name_of(const std::string& path);
std::string format_byte_count(int64_t bytes);
