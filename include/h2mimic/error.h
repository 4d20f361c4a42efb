// Copyright 2026 H2Mimic Authors
// SPDX-License-Identifier: MIT

#ifndef H2MIMIC_ERROR_H_
#define H2MIMIC_ERROR_H_

#include <string>
#include <string_view>
#include <utility>

namespace h2mimic {

// Error codes for the frame and impersonation layers
enum class ErrorCode {
  kOk = 0,

  // Frame decode errors
  kInvalidPayloadLength,
  kInvalidDependencyId,
  kInvalidStreamId,
  kInvalidFrameHeader,

  // Header compression errors
  kHpackError,

  // Internal errors
  kInternalError,
};

inline std::string_view ErrorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:
      return "ok";
    case ErrorCode::kInvalidPayloadLength:
      return "invalid payload length";
    case ErrorCode::kInvalidDependencyId:
      return "invalid dependency id";
    case ErrorCode::kInvalidStreamId:
      return "invalid stream id";
    case ErrorCode::kInvalidFrameHeader:
      return "invalid frame header";
    case ErrorCode::kHpackError:
      return "hpack error";
    case ErrorCode::kInternalError:
      return "internal error";
  }
  return "unknown";
}

// Error information with code and message
class Error {
 public:
  Error() : code_(ErrorCode::kOk) {}
  Error(ErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {}

  // Factory methods
  static Error Ok() { return {}; }

  static Error InvalidPayloadLength(std::string_view msg) {
    return {ErrorCode::kInvalidPayloadLength, std::string(msg)};
  }

  static Error InvalidDependencyId(std::string_view msg) {
    return {ErrorCode::kInvalidDependencyId, std::string(msg)};
  }

  static Error InvalidStreamId(std::string_view msg) {
    return {ErrorCode::kInvalidStreamId, std::string(msg)};
  }

  static Error InvalidFrameHeader(std::string_view msg) {
    return {ErrorCode::kInvalidFrameHeader, std::string(msg)};
  }

  static Error Hpack(std::string_view msg) {
    return {ErrorCode::kHpackError, std::string(msg)};
  }

  static Error Internal(std::string_view msg) {
    return {ErrorCode::kInternalError, std::string(msg)};
  }

  // Check if error occurred
  explicit operator bool() const { return code_ != ErrorCode::kOk; }
  bool ok() const { return code_ == ErrorCode::kOk; }

  // Accessors
  ErrorCode code() const { return code_; }
  const std::string& message() const { return message_; }

 private:
  ErrorCode code_;
  std::string message_;
};

}  // namespace h2mimic

#endif  // H2MIMIC_ERROR_H_
