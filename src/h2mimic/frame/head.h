// Copyright 2026 H2Mimic Authors
// SPDX-License-Identifier: MIT

#ifndef H2MIMIC_FRAME_HEAD_H_
#define H2MIMIC_FRAME_HEAD_H_

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "h2mimic/core/io_buffer.h"
#include "h2mimic/frame/stream_id.h"
#include "h2mimic/types.h"

namespace h2mimic {
namespace frame {

// Frame header is always 9 bytes (RFC 7540 Section 4.1)
inline constexpr size_t kHeaderLen = 9;

// Largest payload length expressible in the 24-bit length field
inline constexpr uint32_t kMaxPayloadLen = (1u << 24) - 1;

// HTTP/2 frame types (RFC 7540 Section 11.2).
// Values outside this list are extension frames and are carried as-is.
enum class FrameType : uint8_t {
  kData = 0x0,
  kHeaders = 0x1,
  kPriority = 0x2,
  kRstStream = 0x3,
  kSettings = 0x4,
  kPushPromise = 0x5,
  kPing = 0x6,
  kGoAway = 0x7,
  kWindowUpdate = 0x8,
  kContinuation = 0x9,
};

std::string_view FrameTypeToString(FrameType type);

// Generic frame header shared by every frame kind
class Head {
 public:
  Head(FrameType type, uint8_t flags, StreamId stream_id)
      : type_(type), flags_(flags), stream_id_(stream_id) {}

  // Parse the first 9 bytes of src. On success *payload_len receives the
  // 24-bit length field.
  static Result<Head> Parse(std::span<const uint8_t> src,
                            uint32_t* payload_len);

  // Write the 9-byte header for a payload of payload_len bytes
  void Encode(uint32_t payload_len, core::IoBuffer& dst) const;

  FrameType type() const { return type_; }
  uint8_t flags() const { return flags_; }
  StreamId stream_id() const { return stream_id_; }

  bool IsFlagSet(uint8_t flag) const { return (flags_ & flag) != 0; }

  bool operator==(const Head&) const = default;

 private:
  FrameType type_;
  uint8_t flags_;
  StreamId stream_id_;
};

}  // namespace frame
}  // namespace h2mimic

#endif  // H2MIMIC_FRAME_HEAD_H_
