// Copyright 2026 H2Mimic Authors
// SPDX-License-Identifier: MIT

#include "h2mimic/frame/head.h"

#include "h2mimic/base/log.h"

namespace h2mimic {
namespace frame {

std::string_view FrameTypeToString(FrameType type) {
  switch (type) {
    case FrameType::kData:
      return "DATA";
    case FrameType::kHeaders:
      return "HEADERS";
    case FrameType::kPriority:
      return "PRIORITY";
    case FrameType::kRstStream:
      return "RST_STREAM";
    case FrameType::kSettings:
      return "SETTINGS";
    case FrameType::kPushPromise:
      return "PUSH_PROMISE";
    case FrameType::kPing:
      return "PING";
    case FrameType::kGoAway:
      return "GOAWAY";
    case FrameType::kWindowUpdate:
      return "WINDOW_UPDATE";
    case FrameType::kContinuation:
      return "CONTINUATION";
  }
  return "UNKNOWN";
}

Result<Head> Head::Parse(std::span<const uint8_t> src, uint32_t* payload_len) {
  if (src.size() < kHeaderLen) {
    H2MIMIC_LOG(DEBUG, "frame header truncated: {} of {} bytes", src.size(),
                kHeaderLen);
    return Result<Head>::Err(
        Error::InvalidFrameHeader("frame header shorter than 9 bytes"));
  }

  *payload_len = (static_cast<uint32_t>(src[0]) << 16) |
                 (static_cast<uint32_t>(src[1]) << 8) |
                 static_cast<uint32_t>(src[2]);

  // Reserved bit is ignored on receipt
  auto [stream_id, reserved] = StreamId::Parse(src.subspan<5, 4>());
  if (reserved) {
    H2MIMIC_LOG(TRACE, "ignoring reserved bit on stream {}",
                stream_id.value());
  }

  return Result<Head>::Ok(
      Head(static_cast<FrameType>(src[3]), src[4], stream_id));
}

void Head::Encode(uint32_t payload_len, core::IoBuffer& dst) const {
  H2MIMIC_CHECK(payload_len <= kMaxPayloadLen,
                "payload length {} exceeds 24 bits", payload_len);

  uint8_t* out = dst.Reserve(kHeaderLen);
  out[0] = static_cast<uint8_t>(payload_len >> 16);
  out[1] = static_cast<uint8_t>(payload_len >> 8);
  out[2] = static_cast<uint8_t>(payload_len);
  out[3] = static_cast<uint8_t>(type_);
  out[4] = flags_;
  stream_id_.Encode(std::span<uint8_t, 4>(out + 5, 4));
  dst.Commit(kHeaderLen);
}

}  // namespace frame
}  // namespace h2mimic
