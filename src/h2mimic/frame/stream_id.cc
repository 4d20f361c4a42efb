// Copyright 2026 H2Mimic Authors
// SPDX-License-Identifier: MIT

#include "h2mimic/frame/stream_id.h"

namespace h2mimic {
namespace frame {

std::pair<StreamId, bool> StreamId::Parse(std::span<const uint8_t, 4> src) {
  uint32_t raw = (static_cast<uint32_t>(src[0]) << 24) |
                 (static_cast<uint32_t>(src[1]) << 16) |
                 (static_cast<uint32_t>(src[2]) << 8) |
                 static_cast<uint32_t>(src[3]);
  return {StreamId(raw), (raw & kReservedBit) != 0};
}

void StreamId::Encode(std::span<uint8_t, 4> dst, bool reserved_bit) const {
  uint32_t raw = value_;
  if (reserved_bit) {
    raw |= kReservedBit;
  }
  dst[0] = static_cast<uint8_t>(raw >> 24);
  dst[1] = static_cast<uint8_t>(raw >> 16);
  dst[2] = static_cast<uint8_t>(raw >> 8);
  dst[3] = static_cast<uint8_t>(raw);
}

}  // namespace frame
}  // namespace h2mimic
