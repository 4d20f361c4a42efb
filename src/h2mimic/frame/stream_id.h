// Copyright 2026 H2Mimic Authors
// SPDX-License-Identifier: MIT

#ifndef H2MIMIC_FRAME_STREAM_ID_H_
#define H2MIMIC_FRAME_STREAM_ID_H_

#include <compare>
#include <cstdint>
#include <span>
#include <utility>

namespace h2mimic {
namespace frame {

// HTTP/2 stream identifier (RFC 7540 Section 5.1.1).
//
// A 31-bit unsigned value. The high bit of the 32-bit wire field is reserved;
// it is never part of the identifier and is reported separately by Parse().
// Stream 0 addresses the connection as a whole.
class StreamId {
 public:
  static constexpr uint32_t kMask = 0x7FFFFFFF;
  static constexpr uint32_t kReservedBit = 0x80000000;

  constexpr StreamId() : value_(0) {}
  constexpr explicit StreamId(uint32_t value) : value_(value & kMask) {}

  static constexpr StreamId Zero() { return StreamId(); }
  static constexpr StreamId Max() { return StreamId(kMask); }

  // Parse a 4-byte big-endian field into (id, reserved bit).
  // The meaning of the reserved bit belongs to the caller; stream
  // dependencies use it as the exclusive flag.
  static std::pair<StreamId, bool> Parse(std::span<const uint8_t, 4> src);

  // Write the 4-byte big-endian field, setting the high bit if requested
  void Encode(std::span<uint8_t, 4> dst, bool reserved_bit = false) const;

  constexpr uint32_t value() const { return value_; }
  constexpr bool IsZero() const { return value_ == 0; }

  // Odd ids are opened by clients, even non-zero ids by servers
  constexpr bool IsClientInitiated() const { return (value_ & 1) != 0; }
  constexpr bool IsServerInitiated() const {
    return value_ != 0 && (value_ & 1) == 0;
  }

  constexpr auto operator<=>(const StreamId&) const = default;

 private:
  uint32_t value_;
};

}  // namespace frame
}  // namespace h2mimic

#endif  // H2MIMIC_FRAME_STREAM_ID_H_
