// Copyright 2026 H2Mimic Authors
// SPDX-License-Identifier: MIT

#ifndef H2MIMIC_FRAME_PRIORITY_H_
#define H2MIMIC_FRAME_PRIORITY_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "h2mimic/core/io_buffer.h"
#include "h2mimic/frame/head.h"
#include "h2mimic/frame/stream_id.h"
#include "h2mimic/types.h"

namespace h2mimic {
namespace frame {

// Stream dependency block: 4-byte E|dependency word plus 1 weight byte
inline constexpr size_t kStreamDependencyLen = 5;

// PRIORITY frame total size on the wire
inline constexpr size_t kPriorityFrameLen = kHeaderLen + kStreamDependencyLen;

// Priority parameters of a stream (RFC 7540 Section 5.3)
//
//  +-+-------------------------------------------------------------+
//  |E|                  Stream Dependency (31)                     |
//  +-+-------------+-----------------------------------------------+
//  |   Weight (8)  |
//  +-+-------------+
class StreamDependency {
 public:
  // weight is the raw wire byte; the RFC weight is weight + 1
  StreamDependency(StreamId dependency_id, uint8_t weight, bool is_exclusive)
      : dependency_id_(dependency_id),
        weight_(weight),
        is_exclusive_(is_exclusive) {}

  // Decode from exactly 5 bytes
  static Result<StreamDependency> Load(std::span<const uint8_t> src);

  // Append exactly 5 bytes
  void Encode(core::IoBuffer& dst) const;

  StreamId dependency_id() const { return dependency_id_; }
  uint8_t weight() const { return weight_; }
  bool is_exclusive() const { return is_exclusive_; }

  // Weight in the RFC range [1, 256]
  uint16_t effective_weight() const {
    return static_cast<uint16_t>(weight_) + 1;
  }

  bool operator==(const StreamDependency&) const = default;

 private:
  StreamId dependency_id_;
  uint8_t weight_;
  bool is_exclusive_;
};

// PRIORITY frame (RFC 7540 Section 6.3)
class Priority {
 public:
  // stream_id must be non-zero; a zero id aborts
  Priority(StreamId stream_id, StreamDependency dependency);

  // Decode a PRIORITY payload received under head.
  // Fails with kInvalidPayloadLength or kInvalidDependencyId.
  static Result<Priority> Load(const Head& head,
                               std::span<const uint8_t> payload);

  Head head() const;

  // Append the full 14-byte frame (header then payload)
  void Encode(core::IoBuffer& dst) const;

  StreamId stream_id() const { return stream_id_; }
  const StreamDependency& dependency() const { return dependency_; }

  bool operator==(const Priority&) const = default;

 private:
  struct Unchecked {};
  Priority(StreamId stream_id, StreamDependency dependency, Unchecked)
      : stream_id_(stream_id), dependency_(dependency) {}

  StreamId stream_id_;
  StreamDependency dependency_;
};

// Priority whose stream id is bound later, once the session assigns it
class OptionPriority {
 public:
  explicit OptionPriority(StreamDependency dependency)
      : dependency_(dependency) {}
  OptionPriority(std::optional<StreamId> stream_id, StreamDependency dependency)
      : stream_id_(stream_id), dependency_(dependency) {}

  void set_stream_id(StreamId stream_id) { stream_id_ = stream_id; }
  bool is_custom_stream_id() const { return stream_id_.has_value(); }

  const std::optional<StreamId>& stream_id() const { return stream_id_; }
  const StreamDependency& dependency() const { return dependency_; }

  // Fails with kInvalidStreamId while no stream id is bound
  Result<Priority> Build() &&;

  bool operator==(const OptionPriority&) const = default;

 private:
  std::optional<StreamId> stream_id_;
  StreamDependency dependency_;
};

}  // namespace frame
}  // namespace h2mimic

#endif  // H2MIMIC_FRAME_PRIORITY_H_
