// Copyright 2026 H2Mimic Authors
// SPDX-License-Identifier: MIT

#include "h2mimic/frame/priority.h"

#include <utility>

#include "h2mimic/base/log.h"

namespace h2mimic {
namespace frame {

// ===== StreamDependency =====

Result<StreamDependency> StreamDependency::Load(std::span<const uint8_t> src) {
  if (src.size() != kStreamDependencyLen) {
    H2MIMIC_LOG(DEBUG, "stream dependency: expected {} bytes, got {}",
                kStreamDependencyLen, src.size());
    return Result<StreamDependency>::Err(Error::InvalidPayloadLength(
        "stream dependency payload must be 5 bytes"));
  }

  auto [dependency_id, is_exclusive] = StreamId::Parse(src.first<4>());
  uint8_t weight = src[4];

  return Result<StreamDependency>::Ok(
      StreamDependency(dependency_id, weight, is_exclusive));
}

void StreamDependency::Encode(core::IoBuffer& dst) const {
  uint8_t* out = dst.Reserve(kStreamDependencyLen);
  dependency_id_.Encode(std::span<uint8_t, 4>(out, 4), is_exclusive_);
  out[4] = weight_;
  dst.Commit(kStreamDependencyLen);
}

// ===== Priority =====

Priority::Priority(StreamId stream_id, StreamDependency dependency)
    : stream_id_(stream_id), dependency_(dependency) {
  H2MIMIC_CHECK(!stream_id.IsZero(),
                "PRIORITY frame cannot be sent on stream 0");
}

Result<Priority> Priority::Load(const Head& head,
                                std::span<const uint8_t> payload) {
  Result<StreamDependency> dependency = StreamDependency::Load(payload);
  if (!dependency) {
    return Result<Priority>::Err(std::move(dependency.error));
  }

  if (dependency.value->dependency_id() == head.stream_id()) {
    H2MIMIC_LOG(DEBUG, "PRIORITY on stream {} depends on itself",
                head.stream_id().value());
    return Result<Priority>::Err(
        Error::InvalidDependencyId("stream cannot depend on itself"));
  }

  H2MIMIC_LOG(TRACE,
              "decoded PRIORITY: stream={} dependency={} weight={} "
              "exclusive={}",
              head.stream_id().value(),
              dependency.value->dependency_id().value(),
              dependency.value->effective_weight(),
              dependency.value->is_exclusive());

  return Result<Priority>::Ok(
      Priority(head.stream_id(), *dependency.value, Unchecked{}));
}

Head Priority::head() const { return Head(FrameType::kPriority, 0, stream_id_); }

void Priority::Encode(core::IoBuffer& dst) const {
  head().Encode(kStreamDependencyLen, dst);
  dependency_.Encode(dst);
}

// ===== OptionPriority =====

Result<Priority> OptionPriority::Build() && {
  if (!stream_id_) {
    return Result<Priority>::Err(
        Error::InvalidStreamId("priority has no stream id bound"));
  }
  return Result<Priority>::Ok(Priority(*stream_id_, dependency_));
}

}  // namespace frame
}  // namespace h2mimic
