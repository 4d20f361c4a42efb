// Copyright 2026 H2Mimic Authors
// SPDX-License-Identifier: MIT

// PRIORITY frame codec tests

#include "h2mimic/base/log.h"
#include "h2mimic/frame/priority.h"

#include <sys/wait.h>
#include <unistd.h>

#include <cassert>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <print>
#include <span>
#include <string>
#include <vector>

using namespace h2mimic;
using frame::Head;
using frame::OptionPriority;
using frame::Priority;
using frame::StreamDependency;
using frame::StreamId;

namespace {

std::vector<uint8_t> EncodeDependency(const StreamDependency& dep) {
  core::IoBuffer buf;
  dep.Encode(buf);
  return buf.TakeContiguous();
}

// Run fn in a child process; true if the child was killed by SIGABRT
template <typename Fn>
bool AbortsInChild(Fn fn) {
  std::fflush(stdout);
  std::fflush(stderr);
  pid_t pid = fork();
  assert(pid >= 0);
  if (pid == 0) {
    log::SetLevel(LogLevel::kOff);
    fn();
    _exit(0);
  }
  int status = 0;
  pid_t waited = waitpid(pid, &status, 0);
  assert(waited == pid);
  return WIFSIGNALED(status) && WTERMSIG(status) == SIGABRT;
}

}  // namespace

// ============================================================================
// StreamDependency
// ============================================================================

void TestDependencyEncodeNonExclusive() {
  std::print("Testing StreamDependency encode (weight 201, non-exclusive)... ");

  StreamDependency dep(StreamId::Zero(), 201, false);
  std::vector<uint8_t> bytes = EncodeDependency(dep);
  assert((bytes == std::vector<uint8_t>{0x00, 0x00, 0x00, 0x00, 0xC9}));

  auto loaded = StreamDependency::Load(bytes);
  assert(loaded);
  assert(loaded.value->dependency_id() == StreamId::Zero());
  assert(loaded.value->weight() == 201);
  assert(!loaded.value->is_exclusive());
  assert(loaded.value->effective_weight() == 202);

  std::println("PASSED");
}

void TestDependencyExclusiveBitLayout() {
  std::print("Testing exclusive flag occupies top bit of first byte... ");

  StreamDependency dep(StreamId(0x01020304), 16, true);
  std::vector<uint8_t> bytes = EncodeDependency(dep);
  assert((bytes == std::vector<uint8_t>{0x81, 0x02, 0x03, 0x04, 0x10}));

  StreamDependency max(StreamId::Max(), 255, false);
  bytes = EncodeDependency(max);
  assert((bytes == std::vector<uint8_t>{0x7F, 0xFF, 0xFF, 0xFF, 0xFF}));

  StreamDependency max_excl(StreamId::Max(), 0, true);
  bytes = EncodeDependency(max_excl);
  assert((bytes == std::vector<uint8_t>{0xFF, 0xFF, 0xFF, 0xFF, 0x00}));

  std::println("PASSED");
}

void TestDependencyRoundTrip() {
  std::print("Testing StreamDependency round trip... ");

  const uint32_t ids[] = {0, 1, 2, 0x7F, 0x80, 0xFFFF, 0x10000, 0x7FFFFFFE,
                          0x7FFFFFFF};
  const uint8_t weights[] = {0, 1, 15, 127, 128, 200, 254, 255};

  for (uint32_t id : ids) {
    for (uint8_t weight : weights) {
      for (bool exclusive : {false, true}) {
        StreamDependency dep(StreamId(id), weight, exclusive);
        std::vector<uint8_t> bytes = EncodeDependency(dep);
        assert(bytes.size() == frame::kStreamDependencyLen);

        auto loaded = StreamDependency::Load(bytes);
        assert(loaded);
        assert(*loaded.value == dep);
      }
    }
  }

  std::println("PASSED");
}

void TestDependencyRejectsWrongLength() {
  std::print("Testing StreamDependency rejects length != 5... ");

  std::vector<uint8_t> data(16, 0x00);
  for (size_t len = 0; len <= data.size(); ++len) {
    auto loaded = StreamDependency::Load(std::span<const uint8_t>(data.data(), len));
    if (len == frame::kStreamDependencyLen) {
      assert(loaded);
    } else {
      assert(!loaded);
      assert(loaded.error.code() == ErrorCode::kInvalidPayloadLength);
    }
  }

  std::println("PASSED");
}

// ============================================================================
// Priority
// ============================================================================

void TestPriorityEncode() {
  std::print("Testing Priority encode (stream 3 -> 0, weight 201)... ");

  Priority priority(StreamId(3), StreamDependency(StreamId::Zero(), 201, false));
  core::IoBuffer buf;
  priority.Encode(buf);

  std::vector<uint8_t> bytes = buf.TakeContiguous();
  assert(bytes.size() == frame::kPriorityFrameLen);
  assert(bytes.size() == 14);

  const std::vector<uint8_t> expected = {
      0x00, 0x00, 0x05,        // length
      0x02,                    // type
      0x00,                    // flags
      0x00, 0x00, 0x00, 0x03,  // stream id
      0x00, 0x00, 0x00, 0x00,  // E + dependency
      0xC9,                    // weight
  };
  assert(bytes == expected);

  std::println("PASSED");
}

void TestPriorityHead() {
  std::print("Testing Priority head()... ");

  Priority priority(StreamId(11), StreamDependency(StreamId(1), 7, true));
  Head head = priority.head();
  assert(head.type() == frame::FrameType::kPriority);
  assert(head.flags() == 0);
  assert(head.stream_id() == StreamId(11));

  std::println("PASSED");
}

void TestPriorityRoundTrip() {
  std::print("Testing Priority round trip through wire bytes... ");

  const uint32_t stream_ids[] = {1, 3, 5, 0x101, 0x7FFFFFFF};
  const uint32_t dep_ids[] = {0, 1, 2, 0x7FFFFFFE};

  for (uint32_t sid : stream_ids) {
    for (uint32_t did : dep_ids) {
      if (sid == did) continue;
      for (bool exclusive : {false, true}) {
        Priority original(StreamId(sid),
                          StreamDependency(StreamId(did), 42, exclusive));
        core::IoBuffer buf;
        original.Encode(buf);
        auto bytes = buf.Readable();

        uint32_t length = 0;
        auto head = Head::Parse(bytes, &length);
        assert(head);
        assert(length == frame::kStreamDependencyLen);
        assert(*head.value == original.head());

        auto decoded = Priority::Load(*head.value, bytes.subspan(frame::kHeaderLen));
        assert(decoded);
        assert(*decoded.value == original);
      }
    }
  }

  std::println("PASSED");
}

void TestPriorityRejectsSelfDependency() {
  std::print("Testing Priority rejects self dependency... ");

  const uint32_t stream_ids[] = {0, 1, 5, 0x7FFFFFFF};
  for (uint32_t sid : stream_ids) {
    for (bool exclusive : {false, true}) {
      std::vector<uint8_t> payload =
          EncodeDependency(StreamDependency(StreamId(sid), 16, exclusive));
      Head head(frame::FrameType::kPriority, 0, StreamId(sid));

      auto decoded = Priority::Load(head, payload);
      assert(!decoded);
      assert(decoded.error.code() == ErrorCode::kInvalidDependencyId);
    }
  }

  // Stream 5 depending on stream 5
  const std::vector<uint8_t> payload = {0x00, 0x00, 0x00, 0x05, 0x0F};
  auto decoded = Priority::Load(
      Head(frame::FrameType::kPriority, 0, StreamId(5)), payload);
  assert(!decoded);
  assert(decoded.error.code() == ErrorCode::kInvalidDependencyId);

  std::println("PASSED");
}

void TestPriorityPropagatesLengthError() {
  std::print("Testing Priority propagates payload length error... ");

  Head head(frame::FrameType::kPriority, 0, StreamId(3));

  const std::vector<uint8_t> short_payload = {0x00, 0x00, 0x00, 0x01};
  auto decoded = Priority::Load(head, short_payload);
  assert(!decoded);
  assert(decoded.error.code() == ErrorCode::kInvalidPayloadLength);

  const std::vector<uint8_t> long_payload = {0x00, 0x00, 0x00, 0x01, 0x10, 0x00};
  decoded = Priority::Load(head, long_payload);
  assert(!decoded);
  assert(decoded.error.code() == ErrorCode::kInvalidPayloadLength);

  // Length check happens before the self-dependency check
  const std::vector<uint8_t> self_short = {0x00, 0x00, 0x00, 0x03};
  decoded = Priority::Load(head, self_short);
  assert(decoded.error.code() == ErrorCode::kInvalidPayloadLength);

  std::println("PASSED");
}

void TestPriorityLoadOnConnectionStream() {
  std::print("Testing Priority load on stream 0 is left to the caller... ");

  const std::vector<uint8_t> payload = {0x00, 0x00, 0x00, 0x01, 0x10};
  auto decoded =
      Priority::Load(Head(frame::FrameType::kPriority, 0, StreamId::Zero()),
                     payload);
  assert(decoded);
  assert(decoded.value->stream_id().IsZero());
  assert(decoded.value->dependency().dependency_id() == StreamId(1));

  std::println("PASSED");
}

void TestPriorityDecodeIsTraced() {
  std::print("Testing Priority decode is traced... ");

  std::vector<std::string> records;
  log::SetLevel(LogLevel::kTrace);
  log::SetSink([&](LogLevel level, std::string_view message) {
    if (level == LogLevel::kTrace) {
      records.emplace_back(message);
    }
  });

  const std::vector<uint8_t> payload = {0x80, 0x00, 0x00, 0x01, 0xFF};
  auto decoded = Priority::Load(
      Head(frame::FrameType::kPriority, 0, StreamId(3)), payload);
  assert(decoded);

  log::SetSink({});
  log::SetLevel(LogLevel::kWarn);

  assert(records.size() == 1);
  assert(records[0].find("stream=3") != std::string::npos);
  assert(records[0].find("weight=256") != std::string::npos);
  assert(records[0].find("exclusive=true") != std::string::npos);

  std::println("PASSED");
}

void TestPriorityOnConnectionStreamAborts() {
  std::print("Testing Priority construction on stream 0 aborts... ");

  StreamDependency dep(StreamId(1), 16, false);
  assert(AbortsInChild([&] { Priority priority(StreamId::Zero(), dep); }));
  assert(AbortsInChild(
      [&] { Priority priority(StreamId(0x80000000), dep); }));  // masks to 0

  // Non-zero stream runs to completion
  assert(!AbortsInChild([&] { Priority priority(StreamId(1), dep); }));

  std::println("PASSED");
}

// ============================================================================
// OptionPriority
// ============================================================================

void TestOptionPriorityWithoutStreamId() {
  std::print("Testing OptionPriority without stream id fails to build... ");

  OptionPriority pending(StreamDependency(StreamId::Zero(), 255, true));
  assert(!pending.is_custom_stream_id());

  auto built = std::move(pending).Build();
  assert(!built);
  assert(built.error.code() == ErrorCode::kInvalidStreamId);

  std::println("PASSED");
}

void TestOptionPriorityBindsStreamId() {
  std::print("Testing OptionPriority binds stream id... ");

  StreamDependency dep(StreamId::Zero(), 254, false);
  OptionPriority pending(dep);
  pending.set_stream_id(StreamId(1));
  pending.set_stream_id(StreamId(7));  // last write wins
  assert(pending.is_custom_stream_id());
  assert(*pending.stream_id() == StreamId(7));

  auto built = std::move(pending).Build();
  assert(built);
  assert(built.value->stream_id() == StreamId(7));
  assert(built.value->dependency() == dep);

  OptionPriority preset(StreamId(9), dep);
  assert(preset.is_custom_stream_id());
  auto built2 = std::move(preset).Build();
  assert(built2);
  assert(built2.value->stream_id() == StreamId(9));

  std::println("PASSED");
}

void TestOptionPriorityZeroStreamAborts() {
  std::print("Testing OptionPriority bound to stream 0 aborts on build... ");

  StreamDependency dep(StreamId::Zero(), 255, true);
  assert(AbortsInChild([&] {
    auto built = OptionPriority(StreamId::Zero(), dep).Build();
    (void)built;
  }));
  assert(AbortsInChild([&] {
    OptionPriority pending(dep);
    pending.set_stream_id(StreamId::Zero());
    auto built = std::move(pending).Build();
    (void)built;
  }));

  std::println("PASSED");
}

int main() {
  std::println("=== Priority Frame Unit Tests ===\n");

  TestDependencyEncodeNonExclusive();
  TestDependencyExclusiveBitLayout();
  TestDependencyRoundTrip();
  TestDependencyRejectsWrongLength();
  TestPriorityEncode();
  TestPriorityHead();
  TestPriorityRoundTrip();
  TestPriorityRejectsSelfDependency();
  TestPriorityPropagatesLengthError();
  TestPriorityLoadOnConnectionStream();
  TestPriorityDecodeIsTraced();
  TestPriorityOnConnectionStreamAborts();
  TestOptionPriorityWithoutStreamId();
  TestOptionPriorityBindsStreamId();
  TestOptionPriorityZeroStreamAborts();

  std::println("\nAll Priority tests passed!");
  return 0;
}
