// Copyright 2026 H2Mimic Authors
// SPDX-License-Identifier: MIT

// Example: dump the HTTP/2 fingerprint of each agent profile
//
// Demonstrates:
// 1. Resolving a ClientContext from an x-client-profile header
// 2. Building request headers in the profile's pseudo-header order
// 3. Encoding the profile's PRIORITY frame
// 4. HPACK-encoding the header block with nghttp2
//
// Usage: ./profile_dump [profile] [--verbose]
//   profile: chrome, firefox, safari, edge, okhttp (default: all)

#include <cstdint>
#include <print>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include "h2mimic/config.h"
#include "h2mimic/frame/priority.h"
#include "h2mimic/http/ordered_headers.h"
#include "h2mimic/http2/hpack_block.h"
#include "h2mimic/http2/request_headers.h"
#include "h2mimic/profile/client_context.h"

using namespace h2mimic;
namespace headers = h2mimic::http::headers;

namespace {

void PrintHex(std::string_view label, std::span<const uint8_t> bytes) {
  std::print("  {:<10}", label);
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i > 0 && i % 16 == 0) {
      std::print("\n  {:<10}", "");
    }
    std::print("{:02x} ", bytes[i]);
  }
  std::println("");
}

int DumpProfile(AgentProfile agent, const Config& config) {
  headers::OrderedHeaders h;
  headers::Add(h, "user-agent", "h2mimic-example");
  headers::Add(h, profile::kProfileHeaderName,
               profile::AgentProfileToString(agent));
  headers::Add(h, "accept", "*/*");

  profile::ClientContext ctx =
      profile::ResolveClientContext(h, config.impersonation);

  std::println("=== {} ===", profile::AgentProfileToString(ctx.profile()));

  http2::RequestHeaderBuilder builder(ctx);
  builder.SetMethod("GET").SetAuthority("example.com").SetPath("/");
  builder.AddHeaders(h);

  std::println("--- Header Order ---");
  for (const auto& hdr : builder.BuildHeaderList()) {
    std::println("  {}: {}", hdr.name, hdr.value);
  }

  const frame::StreamDependency& dep = ctx.dependency();
  std::println("--- Priority ---");
  std::println("  depends on {} weight {} exclusive {}",
               dep.dependency_id().value(), dep.effective_weight(),
               dep.is_exclusive());

  frame::OptionPriority pending(dep);
  pending.set_stream_id(frame::StreamId(1));
  auto priority = std::move(pending).Build();
  if (!priority) {
    std::println(stderr, "Error: {}", priority.error.message());
    return 1;
  }

  core::IoBuffer wire;
  priority.value->Encode(wire);
  PrintHex("PRIORITY", wire.Readable());

  auto encoder = http2::HpackEncoder::Create();
  if (!encoder) {
    std::println(stderr, "Error: {}", encoder.error.message());
    return 1;
  }
  core::IoBuffer block;
  auto written = encoder.value->Encode(builder.Build(), block);
  if (!written) {
    std::println(stderr, "Error: {}", written.error.message());
    return 1;
  }
  PrintHex("HEADERS", block.Readable());
  std::println("");
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  Config config = Config::Default();
  std::vector<AgentProfile> selected;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "--verbose") {
      config.log.level = LogLevel::kTrace;
      continue;
    }
    AgentProfile agent = profile::AgentProfileFromString(arg);
    if (profile::AgentProfileToString(agent) != arg) {
      std::println(stderr, "Unknown profile '{}'", arg);
      std::println(stderr,
                   "Usage: {} [chrome|firefox|safari|edge|okhttp] [--verbose]",
                   argv[0]);
      return 1;
    }
    selected.push_back(agent);
  }

  ApplyLogConfig(config.log);

  if (selected.empty()) {
    auto all = profile::AllAgentProfiles();
    selected.assign(all.begin(), all.end());
  }

  for (AgentProfile agent : selected) {
    if (int rc = DumpProfile(agent, config); rc != 0) {
      return rc;
    }
  }
  return 0;
}
