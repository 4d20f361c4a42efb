// Copyright 2026 H2Mimic Authors
// SPDX-License-Identifier: MIT

#ifndef H2MIMIC_PROFILE_AGENT_PROFILE_H_
#define H2MIMIC_PROFILE_AGENT_PROFILE_H_

#include <array>
#include <cstdint>
#include <span>
#include <string_view>

#include "h2mimic/config.h"
#include "h2mimic/frame/priority.h"
#include "h2mimic/http/ordered_headers.h"
#include "h2mimic/http2/pseudo_header.h"
#include "h2mimic/types.h"

namespace h2mimic {
namespace profile {

// Internal hint header selecting the profile for a request.
// Always stripped before the header list reaches HPACK.
inline constexpr std::string_view kProfileHeaderName = "x-client-profile";

// Order in which a client emits the four request pseudo-headers
using PseudoOrder = std::array<http2::PseudoType, 4>;

// Per-client HTTP/2 fingerprint traits
struct AgentProfileTraits {
  AgentProfile profile;
  std::string_view token;  // Canonical lowercase x-client-profile value
  PseudoOrder pseudo_order;

  // Default stream dependency: parent is always stream 0
  uint8_t weight;  // Raw wire byte
  bool exclusive;
};

// Get traits for a profile
const AgentProfileTraits& GetAgentProfileTraits(AgentProfile profile);

// All profiles in enumeration order
std::span<const AgentProfile> AllAgentProfiles();

// Pseudo-header ordering for the profile
const PseudoOrder& ToPseudoOrder(AgentProfile profile);

// Default PRIORITY parameters for the profile
frame::StreamDependency ToStreamDependency(AgentProfile profile);

std::string_view AgentProfileToString(AgentProfile profile);

// Parse a canonical token. Unknown tokens map to kDefault (Chrome); this
// never fails because the header is an internal hint, not peer input.
AgentProfile AgentProfileFromString(std::string_view token);

// Render the profile as the x-client-profile sentinel header
Header ToHeader(AgentProfile profile);

// Read the sentinel header, then remove every occurrence of it. Remaining
// headers keep their relative order. Returns kDefault if absent.
AgentProfile ExtractAgentProfile(http::headers::OrderedHeaders& headers);

}  // namespace profile
}  // namespace h2mimic

#endif  // H2MIMIC_PROFILE_AGENT_PROFILE_H_
