// Copyright 2026 H2Mimic Authors
// SPDX-License-Identifier: MIT

#include "h2mimic/profile/agent_profile.h"

#include <cstddef>
#include <optional>
#include <string>

#include "h2mimic/base/log.h"

namespace h2mimic {
namespace profile {

namespace {

using http2::PseudoType;

// Chrome and Edge: method, authority, scheme, path (MASP)
constexpr PseudoOrder kOrderMASP = {PseudoType::kMethod, PseudoType::kAuthority,
                                    PseudoType::kScheme, PseudoType::kPath};

// Firefox and OkHttp: method, path, authority, scheme (MPAS)
constexpr PseudoOrder kOrderMPAS = {PseudoType::kMethod, PseudoType::kPath,
                                    PseudoType::kAuthority,
                                    PseudoType::kScheme};

// Safari: method, scheme, path, authority (MSPA)
constexpr PseudoOrder kOrderMSPA = {PseudoType::kMethod, PseudoType::kScheme,
                                    PseudoType::kPath, PseudoType::kAuthority};

// Indexed by AgentProfile value - NEVER reorder.
// These orders are what fingerprinting systems check against.
constexpr AgentProfileTraits kProfileTable[] = {
    {AgentProfile::kChrome, "chrome", kOrderMASP, 255, true},
    {AgentProfile::kFirefox, "firefox", kOrderMPAS, 255, true},
    {AgentProfile::kSafari, "safari", kOrderMSPA, 254, false},
    {AgentProfile::kEdge, "edge", kOrderMASP, 255, true},
    {AgentProfile::kOkHttp, "okhttp", kOrderMPAS, 255, true},
};

static_assert(sizeof(kProfileTable) / sizeof(kProfileTable[0]) ==
                  kAgentProfileCount,
              "Profile table size mismatch");

constexpr bool TableMatchesEnum() {
  for (size_t i = 0; i < kAgentProfileCount; ++i) {
    if (static_cast<size_t>(kProfileTable[i].profile) != i) return false;
  }
  return true;
}

static_assert(TableMatchesEnum(), "Profile table out of enum order");

constexpr AgentProfile kAllProfiles[] = {
    AgentProfile::kChrome, AgentProfile::kFirefox, AgentProfile::kSafari,
    AgentProfile::kEdge,   AgentProfile::kOkHttp,
};

}  // namespace

const AgentProfileTraits& GetAgentProfileTraits(AgentProfile profile) {
  size_t index = static_cast<size_t>(profile);
  if (index >= kAgentProfileCount) {
    return kProfileTable[static_cast<size_t>(AgentProfile::kDefault)];
  }
  return kProfileTable[index];
}

std::span<const AgentProfile> AllAgentProfiles() { return kAllProfiles; }

const PseudoOrder& ToPseudoOrder(AgentProfile profile) {
  return GetAgentProfileTraits(profile).pseudo_order;
}

frame::StreamDependency ToStreamDependency(AgentProfile profile) {
  const AgentProfileTraits& traits = GetAgentProfileTraits(profile);
  return frame::StreamDependency(frame::StreamId::Zero(), traits.weight,
                                 traits.exclusive);
}

std::string_view AgentProfileToString(AgentProfile profile) {
  return GetAgentProfileTraits(profile).token;
}

AgentProfile AgentProfileFromString(std::string_view token) {
  for (const auto& traits : kProfileTable) {
    if (traits.token == token) {
      return traits.profile;
    }
  }
  return AgentProfile::kDefault;
}

Header ToHeader(AgentProfile profile) {
  return {std::string(kProfileHeaderName),
          std::string(AgentProfileToString(profile))};
}

AgentProfile ExtractAgentProfile(http::headers::OrderedHeaders& headers) {
  std::optional<std::string> token =
      http::headers::Take(headers, kProfileHeaderName);
  if (!token) {
    return AgentProfile::kDefault;
  }

  AgentProfile profile = AgentProfileFromString(*token);
  if (AgentProfileToString(profile) != *token) {
    H2MIMIC_LOG(DEBUG, "unknown client profile '{}', using {}", *token,
                AgentProfileToString(profile));
  }
  return profile;
}

}  // namespace profile
}  // namespace h2mimic
