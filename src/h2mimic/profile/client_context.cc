// Copyright 2026 H2Mimic Authors
// SPDX-License-Identifier: MIT

#include "h2mimic/profile/client_context.h"

#include "h2mimic/base/log.h"

namespace h2mimic {
namespace profile {

namespace {

thread_local std::optional<ClientType> t_client_type;

}  // namespace

void SetThreadClientType(ClientType client_type) {
  t_client_type = client_type;
}

std::optional<ClientType> GetThreadClientType() { return t_client_type; }

void ClearThreadClientType() { t_client_type.reset(); }

AgentProfile ActiveAgentProfile() {
  return t_client_type.value_or(AgentProfile::kDefault);
}

ScopedClientType::ScopedClientType(ClientType client_type)
    : previous_(t_client_type) {
  t_client_type = client_type;
}

ScopedClientType::~ScopedClientType() { t_client_type = previous_; }

ClientContext ClientContext::ForProfile(AgentProfile profile,
                                        const ImpersonationConfig& config) {
  frame::StreamDependency defaults = ToStreamDependency(profile);
  frame::StreamDependency dependency(
      defaults.dependency_id(),
      config.priority_weight.value_or(defaults.weight()),
      config.priority_exclusive.value_or(defaults.is_exclusive()));
  return ClientContext(profile, dependency);
}

ClientContext ResolveClientContext(http::headers::OrderedHeaders& headers,
                                   const ImpersonationConfig& config) {
  AgentProfile profile = ExtractAgentProfile(headers);
  if (config.profile_override) {
    profile = *config.profile_override;
  }

  if (config.publish_thread_local) {
    SetThreadClientType(profile);
  }

  H2MIMIC_LOG(DEBUG, "client profile resolved: {}",
              AgentProfileToString(profile));
  return ClientContext::ForProfile(profile, config);
}

}  // namespace profile
}  // namespace h2mimic
