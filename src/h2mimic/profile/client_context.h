// Copyright 2026 H2Mimic Authors
// SPDX-License-Identifier: MIT

// Client identity for the connection currently being processed.
//
// Two ways to reach the active profile from codec code:
//
//   1. ClientContext - an immutable value resolved once per connection and
//      passed to the header builder. Safe under any scheduler.
//
//   2. The thread-local client slot - for layers that cannot take the
//      context as a parameter. Only correct while a connection stays on one
//      thread; a task migrated between threads sees another connection's
//      value or none at all. Callers reusing a thread must set or clear it.

#ifndef H2MIMIC_PROFILE_CLIENT_CONTEXT_H_
#define H2MIMIC_PROFILE_CLIENT_CONTEXT_H_

#include <optional>

#include "h2mimic/config.h"
#include "h2mimic/frame/priority.h"
#include "h2mimic/http/ordered_headers.h"
#include "h2mimic/profile/agent_profile.h"

namespace h2mimic {
namespace profile {

using ClientType = AgentProfile;

// ===== Thread-local client slot =====

// Overwrite the calling thread's slot
void SetThreadClientType(ClientType client_type);

// Copy of the calling thread's slot (nullopt if never set or cleared)
std::optional<ClientType> GetThreadClientType();

void ClearThreadClientType();

// Slot value, or kDefault when unset
AgentProfile ActiveAgentProfile();

// Sets the slot for the lifetime of the guard, then restores the previous
// value (including the unset state).
class ScopedClientType {
 public:
  explicit ScopedClientType(ClientType client_type);
  ~ScopedClientType();

  ScopedClientType(const ScopedClientType&) = delete;
  ScopedClientType& operator=(const ScopedClientType&) = delete;

 private:
  std::optional<ClientType> previous_;
};

// ===== Explicit context =====

class ClientContext {
 public:
  // Profile defaults with config overrides applied
  static ClientContext ForProfile(AgentProfile profile,
                                  const ImpersonationConfig& config = {});

  AgentProfile profile() const { return profile_; }
  const frame::StreamDependency& dependency() const { return dependency_; }
  const PseudoOrder& pseudo_order() const { return ToPseudoOrder(profile_); }

 private:
  ClientContext(AgentProfile profile, frame::StreamDependency dependency)
      : profile_(profile), dependency_(dependency) {}

  AgentProfile profile_;
  frame::StreamDependency dependency_;
};

// Resolve the context for a request header set:
//   - strips x-client-profile from headers (always)
//   - config.profile_override wins over the header value
//   - publishes the profile to the thread slot if config asks for it
ClientContext ResolveClientContext(http::headers::OrderedHeaders& headers,
                                   const ImpersonationConfig& config = {});

}  // namespace profile
}  // namespace h2mimic

#endif  // H2MIMIC_PROFILE_CLIENT_CONTEXT_H_
