// Copyright 2026 H2Mimic Authors
// SPDX-License-Identifier: MIT

#ifndef H2MIMIC_CONFIG_H_
#define H2MIMIC_CONFIG_H_

#include <cstddef>
#include <cstdint>
#include <optional>

namespace h2mimic {

// Client to impersonate on an HTTP/2 connection
enum class AgentProfile {
  kChrome,
  kFirefox,
  kSafari,
  kEdge,
  kOkHttp,
  kDefault = kChrome,
};

// Number of AgentProfile enumerators (kDefault is an alias)
inline constexpr size_t kAgentProfileCount = 5;

// Log verbosity, lowest first
enum class LogLevel {
  kTrace,
  kDebug,
  kInfo,
  kWarn,
  kError,
  kFatal,
  kOff,
};

// Impersonation policy for a connection
struct ImpersonationConfig {
  // Force a profile regardless of the x-client-profile header.
  // The sentinel header is stripped either way.
  std::optional<AgentProfile> profile_override;

  // Override the profile's default stream dependency (nullopt = profile value)
  std::optional<uint8_t> priority_weight;
  std::optional<bool> priority_exclusive;

  // Also store the resolved profile in the calling thread's client slot.
  // Only safe when the connection stays on one thread for its lifetime.
  bool publish_thread_local = false;
};

// Logging configuration
struct LogConfig {
  LogLevel level = LogLevel::kWarn;
};

// Top-level configuration
struct Config {
  ImpersonationConfig impersonation;
  LogConfig log;

  // Chrome defaults
  static Config Default() { return {}; }
};

// Install process-wide logging settings from config
void ApplyLogConfig(const LogConfig& config);

}  // namespace h2mimic

#endif  // H2MIMIC_CONFIG_H_
