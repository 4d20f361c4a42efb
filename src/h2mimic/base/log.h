// Copyright 2026 H2Mimic Authors
// SPDX-License-Identifier: MIT

// Leveled logging for the frame and impersonation layers.
//
// Usage:
//   H2MIMIC_LOG(TRACE, "decoded PRIORITY: stream={}", id.value());
//   H2MIMIC_CHECK(id.value() != 0, "stream id must be non-zero");
//
// Formatting is skipped entirely when the level is disabled.

#ifndef H2MIMIC_BASE_LOG_H_
#define H2MIMIC_BASE_LOG_H_

#include <format>
#include <functional>
#include <string_view>

#include "h2mimic/config.h"

namespace h2mimic {
namespace log {

// Receives every record at or above the current level
using Sink = std::function<void(LogLevel level, std::string_view message)>;

void SetLevel(LogLevel level);
LogLevel GetLevel();

inline bool Enabled(LogLevel level) {
  return level != LogLevel::kOff && level >= GetLevel();
}

// Replace the output sink (empty function restores stderr output).
// The sink runs without the sink lock held, so it may log or call SetSink.
void SetSink(Sink sink);

void Write(LogLevel level, std::string_view message);

// Write a FATAL record and abort the process
[[noreturn]] void Fatal(std::string_view message);

std::string_view LevelName(LogLevel level);

}  // namespace log
}  // namespace h2mimic

#define H2MIMIC_LOG_LEVEL_TRACE ::h2mimic::LogLevel::kTrace
#define H2MIMIC_LOG_LEVEL_DEBUG ::h2mimic::LogLevel::kDebug
#define H2MIMIC_LOG_LEVEL_INFO ::h2mimic::LogLevel::kInfo
#define H2MIMIC_LOG_LEVEL_WARN ::h2mimic::LogLevel::kWarn
#define H2MIMIC_LOG_LEVEL_ERROR ::h2mimic::LogLevel::kError

#define H2MIMIC_LOG(LEVEL, ...)                                      \
  do {                                                               \
    if (::h2mimic::log::Enabled(H2MIMIC_LOG_LEVEL_##LEVEL)) {        \
      ::h2mimic::log::Write(H2MIMIC_LOG_LEVEL_##LEVEL,               \
                            std::format(__VA_ARGS__));               \
    }                                                                \
  } while (0)

// Contract check that stays active in release builds
#define H2MIMIC_CHECK(COND, ...)                                        \
  do {                                                                  \
    if (!(COND)) {                                                      \
      ::h2mimic::log::Fatal(std::format("check failed: {}: {}", #COND, \
                                        std::format(__VA_ARGS__)));     \
    }                                                                   \
  } while (0)

#endif  // H2MIMIC_BASE_LOG_H_
