// Copyright 2026 H2Mimic Authors
// SPDX-License-Identifier: MIT

#include "h2mimic/base/log.h"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <print>
#include <utility>

namespace h2mimic {
namespace log {

namespace {

std::atomic<LogLevel> g_level{LogLevel::kWarn};

std::mutex g_sink_mutex;
Sink g_sink;

}  // namespace

void SetLevel(LogLevel level) {
  g_level.store(level, std::memory_order_relaxed);
}

LogLevel GetLevel() { return g_level.load(std::memory_order_relaxed); }

void SetSink(Sink sink) {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  g_sink = std::move(sink);
}

void Write(LogLevel level, std::string_view message) {
  Sink sink;
  {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    sink = g_sink;
  }
  if (sink) {
    sink(level, message);
    return;
  }
  std::println(stderr, "[h2mimic:{}] {}", LevelName(level), message);
}

void Fatal(std::string_view message) {
  Write(LogLevel::kFatal, message);
  std::fflush(stderr);
  std::abort();
}

std::string_view LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kTrace:
      return "trace";
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
    case LogLevel::kFatal:
      return "fatal";
    case LogLevel::kOff:
      return "off";
  }
  return "unknown";
}

}  // namespace log

void ApplyLogConfig(const LogConfig& config) { log::SetLevel(config.level); }

}  // namespace h2mimic
