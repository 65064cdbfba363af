/*
  Logging backend: a process-wide threshold plus a mutex so that lines
  written from OpenMP workers are never interleaved.
*/
#include "ensgraph/core/log.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace ensgraph::core::log {

namespace {
std::mutex& output_mutex() {
  static std::mutex m;
  return m;
}

std::atomic<int>& threshold() {
  static std::atomic<int> t{[] {
    const char* env = std::getenv("ENSGRAPH_LOG_LEVEL");
    return static_cast<int>(env ? parse_level(env) : Level::Warn);
  }()};
  return t;
}

const char* level_tag(Level level) noexcept {
  switch (level) {
    case Level::Trace: return "TRACE";
    case Level::Debug: return "DEBUG";
    case Level::Info:  return "INFO";
    case Level::Warn:  return "WARN";
    case Level::Error: return "ERROR";
    case Level::Quiet: return "QUIET";
  }
  return "?";
}
} // namespace

void set_level(Level level) noexcept {
  threshold().store(static_cast<int>(level), std::memory_order_relaxed);
}

Level level() noexcept {
  return static_cast<Level>(threshold().load(std::memory_order_relaxed));
}

bool enabled(Level lvl) noexcept {
  return lvl != Level::Quiet && static_cast<int>(lvl) >= threshold().load(std::memory_order_relaxed);
}

Level parse_level(std::string_view name) noexcept {
  if (name == "trace") return Level::Trace;
  if (name == "debug") return Level::Debug;
  if (name == "info") return Level::Info;
  if (name == "warn") return Level::Warn;
  if (name == "error") return Level::Error;
  if (name == "quiet") return Level::Quiet;
  return Level::Warn;
}

void write(Level lvl, const char* location, const std::string& message) {
  std::lock_guard<std::mutex> lock(output_mutex());
  std::clog << "[" << level_tag(lvl) << "] " << location << ": " << message << '\n';
}

} // namespace ensgraph::core::log
