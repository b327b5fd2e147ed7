// -----------------------------------------------------------------------------
// log.cpp: process-wide log level and sink for HopMesh.
//
// API & level policy: see include/hopmesh/log.hpp
// -----------------------------------------------------------------------------
#include "hopmesh/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace hopmesh {

namespace {

std::atomic<uint8_t> g_level{static_cast<uint8_t>(LogLevel::Info)};
std::mutex           g_sink_mutex;   // serializes sink swaps and sink calls
LogSink              g_sink;         // empty => default stderr sink

void stderr_sink(LogLevel level, const char* tag, const std::string& message) {
  std::cerr << "[" << to_string(level) << "] " << (tag ? tag : "-") << ": " << message << "\n";
}

} // namespace

const char* to_string(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Off:   return "OFF";
  }
  return "?";
}

void set_log_level(LogLevel level) {
  g_level.store(static_cast<uint8_t>(level));
}

LogLevel log_level() {
  return static_cast<LogLevel>(g_level.load());
}

void set_log_sink(LogSink sink) {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  g_sink = std::move(sink);
}

bool log_enabled(LogLevel level) {
  // Off is never "enabled" as a record level; it only works as a threshold.
  return level != LogLevel::Off && static_cast<uint8_t>(level) >= g_level.load();
}

void log_write(LogLevel level, const char* tag, const std::string& message) {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  if (g_sink) {
    g_sink(level, tag, message);
  } else {
    stderr_sink(level, tag, message);
  }
}

} // namespace hopmesh
