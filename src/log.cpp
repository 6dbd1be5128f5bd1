#include "shapeforge/log.hpp"

#include <atomic>
#include <cstdio>
#include <mutex>

#include "shapeforge/config.hpp"
#include "shapeforge/jsonlite.hpp"

namespace shapeforge {

namespace {
std::atomic<HarnessEventHook> g_event_hook{nullptr};
std::mutex g_log_mu;
}  // namespace

std::string to_string(LogLevel level) {
  switch (level) {
    case LogLevel::debug: return "debug";
    case LogLevel::info:  return "info";
    case LogLevel::warn:  return "warn";
    case LogLevel::error: return "error";
  }
  return "warn";
}

LogLevel parse_log_level(const std::string& name) {
  if (name == "debug") return LogLevel::debug;
  if (name == "info") return LogLevel::info;
  if (name == "error") return LogLevel::error;
  return LogLevel::warn;
}

void log(LogLevel level, const std::string& component, const std::string& message) {
  if (level < global_harness_config().log_level) return;
  std::lock_guard<std::mutex> lk(g_log_mu);
  std::fprintf(stderr, "[shapeforge:%s] %s\n", component.c_str(), message.c_str());
}

std::string to_json(const HarnessEvent& ev) {
  std::string line;
  line.reserve(256);
  line += "{\"kind\":\"";
  line += jsonlite::escape(ev.kind);
  line += "\",\"name\":\"";
  line += jsonlite::escape(ev.name);
  line += "\",\"target\":\"";
  line += ev.target;
  line += "\",\"variety\":\"";
  line += ev.variety;
  line += "\",\"ok\":";
  line += ev.ok ? "true" : "false";
  line += ",\"generate_ns\":";
  line += std::to_string(ev.generate_ns);
  line += ",\"command_ns\":";
  line += std::to_string(ev.command_ns);
  line += ",\"generated_files\":";
  line += std::to_string(ev.generated_files);
  line += ",\"error_code\":\"";
  line += ev.error_code;
  line += "\"}";
  return line;
}

void set_harness_event_hook(HarnessEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_harness_event(const HarnessEvent& ev) {
  log(ev.ok ? LogLevel::info : LogLevel::error, "event", to_json(ev));

  HarnessEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) hook(ev);

  const std::string log_path = global_harness_config().event_log_path;
  if (log_path.empty()) return;

  const std::string line = to_json(ev) + "\n";
  std::lock_guard<std::mutex> lk(g_log_mu);
  if (FILE* f = std::fopen(log_path.c_str(), "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace shapeforge
