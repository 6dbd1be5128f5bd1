#pragma once

// shapeforge/log.hpp: diagnostic lines and harness events.
//
// Lines go to stderr as "[shapeforge:<component>] <message>" and are filtered
// by the level in global_harness_config() (SHAPEFORGE_LOG_LEVEL).
//
// HarnessEvent is the observable unit of one harness run (an event-stream test
// case or an integration test). When SHAPEFORGE_EVENT_LOG names a file, each
// event is appended to it as one JSON line.

#include <chrono>
#include <cstdint>
#include <string>

namespace shapeforge {

enum class LogLevel { debug, info, warn, error };

std::string to_string(LogLevel level);
// Unknown names map to warn.
LogLevel parse_log_level(const std::string& name);

void log(LogLevel level, const std::string& component, const std::string& message);

inline void log_debug(const std::string& component, const std::string& message) {
  log(LogLevel::debug, component, message);
}
inline void log_info(const std::string& component, const std::string& message) {
  log(LogLevel::info, component, message);
}
inline void log_warn(const std::string& component, const std::string& message) {
  log(LogLevel::warn, component, message);
}

struct HarnessEvent {
  std::string kind;            // "event_stream" or "integration"
  std::string name;            // test case / protocol id, or output dir
  std::string target;          // "client" / "server", empty for integration runs
  std::string variety;         // "marshall" / "unmarshall", empty for integration runs
  std::uint64_t generate_ns{0};
  std::uint64_t command_ns{0};
  std::size_t generated_files{0};
  bool ok{false};
  std::string error_code;
};

std::string to_json(const HarnessEvent& ev);

// Appends to the JSONL event log if configured. Never throws.
void emit_harness_event(const HarnessEvent& ev);

using HarnessEventHook = void (*)(const HarnessEvent&);
// Tests use the hook to observe events without touching the file system.
void set_harness_event_hook(HarnessEventHook hook);

struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  std::uint64_t& out_ns;
  explicit ScopeTimer(std::uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<std::uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace shapeforge
