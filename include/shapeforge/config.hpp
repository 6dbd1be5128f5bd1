#pragma once

// shapeforge/config.hpp: process-wide harness configuration.
//
// Read once from the environment:
//   SHAPEFORGE_LOG_LEVEL       debug | info | warn | error (default warn)
//   SHAPEFORGE_EVENT_LOG       path of a JSONL file receiving HarnessEvents
//   SHAPEFORGE_KEEP_WORKSPACE  1 keeps generated test workspaces on disk
//   SHAPEFORGE_BUILD_COMMAND   replaces the default build/test command
//   SHAPEFORGE_TIMEOUT_MS      bound for external commands (0 = none)
//   SHAPEFORGE_WORKSPACE_ROOT  parent of generated workspaces (default: system temp dir)

#include <cstdint>
#include <string>

#include "shapeforge/log.hpp"

namespace shapeforge {

inline constexpr const char* kDefaultBuildCommand =
    "cmake -S . -B build && cmake --build build && ctest --test-dir build --output-on-failure";

struct HarnessConfig {
  LogLevel log_level{LogLevel::warn};
  std::string event_log_path;
  bool keep_workspace{false};
  std::string build_command{kDefaultBuildCommand};
  std::uint64_t timeout_ms{0};
  std::string workspace_root;

  static HarnessConfig from_env();
};

// Installs the configuration used by global_harness_config(). Later calls
// replace it; tests use this to raise the log level or keep workspaces.
void init_harness_config(const HarnessConfig& config = HarnessConfig::from_env());

// Lazily initialized from the environment on first use. Returns a snapshot,
// so a concurrent init_harness_config() never changes a config being read.
HarnessConfig global_harness_config();

}  // namespace shapeforge
