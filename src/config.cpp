#include "shapeforge/config.hpp"

#include <cstdlib>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace shapeforge {

namespace {

std::mutex g_config_mu;
std::optional<HarnessConfig> g_config;

std::string env_or(const char* name, const std::string& def) {
  const char* e = std::getenv(name);
  return (e && e[0]) ? std::string(e) : def;
}

}  // namespace

HarnessConfig HarnessConfig::from_env() {
  HarnessConfig cfg;
  cfg.log_level = parse_log_level(env_or("SHAPEFORGE_LOG_LEVEL", "warn"));
  cfg.event_log_path = env_or("SHAPEFORGE_EVENT_LOG", "");
  cfg.keep_workspace = env_or("SHAPEFORGE_KEEP_WORKSPACE", "0") == "1";
  cfg.build_command = env_or("SHAPEFORGE_BUILD_COMMAND", kDefaultBuildCommand);
  cfg.workspace_root = env_or("SHAPEFORGE_WORKSPACE_ROOT", "");
  const std::string timeout = env_or("SHAPEFORGE_TIMEOUT_MS", "0");
  try {
    cfg.timeout_ms = std::stoull(timeout);
  } catch (const std::exception&) {
    cfg.timeout_ms = 0;  // malformed: unbounded
  }
  return cfg;
}

void init_harness_config(const HarnessConfig& config) {
  std::lock_guard<std::mutex> lk(g_config_mu);
  g_config = config;
}

HarnessConfig global_harness_config() {
  std::lock_guard<std::mutex> lk(g_config_mu);
  if (!g_config) g_config = HarnessConfig::from_env();
  return *g_config;
}

}  // namespace shapeforge
