#pragma once

// shapeforge/sandbox.hpp: scoped launch of external build/test commands.
//
// OUTPUT:
//   stdout and stderr of the child share one pipe, so ProcessResult::output
//   keeps the interleaving a developer would see in a terminal. That blob is
//   what CommandFailure carries when a generated project does not build.
//
// LIFETIME:
//   run_process blocks until the child exits. Pipe descriptors are closed on
//   every path, and a child that outlives its timeout is killed together with
//   its process group. timeout_ms == 0 means no bound.
//
// PLATFORM:
//   POSIX only (fork/execve). The harness generates and builds projects on
//   Linux and macOS hosts.

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace shapeforge {

struct ProcessSpec {
  std::string command;  // absolute path of the executable
  std::vector<std::string> argv;  // arguments after argv[0]
  std::map<std::string, std::string> env;
  bool inherit_env{true};  // start from the parent environment, then apply env
  std::string cwd;
  std::uint64_t timeout_ms{0};
  std::size_t max_output_bytes{0};  // 0 = unlimited
};

struct ProcessResult {
  int exit_code{0};
  bool timed_out{false};
  bool output_truncated{false};
  std::string output;
  std::uint64_t duration_ns{0};
};

// Throws Error(spawn_failed) when the pipe or the child cannot be created.
// A command that cannot be executed exits with 127 like a shell would.
ProcessResult run_process(const ProcessSpec& spec);

// /bin/sh -c `command` in `cwd`, with the configured timeout.
ProcessResult run_shell_command(const std::string& command, const std::string& cwd);

}  // namespace shapeforge
