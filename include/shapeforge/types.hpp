#pragma once

// shapeforge/types.hpp: error codes and the exception types shared by every module.
//
// ERROR MODEL:
//   Analysis functions (constraints.hpp) never throw for well-formed models.
//   Model lookups, fixture utilities and the harness throw shapeforge::Error
//   carrying an ErrorCode. External build failures throw CommandFailure, which
//   keeps the captured output of the failing command.
//
//   Invariant violations in fixture utilities (removing an operation that is
//   not bound, leaving a service with zero operations) are test-setup bugs.
//   They throw invariant_violation at the call site and are never caught by
//   the library.

#include <stdexcept>
#include <string>

namespace shapeforge {

enum class ErrorCode {
  none,
  json_parse_error,
  json_duplicate_key,
  invalid_shape_id,
  model_invalid,
  shape_not_found,
  invariant_violation,
  unsupported_shape,
  spawn_failed,
  command_failed,
  io_error,
};

std::string to_string(ErrorCode code);

class Error : public std::runtime_error {
 public:
  Error(ErrorCode code, const std::string& detail);

  ErrorCode code() const { return code_; }
  const std::string& detail() const { return detail_; }

 private:
  ErrorCode code_;
  std::string detail_;
};

// Thrown when an external build/test command exits non-zero.
// output() holds the combined stdout/stderr of the command.
class CommandFailure : public Error {
 public:
  CommandFailure(std::string command, int exit_code, std::string output);

  const std::string& command() const { return command_; }
  int exit_code() const { return exit_code_; }
  const std::string& output() const { return output_; }

 private:
  std::string command_;
  int exit_code_{0};
  std::string output_;
};

}  // namespace shapeforge
