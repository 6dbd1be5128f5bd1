#include "shapeforge/types.hpp"

#include <utility>

namespace shapeforge {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::json_duplicate_key: return "json_duplicate_key";
    case ErrorCode::invalid_shape_id: return "invalid_shape_id";
    case ErrorCode::model_invalid: return "model_invalid";
    case ErrorCode::shape_not_found: return "shape_not_found";
    case ErrorCode::invariant_violation: return "invariant_violation";
    case ErrorCode::unsupported_shape: return "unsupported_shape";
    case ErrorCode::spawn_failed: return "spawn_failed";
    case ErrorCode::command_failed: return "command_failed";
    case ErrorCode::io_error: return "io_error";
  }
  return "";
}

Error::Error(ErrorCode code, const std::string& detail)
    : std::runtime_error(to_string(code) + ": " + detail), code_(code), detail_(detail) {}

CommandFailure::CommandFailure(std::string command, int exit_code, std::string output)
    : Error(ErrorCode::command_failed,
            "`" + command + "` exited with " + std::to_string(exit_code) + "\n" + output),
      command_(std::move(command)),
      exit_code_(exit_code),
      output_(std::move(output)) {}

}  // namespace shapeforge
