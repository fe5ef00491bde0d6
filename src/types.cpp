#include "hostcall/types.hpp"

namespace hostcall {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::invalid_path: return "invalid_path";
    case ErrorCode::stat_nonexistent: return "stat_nonexistent";
    case ErrorCode::io_failure: return "io_failure";
    case ErrorCode::process_exited: return "process_exited";
    case ErrorCode::process_signaled: return "process_signaled";
    case ErrorCode::process_spawn_failed: return "process_spawn_failed";
    case ErrorCode::version_mismatch: return "version_mismatch";
    case ErrorCode::unrecognized_request: return "unrecognized_request";
    case ErrorCode::invalid_payload: return "invalid_payload";
    case ErrorCode::malformed_frame: return "malformed_frame";
    case ErrorCode::channel_closed: return "channel_closed";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::unsupported_platform: return "unsupported_platform";
    case ErrorCode::launch_failed: return "launch_failed";
  }
  return "";
}

}  // namespace hostcall
