#pragma once

// hostcall/types.hpp — Error taxonomy shared by every bridge component.
//
// ERROR MODEL:
//   Components never throw across their public API. Each operation returns a
//   small result struct carrying ok/error_code/message. The dispatcher turns a
//   failed result into a structured response for the guest, except for the
//   fatal codes below, which end the session through the controlled exit.
//
// FATAL CODES (never sent to the guest):
//   version_mismatch, unrecognized_request, malformed_frame, channel_closed,
//   json_parse_error, unsupported_platform, launch_failed. invalid_payload is
//   fatal only for exit; every other handler reports it to the guest.

#include <string>

namespace hostcall {

enum class ErrorCode {
  none,
  invalid_path,
  stat_nonexistent,
  io_failure,
  process_exited,
  process_signaled,
  process_spawn_failed,
  version_mismatch,
  unrecognized_request,
  invalid_payload,
  malformed_frame,
  channel_closed,
  json_parse_error,
  unsupported_platform,
  launch_failed,
};

std::string to_string(ErrorCode code);

}  // namespace hostcall
