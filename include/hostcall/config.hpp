#pragma once

// hostcall/config.hpp — Bridge configuration, read once from the environment.
//
//   HOSTCALL_EVENT_LOG   path of a JSONL event log (unset: no log)
//   HOSTCALL_TEMP_ROOT   parent directory for createTemporaryDirectory
//                        (unset: std::filesystem::temp_directory_path())
//   HOSTCALL_TRACE       "1" echoes every request/response line to stderr
//   HOSTCALL_JS_RUNNER   interpreter used for .js guest programs (default "node")

#include <filesystem>
#include <string>

namespace hostcall {

struct BridgeConfig {
  std::string event_log_path;
  std::filesystem::path temp_root;
  bool trace_frames{false};
  std::string js_runner{"node"};

  static BridgeConfig from_env();
};

}  // namespace hostcall
