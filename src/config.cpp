#include "hostcall/config.hpp"

#include <cstdlib>
#include <system_error>

namespace hostcall {

namespace {

std::string env_or(const char* name, const std::string& def) {
  const char* e = std::getenv(name);
  return (e && e[0]) ? std::string(e) : def;
}

}  // namespace

BridgeConfig BridgeConfig::from_env() {
  BridgeConfig c;
  c.event_log_path = env_or("HOSTCALL_EVENT_LOG", "");
  c.trace_frames = env_or("HOSTCALL_TRACE", "") == "1";
  c.js_runner = env_or("HOSTCALL_JS_RUNNER", "node");

  const std::string root = env_or("HOSTCALL_TEMP_ROOT", "");
  if (!root.empty()) {
    c.temp_root = root;
  } else {
    std::error_code ec;
    c.temp_root = std::filesystem::temp_directory_path(ec);
    if (ec) c.temp_root = "/tmp";
  }
  return c;
}

}  // namespace hostcall
