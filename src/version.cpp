#include "hostcall/version.hpp"

#include <sstream>

#include "hostcall/jsonlite.hpp"

namespace hostcall {
namespace version {

namespace {

std::string describe_running(const RunningVersion& running) {
  return " (current hostcall version: " + std::to_string(running.major) + "." +
         std::to_string(running.minor) + ")";
}

}  // namespace

VersionManifest current_manifest(const std::string& engine_semver) {
  VersionManifest m;
  m.engine_semver   = engine_semver.empty() ? "5.0.0" : engine_semver;
  m.hash_primitive  = "blake3";
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"bridge_major\":" << m.bridge_major
    << ",\"bridge_minor\":" << m.bridge_minor
    << ",\"protocol_framing\":" << m.protocol_framing
    << ",\"engine_semver\":\"" << jsonlite::escape(m.engine_semver) << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

CompatibilityResult check_compatibility(const VersionRequirement& required,
                                        const RunningVersion& running) {
  CompatibilityResult r;
  r.required = required;
  r.running = running;

  if (required.major != running.major) {
    r.ok = false;
    r.diagnostic_lines.push_back("Version mismatch: script requires hostcall major version " +
                                 std::to_string(required.major) + describe_running(running));
    if (required.major > running.major) {
      r.error_code = "major_too_new";
      r.diagnostic_lines.push_back("Please update to a newer version of hostcall");
    } else {
      r.error_code = "major_too_old";
      r.diagnostic_lines.push_back(
          "Please update script to use a newer version of the hostcall guest package");
    }
    return r;
  }

  if (required.minor > running.minor) {
    r.ok = false;
    r.error_code = "minor_too_new";
    r.diagnostic_lines.push_back("Version mismatch: script requires hostcall version at least " +
                                 std::to_string(required.major) + "." +
                                 std::to_string(required.minor) + describe_running(running));
    r.diagnostic_lines.push_back("Please update to a newer version of hostcall");
  }
  return r;
}

}  // namespace version
}  // namespace hostcall
