#pragma once

// hostcall/version.hpp — Bridge version and the guest compatibility handshake.
//
// HANDSHAKE:
//   A guest opens the session with checkVersion [major, minor]. The bridge
//   accepts it iff major == BRIDGE_MAJOR_VERSION and
//   minor <= BRIDGE_MINOR_VERSION. Anything else is fatal for the whole
//   session: the diagnostic lines are printed, the controlled exit runs and
//   the process ends with status 1.
//
// BUMP RULES:
//   BRIDGE_MINOR_VERSION — a request kind or optional payload field was added.
//   BRIDGE_MAJOR_VERSION — any existing kind changed shape or meaning.
//   PROTOCOL_FRAMING_VERSION — the NDJSON envelope itself changed
//   ({"kind","value"} requests, one JSON value per response line, the
//   {"flags": ...} launch frame).

#include <cstdint>
#include <string>
#include <vector>

namespace hostcall {
namespace version {

constexpr std::int64_t BRIDGE_MAJOR_VERSION = 5;
constexpr std::int64_t BRIDGE_MINOR_VERSION = 0;
constexpr std::uint32_t PROTOCOL_FRAMING_VERSION = 1;

struct VersionRequirement {
  std::int64_t major{0};
  std::int64_t minor{0};
};

struct RunningVersion {
  std::int64_t major{BRIDGE_MAJOR_VERSION};
  std::int64_t minor{BRIDGE_MINOR_VERSION};
};

struct VersionManifest {
  std::int64_t bridge_major{BRIDGE_MAJOR_VERSION};
  std::int64_t bridge_minor{BRIDGE_MINOR_VERSION};
  std::uint32_t protocol_framing{PROTOCOL_FRAMING_VERSION};
  std::string engine_semver;    // from the CMake project version
  std::string hash_primitive;   // "blake3"
  std::string build_timestamp;
};

VersionManifest current_manifest(const std::string& engine_semver = "");
std::string manifest_to_json(const VersionManifest& m);

// Outcome of the handshake. On failure diagnostic_lines holds the operator
// message, one entry per printed line. Never throws.
struct CompatibilityResult {
  bool ok{true};
  std::string error_code;   // "major_too_new", "major_too_old", "minor_too_new"
  std::vector<std::string> diagnostic_lines;
  VersionRequirement required;
  RunningVersion running;
};

CompatibilityResult check_compatibility(const VersionRequirement& required,
                                        const RunningVersion& running = RunningVersion{});

}  // namespace version
}  // namespace hostcall
