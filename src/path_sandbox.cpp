#include "hostcall/path_sandbox.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace hostcall {

namespace {

// lexically_normal() keeps a trailing separator ("/a/b/"); drop it so that a
// directory resolves to the same path with or without one.
fs::path normalize(const fs::path& p) {
  fs::path n = p.lexically_normal();
  while (!n.has_filename() && n.has_relative_path()) n = n.parent_path();
  return n;
}

bool escapes(const fs::path& current, const fs::path& candidate) {
  const fs::path rel = candidate.lexically_relative(current);
  if (rel.empty()) return true;  // no common root
  return *rel.begin() == "..";
}

PathResolution fail(std::string message) {
  PathResolution r;
  r.error_code = ErrorCode::invalid_path;
  r.message = std::move(message);
  return r;
}

}  // namespace

PathResolution resolve_path(const PathFragments& fragments) {
  std::error_code ec;
  const fs::path cwd = fs::current_path(ec);
  if (ec) {
    PathResolution r;
    r.error_code = ErrorCode::io_failure;
    r.message = "cannot determine working directory: " + ec.message();
    return r;
  }
  return resolve_path(fragments, cwd);
}

PathResolution resolve_path(const PathFragments& fragments, const fs::path& base) {
  if (fragments.empty()) return fail("Empty path given");

  fs::path current = normalize(base / fs::path(fragments.front()));
  for (std::size_t i = 1; i < fragments.size(); ++i) {
    const fs::path candidate = normalize(current / fs::path(fragments[i]));
    if (escapes(current, candidate)) {
      return fail(fragments[i] + " is not a proper relative path");
    }
    current = candidate;
  }

  PathResolution r;
  r.ok = true;
  r.path = std::move(current);
  return r;
}

}  // namespace hostcall
