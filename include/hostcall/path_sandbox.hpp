#pragma once

// hostcall/path_sandbox.hpp — Path fragment resolution with containment.
//
// TRUSTED ANCHOR, CHECKED DESCENDANTS:
//   fragments[0] is the anchor. It is resolved against the working directory
//   and accepted as-is, absolute or relative: the guest picks its own root.
//   Every later fragment is resolved against the path accumulated so far and
//   must stay equal to it or below it. "sub", "a/b", "." pass; "..",
//   "../x", "/etc" and "a/../../x" fail with invalid_path.
//
// RESOLUTION IS LEXICAL:
//   "." and ".." components are collapsed and trailing separators dropped;
//   symlinks are NOT followed. A symlink inside the anchor that points
//   elsewhere is therefore reachable. Fragments normally come from names the
//   bridge itself listed, so this matches the guest's view of the tree.

#include <filesystem>
#include <string>
#include <vector>

#include "hostcall/types.hpp"

namespace hostcall {

using PathFragments = std::vector<std::string>;

struct PathResolution {
  bool ok{false};
  std::filesystem::path path;   // absolute, normalized; empty on failure
  ErrorCode error_code{ErrorCode::none};
  std::string message;          // "Empty path given" / "<f> is not a proper relative path"
};

// Resolve against the process working directory.
PathResolution resolve_path(const PathFragments& fragments);

// Resolve against an explicit base directory (must be absolute).
PathResolution resolve_path(const PathFragments& fragments, const std::filesystem::path& base);

}  // namespace hostcall
