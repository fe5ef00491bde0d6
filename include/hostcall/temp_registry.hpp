#pragma once

// hostcall/temp_registry.hpp — Lifecycle of temporary directories.
//
// OWNERSHIP:
//   A directory belongs to the registry from create() until the session's
//   controlled exit, even if the guest deletes it earlier. cleanup_all()
//   removes every tracked path recursively and ignores failures (already
//   removed, read-only, busy). Guests that must be sure sensitive data is gone
//   call obliterateDirectory themselves and check its response.
//
// INVARIANTS:
//   - Every handle is unique for the process lifetime (mkdtemp).
//   - The tracked set only grows until cleanup_all(), which clears it.
//   - cleanup_all() is idempotent: a second call finds nothing to remove.
//
// Not thread-safe. The dispatcher is the only caller and is single-threaded.

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "hostcall/types.hpp"

namespace hostcall {

struct TempDirResult {
  bool ok{false};
  std::filesystem::path path;
  ErrorCode error_code{ErrorCode::none};
  std::string message;
};

struct CleanupReport {
  std::size_t attempted{0};
  std::size_t removed{0};   // paths that existed and were removed
};

class TemporaryDirectoryRegistry {
 public:
  explicit TemporaryDirectoryRegistry(std::filesystem::path root);

  TempDirResult create();
  CleanupReport cleanup_all();

  const std::vector<std::filesystem::path>& tracked() const { return tracked_; }
  std::size_t created_total() const { return created_total_; }
  const std::filesystem::path& root() const { return root_; }

 private:
  std::filesystem::path root_;
  std::vector<std::filesystem::path> tracked_;
  std::size_t created_total_{0};
};

}  // namespace hostcall
