#include "hostcall/temp_registry.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace hostcall {

TemporaryDirectoryRegistry::TemporaryDirectoryRegistry(fs::path root)
    : root_(std::move(root)) {}

TempDirResult TemporaryDirectoryRegistry::create() {
  TempDirResult r;
  std::error_code ec;
  fs::path base = fs::absolute(root_, ec);
  if (ec) {
    r.error_code = ErrorCode::io_failure;
    r.message = ec.message() + ": " + root_.string();
    return r;
  }

  std::string tmpl = (base / "hostcall-XXXXXX").string();
  if (::mkdtemp(tmpl.data()) == nullptr) {
    r.error_code = ErrorCode::io_failure;
    r.message = std::string(std::strerror(errno)) + ": " + base.string();
    return r;
  }

  r.ok = true;
  r.path = fs::path(tmpl);
  tracked_.push_back(r.path);
  ++created_total_;
  return r;
}

CleanupReport TemporaryDirectoryRegistry::cleanup_all() {
  CleanupReport report;
  for (const auto& dir : tracked_) {
    ++report.attempted;
    std::error_code ec;
    const auto n = fs::remove_all(dir, ec);
    // Failures are ignored: most likely the guest already obliterated it.
    if (!ec && n > 0) ++report.removed;
  }
  tracked_.clear();
  return report;
}

}  // namespace hostcall
