#include "hostcall/context.hpp"

#include <ostream>
#include <utility>

namespace hostcall {

ExecutionContext::ExecutionContext(BridgeConfig config, std::ostream& out)
    : config_(std::move(config)),
      out_(out),
      registry_(config_.temp_root),
      event_log_(config_.event_log_path) {}

void ExecutionContext::diagnostic(const std::string& line) {
  out_ << line << "\n";
  out_.flush();
}

int ExecutionContext::controlled_exit(int status, const std::string& reason) {
  if (exit_status_) return *exit_status_;
  exit_status_ = status;

  const std::size_t created = registry_.created_total();
  const CleanupReport cleanup = registry_.cleanup_all();
  out_.flush();

  SessionEvent ev;
  ev.exit_code = status;
  ev.reason = reason;
  ev.requests = stats_.requests_total;
  ev.failures = stats_.requests_failed;
  ev.temp_dirs_created = created;
  ev.temp_dirs_removed = cleanup.removed;
  ev.transcript_digest = transcript_.hex_digest();
  ev.p50_us = stats_.latency.percentile(0.50);
  ev.p99_us = stats_.latency.percentile(0.99);
  event_log_.emit(ev);

  return status;
}

}  // namespace hostcall
