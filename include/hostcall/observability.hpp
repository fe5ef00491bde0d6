#pragma once

// hostcall/observability.hpp — Request and session events, in-process stats.
//
// EVENTS:
//   RequestEvent  one per handled request (fatal requests included).
//   SessionEvent  one per process, written by the controlled exit.
//   Both serialize to a single JSON line. When a hook is installed it receives
//   the line instead of the file sink; otherwise the line is appended to the
//   configured event log (HOSTCALL_EVENT_LOG). No log configured: nothing is
//   written. Emission never fails the request that produced it.
//
// Events carry digests and metadata only; file contents and process output
// never reach the log.

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>

namespace hostcall {

struct RequestEvent {
  std::uint64_t seq{0};
  std::string kind;            // wire tag as received
  bool ok{false};
  std::string error_code;      // to_string(ErrorCode), empty when ok
  std::uint64_t duration_ns{0};
  std::size_t bytes_in{0};
  std::size_t bytes_out{0};
  std::string request_digest;  // hash_domain("req:", frame)

  std::string to_json() const;
};

struct SessionEvent {
  int exit_code{0};
  std::string reason;          // "exit", "version_mismatch", ...
  std::uint64_t requests{0};
  std::uint64_t failures{0};
  std::size_t temp_dirs_created{0};
  std::size_t temp_dirs_removed{0};
  std::string transcript_digest;
  double p50_us{0.0};
  double p99_us{0.0};

  std::string to_json() const;
};

// Power-of-two microsecond buckets: bucket i covers [2^(i-1), 2^i) us.
class LatencyHistogram {
 public:
  static constexpr std::size_t kBuckets = 32;

  void record(std::uint64_t duration_ns);
  double percentile(double p) const;
  std::uint64_t count() const { return count_; }

 private:
  std::array<std::uint64_t, kBuckets> buckets_{};
  std::uint64_t count_{0};
};

struct BridgeStats {
  std::uint64_t requests_total{0};
  std::uint64_t requests_failed{0};
  std::map<std::string, std::uint64_t> per_kind;
  LatencyHistogram latency;

  void record(const RequestEvent& ev);
};

using BridgeEventHook = void (*)(const std::string& json_line);
void set_bridge_event_hook(BridgeEventHook hook);

class EventLog {
 public:
  explicit EventLog(std::string path) : path_(std::move(path)) {}

  void emit(const RequestEvent& ev) const { write_line(ev.to_json()); }
  void emit(const SessionEvent& ev) const { write_line(ev.to_json()); }

 private:
  void write_line(const std::string& line) const;
  std::string path_;
};

struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  std::uint64_t& out_ns;
  explicit ScopeTimer(std::uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<std::uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace hostcall
