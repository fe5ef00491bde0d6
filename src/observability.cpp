#include "hostcall/observability.hpp"

#include <atomic>
#include <bit>
#include <cstdio>

#include "hostcall/jsonlite.hpp"

namespace hostcall {

namespace {

std::atomic<BridgeEventHook> g_event_hook{nullptr};

inline std::size_t bucket_for_us(std::uint64_t duration_us) {
  if (duration_us == 0) return 0;
  const auto b = static_cast<std::size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

std::string fixed2(double d) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f", d);
  return buf;
}

}  // namespace

std::string RequestEvent::to_json() const {
  std::string line;
  line.reserve(256);
  line += "{\"event\":\"request\",\"seq\":";
  line += std::to_string(seq);
  line += ",\"kind\":\"";
  line += jsonlite::escape(kind);
  line += "\",\"ok\":";
  line += ok ? "true" : "false";
  line += ",\"error_code\":\"";
  line += error_code;
  line += "\",\"duration_ns\":";
  line += std::to_string(duration_ns);
  line += ",\"bytes_in\":";
  line += std::to_string(bytes_in);
  line += ",\"bytes_out\":";
  line += std::to_string(bytes_out);
  line += ",\"request_digest\":\"";
  line += request_digest;
  line += "\"}";
  return line;
}

std::string SessionEvent::to_json() const {
  std::string line;
  line.reserve(320);
  line += "{\"event\":\"session_end\",\"exit_code\":";
  line += std::to_string(exit_code);
  line += ",\"reason\":\"";
  line += jsonlite::escape(reason);
  line += "\",\"requests\":";
  line += std::to_string(requests);
  line += ",\"failures\":";
  line += std::to_string(failures);
  line += ",\"temp_dirs_created\":";
  line += std::to_string(temp_dirs_created);
  line += ",\"temp_dirs_removed\":";
  line += std::to_string(temp_dirs_removed);
  line += ",\"latency_p50_us\":";
  line += fixed2(p50_us);
  line += ",\"latency_p99_us\":";
  line += fixed2(p99_us);
  line += ",\"transcript_digest\":\"";
  line += transcript_digest;
  line += "\"}";
  return line;
}

void LatencyHistogram::record(std::uint64_t duration_ns) {
  ++buckets_[bucket_for_us(duration_ns / 1000u)];
  ++count_;
}

double LatencyHistogram::percentile(double p) const {
  if (count_ == 0) return 0.0;
  const auto target = static_cast<std::uint64_t>(p * static_cast<double>(count_));
  std::uint64_t cumulative = 0;
  for (std::size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i];
    if (cumulative >= target && cumulative > 0) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

void BridgeStats::record(const RequestEvent& ev) {
  ++requests_total;
  if (!ev.ok) ++requests_failed;
  ++per_kind[ev.kind];
  latency.record(ev.duration_ns);
}

void set_bridge_event_hook(BridgeEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void EventLog::write_line(const std::string& line) const {
  if (BridgeEventHook hook = g_event_hook.load(std::memory_order_acquire)) {
    hook(line);
    return;
  }
  if (path_.empty()) return;
  // O_APPEND keeps concurrent bridges from interleaving short lines.
  if (FILE* f = std::fopen(path_.c_str(), "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fputc('\n', f);
    std::fclose(f);
  }
}

}  // namespace hostcall
